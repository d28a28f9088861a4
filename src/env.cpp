#include "shroud/env.hpp"
#include <cstdlib>
#include <string>

namespace shroud {

// Reads process env vars. Unparseable values are ignored with a warning.
Env detect_env(){
    Env e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if(const char* v = get("SHROUD_LOG")){
        e.log_level = log::parse_level(v);
        if(!e.log_level) log::warn("env", std::string("ignoring SHROUD_LOG=") + v);
    }

    if(const char* v = get("SHROUD_VERIFY")) e.verify = (std::string(v) == "1");

    if(const char* v = get("SHROUD_SEED")){
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if(end && *end == '\0') e.seed = static_cast<std::uint32_t>(n);
        else log::warn("env", std::string("ignoring SHROUD_SEED=") + v);
    }
    return e;
}

} // namespace shroud

#pragma once
#include "shroud/log.hpp"
#include <cstdint>
#include <optional>

namespace shroud {

// Process-level switches read from SHROUD_* environment variables.
// CLI flags override these; see tools/shroud.cpp.
struct Env {
    std::optional<log::Level> log_level; // SHROUD_LOG=error|warn|info|debug
    bool verify{false};                  // SHROUD_VERIFY=1: check scope invariants after every step
    std::optional<std::uint32_t> seed;   // SHROUD_SEED=<n>: deterministic randomness
};

Env detect_env();

} // namespace shroud

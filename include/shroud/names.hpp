#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shroud {

// Maps a per-scope counter to a surface name. Must be injective over `index`.
class NameGenerator {
public:
    virtual ~NameGenerator() = default;
    virtual std::string generate(std::size_t index) = 0;
    virtual const char* name() const = 0;
};

// "mangled" | "mangled_shuffled" | "il" | "number". Unknown kinds are a config_error.
std::unique_ptr<NameGenerator> make_name_generator(std::string_view kind, std::uint32_t seed);
const std::vector<std::string>& name_generator_kinds();

// Lua reserved words; never produced as identifiers.
const std::vector<std::string>& lua_keywords();
bool is_lua_keyword(std::string_view word);
// True for [A-Za-z_][A-Za-z0-9_]* that is not a keyword.
bool is_lua_identifier(std::string_view word);

} // namespace shroud

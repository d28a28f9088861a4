#pragma once
#include "shroud/frontend.hpp"

namespace shroud::lua {

// PEGTL-based Lua 5.1 / Luau parser. Resolves every name against the scope chain while building,
// so the returned tree already satisfies the binding and ledger invariants.
class Parser : public SourceParser {
public:
    NodePtr parse(std::string_view source, const ParseOptions& options) override;
};

} // namespace shroud::lua

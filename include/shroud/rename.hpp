#pragma once
#include "shroud/ast.hpp"
#include "shroud/names.hpp"

namespace shroud {

struct RenameStats {
    std::size_t scopes{0};
    std::size_t symbols{0};
};

// Gives every local a fresh generated name. Each scope avoids Lua keywords and the current names
// of all higher-scope symbols its subtree references (from the ledger); parents are renamed
// before children, so those names are final. Globals keep their names.
RenameStats rename_variables(Node& top, NameGenerator& names);
RenameStats rename_variables(Scope& global, NameGenerator& names);

} // namespace shroud

#include "shroud/rename.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include <unordered_set>

namespace shroud {

namespace {

void rename_scope(Scope& s, NameGenerator& names, RenameStats& stats){
    if(!s.is_global()){
        std::unordered_set<std::string> forbidden(lua_keywords().begin(), lua_keywords().end());
        for(auto& [owner, ids] : s.higher_references()){
            for(auto& [id, count] : ids){
                if(count > 0) forbidden.insert(owner->variable_name(id));
            }
        }
        std::size_t i = 0;
        for(SymbolId id : s.variables()){
            std::string name;
            do { name = names.generate(i++); } while(forbidden.count(name));
            s.rename_variable(id, std::move(name));
            ++stats.symbols;
        }
        ++stats.scopes;
    }
    // copy: renaming never reshapes the tree, but keep iteration independent of it
    std::vector<Scope*> children = s.children();
    for(Scope* c : children) rename_scope(*c, names, stats);
}

} // namespace

RenameStats rename_variables(Scope& global, NameGenerator& names){
    RenameStats stats;
    rename_scope(global, names, stats);
    log::debug("rename", std::string(names.name()) + ": " + std::to_string(stats.symbols) + " symbol(s) in " + std::to_string(stats.scopes) + " scope(s)");
    return stats;
}

RenameStats rename_variables(Node& top, NameGenerator& names){
    if(top.kind != Kind::Top) throw shape_error("rename_variables expects a Top node");
    return rename_variables(*top.as<payload::Top>().globals, names);
}

} // namespace shroud

#pragma once
#include "shroud/ast.hpp"
#include "shroud/errors.hpp"
#include <map>
#include <string>

namespace shroud::steps_detail {

inline Node& chunk_block(NodePtr& root){
    if(!root || root->kind != Kind::Top) throw shape_error("steps operate on a Top node");
    return *root->as<payload::Top>().body;
}

inline Scope* chunk_scope(NodePtr& root){ return chunk_block(root).as<payload::Block>().scope.get(); }

// Replaces every `@KEY@` in a fragment template.
inline std::string fill(std::string text, const std::map<std::string, std::string>& values){
    for(auto& [key, value] : values){
        std::string marker = "@" + key + "@";
        for(std::size_t at = text.find(marker); at != std::string::npos; at = text.find(marker, at + value.size()))
            text.replace(at, marker.size(), value);
    }
    return text;
}

} // namespace shroud::steps_detail

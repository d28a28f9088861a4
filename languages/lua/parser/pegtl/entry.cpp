#include "shroud_lua/parser.hpp"
#include "../builder.hpp"
#include "grammar.hpp"
#include "selector.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include <cctype>
#include <tao/pegtl.hpp>

namespace shroud::lua {
using namespace shroud::lua::pegtl_front;

namespace {

// Lua-style "near 'token'" message for the byte where matching stopped.
std::string near_message(std::string_view src, std::size_t byte){
    if(byte >= src.size()) return "unexpected end of input";
    std::size_t end = byte;
    auto word = [](char c){ return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };
    if(word(src[end])) while(end < src.size() && word(src[end])) ++end;
    else ++end;
    return "unexpected symbol near '" + std::string(src.substr(byte, end - byte)) + "'";
}

} // namespace

NodePtr Parser::parse(std::string_view source, const ParseOptions& options){
    tao::pegtl::memory_input in(source.data(), source.size(), options.source_name);
    std::unique_ptr<pt_node> root;
    try {
        root = tao::pegtl::parse_tree::parse< grammar::chunk, selector >(in);
    } catch(const tao::pegtl::parse_error& e){
        const auto& p = e.positions().front();
        throw syntax_error(near_message(source, p.byte), static_cast<int>(p.line), static_cast<int>(p.column));
    }
    if(!root) throw syntax_error(near_message(source, 0), 1, 1);
    Builder b(options);
    NodePtr top = b.build_chunk(*root);
    log::debug("parse", options.source_name + ": " + std::to_string(top->as<payload::Top>().body->as<payload::Block>().statements.size())
        + " top-level statement(s), dialect " + dialect_name(options.dialect));
    return top;
}

} // namespace shroud::lua

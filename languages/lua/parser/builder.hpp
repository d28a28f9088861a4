#pragma once
#include "pegtl/selector.hpp"
#include "shroud/ast.hpp"
#include "shroud/frontend.hpp"
#include <string>
#include <vector>

namespace shroud::lua::pegtl_front {

using pt_node = tao::pegtl::parse_tree::node;

// Lowers the PEGTL parse tree into the shroud AST. Owns the scope stack while building: every name is
// resolved when it is seen (Lua scoping rules) and every reference is recorded in the ledger.
class Builder {
public:
    explicit Builder(const ParseOptions& options) : options_(options) {}

    NodePtr build_chunk(const pt_node& root);

private:
    [[noreturn]] void fail(const pt_node& n, const std::string& msg) const;
    void require_luau(const pt_node& n, const char* what) const;

    NodeList statements(const pt_node& block);
    NodePtr scoped_block(const pt_node& block, std::unique_ptr<Scope> scope, bool function_block);
    NodePtr plain_block(const pt_node& block);
    NodePtr statement(const pt_node& n);
    NodePtr local(const pt_node& n);
    NodePtr function_statement(const pt_node& n);
    NodePtr assignment(const pt_node& n);
    NodePtr surplus_assignment(const pt_node& n);
    NodePtr compound(const pt_node& n);
    NodePtr numeric_for(const pt_node& n);
    NodePtr generic_for(const pt_node& n);
    NodePtr if_chain(const pt_node& n);
    NodePtr repeat_loop(const pt_node& n);

    NodePtr expr(const pt_node& n);
    NodeList exprs(const pt_node& n, std::size_t first, std::size_t last);
    NodePtr name_ref(const pt_node& n);
    NodePtr function(const pt_node& params, const pt_node& body, bool method);
    NodePtr table(const pt_node& n);
    NodePtr suffixed(const pt_node& n);
    NodePtr left_fold(const pt_node& n);
    NodePtr concat(const pt_node& n);
    NodePtr unary(const pt_node& n);
    NodeList call_args(const pt_node& n);
    NodePtr target(const pt_node& n);

    double number(const pt_node& n) const;
    std::string string(const pt_node& n) const;
    Binding resolve(const std::string& name);

    const ParseOptions& options_;
    Scope* scope_{nullptr};
    std::vector<bool> vararg_;
};

} // namespace shroud::lua::pegtl_front

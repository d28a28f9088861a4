#include "builder.hpp"
#include "shroud/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace shroud::lua::pegtl_front {

namespace g = grammar;

namespace {

int line_of(const pt_node& n){ return static_cast<int>(n.begin().line); }

Kind binary_kind(const std::string& op){
    if(op == "or") return Kind::Or;
    if(op == "and") return Kind::And;
    if(op == "<") return Kind::Less;
    if(op == ">") return Kind::Greater;
    if(op == "<=") return Kind::LessEqual;
    if(op == ">=") return Kind::GreaterEqual;
    if(op == "~=") return Kind::NotEqual;
    if(op == "==") return Kind::Equal;
    if(op == "..") return Kind::Concat;
    if(op == "+") return Kind::Add;
    if(op == "-") return Kind::Sub;
    if(op == "*") return Kind::Mul;
    if(op == "/") return Kind::Div;
    if(op == "%") return Kind::Mod;
    if(op == "^") return Kind::Pow;
    throw shape_error("unknown binary operator '" + op + "'");
}

Kind compound_kind(const std::string& op){
    if(op == "+=") return Kind::CompoundAdd;
    if(op == "-=") return Kind::CompoundSub;
    if(op == "*=") return Kind::CompoundMul;
    if(op == "/=") return Kind::CompoundDiv;
    if(op == "%=") return Kind::CompoundMod;
    if(op == "^=") return Kind::CompoundPow;
    return Kind::CompoundConcat;
}

void append_utf8(std::string& out, unsigned long cp){
    if(cp < 0x80) out += static_cast<char>(cp);
    else if(cp < 0x800){
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if(cp < 0x10000){
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

void Builder::fail(const pt_node& n, const std::string& msg) const {
    auto p = n.begin();
    throw syntax_error(msg, static_cast<int>(p.line), static_cast<int>(p.column));
}

void Builder::require_luau(const pt_node& n, const char* what) const {
    if(options_.dialect != Dialect::LuaU) fail(n, std::string(what) + " requires the luau dialect");
}

NodePtr Builder::build_chunk(const pt_node& root){
    auto globals = Scope::make_global(options_.counter ? options_.counter : std::make_shared<SymbolCounter>());
    auto body_scope = std::make_unique<Scope>(globals.get());
    const pt_node* blk = nullptr;
    for(auto& c : root.children) if(c->is_type<g::block>()) blk = c.get();
    if(!blk) throw syntax_error("empty parse tree", 1, 1);
    vararg_.push_back(true);
    NodePtr body = scoped_block(*blk, std::move(body_scope), true);
    vararg_.pop_back();
    return ast::top(std::move(globals), std::move(body));
}

NodeList Builder::statements(const pt_node& block){
    NodeList out;
    for(auto& c : block.children){
        NodePtr s = statement(*c);
        s->line = line_of(*c);
        out.push_back(std::move(s));
    }
    return out;
}

NodePtr Builder::scoped_block(const pt_node& block, std::unique_ptr<Scope> scope, bool function_block){
    Scope* saved = scope_;
    scope_ = scope.get();
    NodeList body = statements(block);
    scope_ = saved;
    return ast::block(std::move(scope), std::move(body), function_block);
}

NodePtr Builder::plain_block(const pt_node& block){
    return scoped_block(block, std::make_unique<Scope>(scope_), false);
}

NodePtr Builder::statement(const pt_node& n){
    const auto& c = n.children;
    if(n.is_type<g::stat_local>()) return local(n);
    if(n.is_type<g::stat_local_function>()){
        // declared before the body so the function can call itself
        SymbolId id = scope_->add_variable(c[0]->string());
        return ast::local_function({scope_, id}, function(*c[1], *c[2], false));
    }
    if(n.is_type<g::stat_function>()) return function_statement(n);
    if(n.is_type<g::stat_return>()) return ast::return_stat(exprs(n, 0, c.size()));
    if(n.is_type<g::stat_break>()) return ast::break_stat();
    if(n.is_type<g::stat_continue>()){
        require_luau(n, "'continue'");
        return ast::continue_stat();
    }
    if(n.is_type<g::stat_do>()) return ast::do_block(plain_block(*c[0]));
    if(n.is_type<g::stat_while>()){
        NodePtr cond = expr(*c[0]);
        return ast::while_loop(std::move(cond), plain_block(*c[1]));
    }
    if(n.is_type<g::stat_repeat>()) return repeat_loop(n);
    if(n.is_type<g::stat_if>()) return if_chain(n);
    if(n.is_type<g::stat_for_num>()) return numeric_for(n);
    if(n.is_type<g::stat_for_in>()) return generic_for(n);
    if(n.is_type<g::stat_assign>()) return assignment(n);
    if(n.is_type<g::stat_compound>()) return compound(n);
    if(n.is_type<g::stat_call>()){
        NodePtr e = expr(*c[0]);
        if(!ast::is_multi_value(*e) || e->kind == Kind::Vararg) fail(n, "syntax error: expression statement is not a call");
        return ast::call_statement(std::move(e));
    }
    fail(n, "unexpected statement");
}

NodePtr Builder::local(const pt_node& n){
    const auto& names = *n.children[0];
    // initializers see the enclosing bindings, not the new ones
    NodeList values = exprs(n, 1, n.children.size());
    std::vector<SymbolId> ids;
    for(auto& nm : names.children) ids.push_back(scope_->add_variable(nm->string()));
    return ast::local(scope_, std::move(ids), std::move(values));
}

NodePtr Builder::function_statement(const pt_node& n){
    const auto& c = n.children;
    const auto& path = *c[0];
    std::size_t i = 1;
    std::string method;
    if(c[i]->is_type<g::func_method>()){ method = c[i]->children[0]->string(); ++i; }
    Binding target = resolve(path.children[0]->string());
    scope_->reference(target);
    std::vector<std::string> fields;
    for(std::size_t k = 1; k < path.children.size(); ++k) fields.push_back(path.children[k]->string());
    NodePtr fn = function(*c[i], *c[i + 1], !method.empty());
    return ast::function_declaration(target, std::move(fields), std::move(method), std::move(fn));
}

NodePtr Builder::target(const pt_node& n){
    NodePtr e = expr(n);
    if(e->kind != Kind::Variable && e->kind != Kind::Index) fail(n, "syntax error: cannot assign to this expression");
    return ast::to_target(std::move(e));
}

NodePtr Builder::assignment(const pt_node& n){
    std::size_t target_count = n.children[0]->children.size();
    std::size_t value_count = n.children.size() - 1;
    if(value_count > target_count) return surplus_assignment(n);
    NodeList targets;
    for(auto& t : n.children[0]->children) targets.push_back(target(*t));
    NodeList values = exprs(n, 1, n.children.size());
    if(values.size() < targets.size() && !ast::is_multi_value(*values.back())){
        while(values.size() < targets.size()) values.push_back(ast::nil());
    }
    return ast::assignment(std::move(targets), std::move(values));
}

// `a = f(), g()` becomes `do local s; a, s = f(), g() end`: every value is still evaluated and the
// surplus ones land in fresh locals of the wrapping block.
NodePtr Builder::surplus_assignment(const pt_node& n){
    auto sink_scope = std::make_unique<Scope>(scope_);
    Scope* saved = scope_;
    scope_ = sink_scope.get();
    std::vector<SymbolId> sinks;
    for(std::size_t i = n.children[0]->children.size(); i + 1 < n.children.size(); ++i) sinks.push_back(scope_->add_variable());
    NodeList targets;
    for(auto& t : n.children[0]->children) targets.push_back(target(*t));
    for(SymbolId id : sinks){
        Binding b{scope_, id};
        scope_->reference(b);
        targets.push_back(ast::assign_variable(b));
    }
    NodeList values = exprs(n, 1, n.children.size());
    scope_ = saved;
    Scope* sink = sink_scope.get();
    NodeList body = ast::list(ast::local(sink, sinks, {}), ast::assignment(std::move(targets), std::move(values)));
    return ast::do_block(ast::block(std::move(sink_scope), std::move(body)));
}

NodePtr Builder::compound(const pt_node& n){
    require_luau(n, "compound assignment");
    NodePtr t = target(*n.children[0]);
    Kind k = compound_kind(n.children[1]->string());
    NodePtr v = expr(*n.children[2]);
    return ast::compound(k, std::move(t), std::move(v));
}

NodePtr Builder::numeric_for(const pt_node& n){
    const auto& c = n.children;
    NodePtr start = expr(*c[1]);
    NodePtr limit = expr(*c[2]);
    NodePtr step = c.size() == 5 ? expr(*c[3]) : nullptr;
    auto body_scope = std::make_unique<Scope>(scope_);
    Binding var{body_scope.get(), body_scope->add_variable(c[0]->string())};
    NodePtr body = scoped_block(*c.back(), std::move(body_scope), false);
    return ast::numeric_for(var, std::move(start), std::move(limit), std::move(step), std::move(body));
}

NodePtr Builder::generic_for(const pt_node& n){
    const auto& c = n.children;
    NodeList iter = exprs(n, 1, c.size() - 1);
    auto body_scope = std::make_unique<Scope>(scope_);
    Scope* s = body_scope.get();
    std::vector<SymbolId> ids;
    for(auto& nm : c[0]->children) ids.push_back(s->add_variable(nm->string()));
    NodePtr body = scoped_block(*c.back(), std::move(body_scope), false);
    return ast::generic_for(s, std::move(ids), std::move(iter), std::move(body));
}

NodePtr Builder::if_chain(const pt_node& n){
    const auto& c = n.children;
    NodeList conds, blocks;
    std::size_t i = 0;
    for(; i + 1 < c.size(); i += 2){
        conds.push_back(expr(*c[i]));
        blocks.push_back(plain_block(*c[i + 1]));
    }
    NodePtr otherwise = i < c.size() ? plain_block(*c[i]) : nullptr;
    return ast::if_chain(std::move(conds), std::move(blocks), std::move(otherwise));
}

NodePtr Builder::repeat_loop(const pt_node& n){
    auto body_scope = std::make_unique<Scope>(scope_);
    Scope* saved = scope_;
    scope_ = body_scope.get();
    NodeList body = statements(*n.children[0]);
    // `until` is resolved inside the loop body
    NodePtr cond = expr(*n.children[1]);
    scope_ = saved;
    return ast::repeat_loop(ast::block(std::move(body_scope), std::move(body)), std::move(cond));
}

Binding Builder::resolve(const std::string& name){
    if(auto b = scope_->resolve(name)) return *b;
    return scope_->resolve_global(name);
}

NodePtr Builder::name_ref(const pt_node& n){
    Binding b = resolve(n.string());
    scope_->reference(b);
    NodePtr v = ast::variable(b);
    v->line = line_of(n);
    return v;
}

NodeList Builder::exprs(const pt_node& n, std::size_t first, std::size_t last){
    NodeList out;
    for(std::size_t i = first; i < last; ++i) out.push_back(expr(*n.children[i]));
    return out;
}

NodePtr Builder::expr(const pt_node& n){
    if(n.is_type<g::name>()) return name_ref(n);
    if(n.is_type<g::numeral>()) return ast::number(number(n));
    if(n.is_type<g::literal_string>()) return ast::string(string(n));
    if(n.is_type<g::key_nil>()) return ast::nil();
    if(n.is_type<g::key_true>()) return ast::boolean(true);
    if(n.is_type<g::key_false>()) return ast::boolean(false);
    if(n.is_type<g::vararg>()){
        if(vararg_.empty() || !vararg_.back()) fail(n, "cannot use '...' outside a vararg function");
        return ast::vararg();
    }
    if(n.is_type<g::function_literal>()) return function(*n.children[0], *n.children[1], false);
    if(n.is_type<g::table_constructor>()) return table(n);
    if(n.is_type<g::paren_expr>()){
        NodePtr inner = expr(*n.children[0]);
        // parentheses only matter when they truncate a multi-value expression
        return ast::is_multi_value(*inner) ? ast::paren(std::move(inner)) : std::move(inner);
    }
    if(n.is_type<g::suffixed_expr>()) return suffixed(n);
    if(n.is_type<g::expr_concat>()) return concat(n);
    if(n.is_type<g::expr_unary>()) return unary(n);
    if(n.is_type<g::expr_pow>()){
        NodePtr base = expr(*n.children[0]);
        return ast::binary(Kind::Pow, std::move(base), expr(*n.children[2]));
    }
    if(n.is_type<g::expr_or>() || n.is_type<g::expr_and>() || n.is_type<g::expr_cmp>()
       || n.is_type<g::expr_add>() || n.is_type<g::expr_mul>()) return left_fold(n);
    fail(n, "unexpected expression");
}

NodePtr Builder::left_fold(const pt_node& n){
    const auto& c = n.children;
    NodePtr acc = expr(*c[0]);
    for(std::size_t i = 1; i + 1 < c.size(); i += 2){
        Kind k = binary_kind(c[i]->string());
        acc = ast::binary(k, std::move(acc), expr(*c[i + 1]));
    }
    return acc;
}

NodePtr Builder::concat(const pt_node& n){
    const auto& c = n.children;
    NodeList operands;
    for(std::size_t i = 0; i < c.size(); i += 2) operands.push_back(expr(*c[i]));
    NodePtr acc = std::move(operands.back());
    for(std::size_t i = operands.size() - 1; i-- > 0;) acc = ast::binary(Kind::Concat, std::move(operands[i]), std::move(acc));
    return acc;
}

NodePtr Builder::unary(const pt_node& n){
    const auto& c = n.children;
    NodePtr acc = expr(*c.back());
    for(std::size_t i = c.size() - 1; i-- > 0;){
        Kind k = c[i]->is_type<g::op_not>() ? Kind::Not : c[i]->is_type<g::op_len>() ? Kind::Length : Kind::Negate;
        acc = ast::unary(k, std::move(acc));
    }
    return acc;
}

NodePtr Builder::suffixed(const pt_node& n){
    const auto& c = n.children;
    NodePtr acc = expr(*c[0]);
    for(std::size_t i = 1; i < c.size(); ++i){
        const pt_node& s = *c[i];
        if(s.is_type<g::field_suffix>()) acc = ast::index(std::move(acc), ast::string(s.children[0]->string()));
        else if(s.is_type<g::index_suffix>()) acc = ast::index(std::move(acc), expr(*s.children[0]));
        else if(s.is_type<g::method_suffix>()) acc = ast::method_call(std::move(acc), s.children[0]->string(), call_args(*s.children[1]));
        else if(s.is_type<g::call_suffix>()) acc = ast::call(std::move(acc), call_args(*s.children[0]));
        else fail(s, "unexpected suffix");
        acc->line = line_of(s);
    }
    return acc;
}

NodeList Builder::call_args(const pt_node& n){ return exprs(n, 0, n.children.size()); }

NodePtr Builder::function(const pt_node& params, const pt_node& body, bool method){
    auto body_scope = std::make_unique<Scope>(scope_);
    Scope* s = body_scope.get();
    NodeList ps;
    bool vararg = false;
    if(method) ps.push_back(ast::parameter({s, s->add_variable("self")}));
    for(auto& p : params.children){
        if(p->is_type<g::vararg>()) vararg = true;
        else ps.push_back(ast::parameter({s, s->add_variable(p->string())}));
    }
    vararg_.push_back(vararg);
    NodePtr blk = scoped_block(body, std::move(body_scope), true);
    vararg_.pop_back();
    return ast::function(std::move(ps), vararg, std::move(blk));
}

NodePtr Builder::table(const pt_node& n){
    NodeList entries;
    for(auto& f : n.children){
        if(f->is_type<g::field_bracket>()){
            NodePtr k = expr(*f->children[0]);
            entries.push_back(ast::keyed_entry(std::move(k), expr(*f->children[1])));
        } else if(f->is_type<g::field_named>()){
            entries.push_back(ast::keyed_entry(ast::string(f->children[0]->string()), expr(*f->children[1])));
        } else {
            entries.push_back(ast::entry(expr(*f->children[0])));
        }
    }
    return ast::table(std::move(entries));
}

double Builder::number(const pt_node& n) const {
    std::string text = n.string();
    bool binary = text.size() > 1 && text[0] == '0' && (text[1] == 'b' || text[1] == 'B');
    if(binary || text.find('_') != std::string::npos) require_luau(n, "binary literals and digit separators");
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
    if(binary){
        double v = 0;
        for(std::size_t i = 2; i < text.size(); ++i) v = v * 2 + (text[i] - '0');
        return v;
    }
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if(end != text.c_str() + text.size()) fail(n, "malformed number near '" + n.string() + "'");
    return v;
}

std::string Builder::string(const pt_node& n) const {
    std::string_view s = n.string_view();
    if(s.front() == '['){
        std::size_t level = 1;
        while(s[level] == '=') ++level;
        std::string_view body = s.substr(level + 1, s.size() - 2 * (level + 1));
        // a newline right after the opening bracket is skipped
        if(!body.empty() && (body[0] == '\n' || body[0] == '\r')){
            char first = body[0];
            body.remove_prefix(1);
            if(!body.empty() && (body[0] == '\n' || body[0] == '\r') && body[0] != first) body.remove_prefix(1);
        }
        return std::string(body);
    }
    std::string_view body = s.substr(1, s.size() - 2);
    std::string out;
    for(std::size_t i = 0; i < body.size(); ++i){
        char c = body[i];
        if(c != '\\'){ out += c; continue; }
        char e = body[++i];
        switch(e){
        case 'a': out += '\a'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'v': out += '\v'; break;
        case '\\': case '"': case '\'': out += e; break;
        case '\n':
            out += '\n';
            if(i + 1 < body.size() && body[i + 1] == '\r') ++i;
            break;
        case '\r':
            out += '\n';
            if(i + 1 < body.size() && body[i + 1] == '\n') ++i;
            break;
        case 'x': {
            require_luau(n, "'\\x' escapes");
            out += static_cast<char>(std::strtoul(std::string(body.substr(i + 1, 2)).c_str(), nullptr, 16));
            i += 2;
            break;
        }
        case 'z': {
            require_luau(n, "'\\z' escapes");
            while(i + 1 < body.size() && std::isspace(static_cast<unsigned char>(body[i + 1]))) ++i;
            break;
        }
        case 'u': {
            require_luau(n, "'\\u' escapes");
            std::size_t close = body.find('}', i);
            unsigned long cp = std::strtoul(std::string(body.substr(i + 2, close - i - 2)).c_str(), nullptr, 16);
            if(cp > 0x10FFFF) fail(n, "utf-8 value too large");
            append_utf8(out, cp);
            i = close;
            break;
        }
        default: {
            unsigned v = 0;
            std::size_t k = 0;
            while(k < 3 && i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))){ v = v * 10 + (body[i] - '0'); ++i; ++k; }
            --i;
            if(v > 255) fail(n, "decimal escape too large");
            out += static_cast<char>(v);
            break;
        }
        }
    }
    return out;
}

} // namespace shroud::lua::pegtl_front

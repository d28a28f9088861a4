#include "shroud/ast.hpp"
#include "shroud/errors.hpp"

namespace shroud {

const char* kind_name(Kind k){
    switch(k){
    case Kind::Top: return "Top";
    case Kind::Block: return "Block";
    case Kind::Do: return "Do";
    case Kind::While: return "While";
    case Kind::Repeat: return "Repeat";
    case Kind::If: return "If";
    case Kind::NumericFor: return "NumericFor";
    case Kind::GenericFor: return "GenericFor";
    case Kind::FunctionDeclaration: return "FunctionDeclaration";
    case Kind::LocalFunctionDeclaration: return "LocalFunctionDeclaration";
    case Kind::LocalDeclaration: return "LocalDeclaration";
    case Kind::Assignment: return "Assignment";
    case Kind::CompoundAdd: return "CompoundAdd";
    case Kind::CompoundSub: return "CompoundSub";
    case Kind::CompoundMul: return "CompoundMul";
    case Kind::CompoundDiv: return "CompoundDiv";
    case Kind::CompoundMod: return "CompoundMod";
    case Kind::CompoundPow: return "CompoundPow";
    case Kind::CompoundConcat: return "CompoundConcat";
    case Kind::CallStatement: return "CallStatement";
    case Kind::MethodCallStatement: return "MethodCallStatement";
    case Kind::Return: return "Return";
    case Kind::Break: return "Break";
    case Kind::Continue: return "Continue";
    case Kind::AssignVariable: return "AssignVariable";
    case Kind::AssignIndex: return "AssignIndex";
    case Kind::Nil: return "Nil";
    case Kind::Boolean: return "Boolean";
    case Kind::Number: return "Number";
    case Kind::String: return "String";
    case Kind::Vararg: return "Vararg";
    case Kind::Variable: return "Variable";
    case Kind::Parameter: return "Parameter";
    case Kind::Index: return "Index";
    case Kind::Call: return "Call";
    case Kind::MethodCall: return "MethodCall";
    case Kind::FunctionLiteral: return "FunctionLiteral";
    case Kind::Table: return "Table";
    case Kind::Paren: return "Paren";
    case Kind::Or: return "Or";
    case Kind::And: return "And";
    case Kind::Less: return "Less";
    case Kind::Greater: return "Greater";
    case Kind::LessEqual: return "LessEqual";
    case Kind::GreaterEqual: return "GreaterEqual";
    case Kind::NotEqual: return "NotEqual";
    case Kind::Equal: return "Equal";
    case Kind::Concat: return "Concat";
    case Kind::Add: return "Add";
    case Kind::Sub: return "Sub";
    case Kind::Mul: return "Mul";
    case Kind::Div: return "Div";
    case Kind::Mod: return "Mod";
    case Kind::Pow: return "Pow";
    case Kind::Not: return "Not";
    case Kind::Length: return "Length";
    case Kind::Negate: return "Negate";
    case Kind::Entry: return "Entry";
    case Kind::KeyedEntry: return "KeyedEntry";
    }
    return "?";
}

bool is_statement(Kind k){ return k >= Kind::Do && k <= Kind::Continue; }
bool is_expression(Kind k){ return k >= Kind::Nil && k <= Kind::Negate; }
bool is_binary(Kind k){ return k >= Kind::Or && k <= Kind::Pow; }
bool is_unary(Kind k){ return k == Kind::Not || k == Kind::Length || k == Kind::Negate; }
bool is_compound(Kind k){ return k >= Kind::CompoundAdd && k <= Kind::CompoundConcat; }

Kind compound_operator(Kind k){
    switch(k){
    case Kind::CompoundAdd: return Kind::Add;
    case Kind::CompoundSub: return Kind::Sub;
    case Kind::CompoundMul: return Kind::Mul;
    case Kind::CompoundDiv: return Kind::Div;
    case Kind::CompoundMod: return Kind::Mod;
    case Kind::CompoundPow: return Kind::Pow;
    case Kind::CompoundConcat: return Kind::Concat;
    default: throw shape_error(std::string(kind_name(k)) + " is not a compound assignment");
    }
}

void Node::throw_bad_payload() const {
    throw shape_error(std::string("unexpected payload for ") + kind_name(kind) + " node");
}

namespace ast {

namespace {
NodePtr make(Kind k, Payload p, TagSet t = {}){ return std::make_unique<Node>(k, std::move(p), t); }

void need(const NodePtr& n, const char* what){
    if(!n) throw shape_error(std::string(what) + " must not be null");
}
void need_expr(const NodePtr& n, const char* what){
    need(n, what);
    if(!is_expression(n->kind)) throw shape_error(std::string(what) + " must be an expression, got " + kind_name(n->kind));
}
void need_block(const NodePtr& n, const char* what){
    need(n, what);
    if(n->kind != Kind::Block) throw shape_error(std::string(what) + " must be a Block, got " + kind_name(n->kind));
}
void need_exprs(const NodeList& l, const char* what){ for(auto& n : l) need_expr(n, what); }
} // namespace

NodePtr top(std::unique_ptr<Scope> globals, NodePtr body){
    if(!globals || !globals->is_global()) throw shape_error("Top requires a global scope");
    need_block(body, "chunk body");
    return make(Kind::Top, payload::Top{std::move(globals), std::move(body)});
}

NodePtr block(std::unique_ptr<Scope> scope, NodeList statements, bool function_block){
    if(!scope) throw shape_error("Block requires a scope");
    for(auto& s : statements){
        need(s, "statement");
        if(!is_statement(s->kind)) throw shape_error(std::string("Block holds statements only, got ") + kind_name(s->kind));
    }
    return make(Kind::Block, payload::Block{std::move(scope), std::move(statements), function_block});
}

NodePtr nil(TagSet t){ return make(Kind::Nil, payload::None{}, t); }
NodePtr boolean(bool v, TagSet t){ return make(Kind::Boolean, payload::Boolean{v}, t); }
NodePtr number(double v, TagSet t){ return make(Kind::Number, payload::Number{v}, t); }
NodePtr string(std::string v, TagSet t){ return make(Kind::String, payload::String{std::move(v)}, t); }
NodePtr vararg(TagSet t){ return make(Kind::Vararg, payload::None{}, t); }

NodePtr variable(Binding b, TagSet t){
    if(!b.scope) throw shape_error("Variable requires a binding");
    return make(Kind::Variable, payload::Variable{b}, t);
}

NodePtr parameter(Binding b){
    if(!b.scope) throw shape_error("Parameter requires a binding");
    return make(Kind::Parameter, payload::Variable{b});
}

NodePtr index(NodePtr base, NodePtr key, TagSet t){
    need_expr(base, "index base"); need_expr(key, "index key");
    return make(Kind::Index, payload::Index{std::move(base), std::move(key)}, t);
}

NodePtr call(NodePtr callee, NodeList args, TagSet t){
    need_expr(callee, "callee"); need_exprs(args, "argument");
    return make(Kind::Call, payload::Call{std::move(callee), {}, std::move(args)}, t);
}

NodePtr method_call(NodePtr base, std::string method, NodeList args, TagSet t){
    need_expr(base, "method receiver"); need_exprs(args, "argument");
    if(method.empty()) throw shape_error("MethodCall requires a method name");
    return make(Kind::MethodCall, payload::Call{std::move(base), std::move(method), std::move(args)}, t);
}

NodePtr function(NodeList params, bool vararg, NodePtr body, TagSet t){
    need_block(body, "function body");
    auto& b = body->as<payload::Block>();
    if(!b.function_block) throw shape_error("function body must be a function block");
    for(auto& p : params){
        need(p, "parameter");
        if(p->kind != Kind::Parameter) throw shape_error(std::string("parameter list holds Parameter nodes, got ") + kind_name(p->kind));
        if(p->as<payload::Variable>().binding.scope != b.scope.get()) throw shape_error("parameters must be declared in the function body scope");
    }
    return make(Kind::FunctionLiteral, payload::Function{std::move(params), vararg, std::move(body)}, t);
}

NodePtr table(NodeList entries, TagSet t){
    for(auto& e : entries){
        need(e, "table entry");
        if(e->kind != Kind::Entry && e->kind != Kind::KeyedEntry) throw shape_error(std::string("table holds entries, got ") + kind_name(e->kind));
    }
    return make(Kind::Table, payload::Table{std::move(entries)}, t);
}

NodePtr entry(NodePtr value){
    need_expr(value, "entry value");
    return make(Kind::Entry, payload::Entry{nullptr, std::move(value)});
}

NodePtr keyed_entry(NodePtr key, NodePtr value){
    need_expr(key, "entry key"); need_expr(value, "entry value");
    return make(Kind::KeyedEntry, payload::Entry{std::move(key), std::move(value)});
}

NodePtr paren(NodePtr inner, TagSet t){
    need_expr(inner, "parenthesised expression");
    return make(Kind::Paren, payload::Unary{std::move(inner)}, t);
}

NodePtr unary(Kind k, NodePtr operand, TagSet t){
    if(!is_unary(k)) throw shape_error(std::string(kind_name(k)) + " is not a unary operator");
    need_expr(operand, "operand");
    return make(k, payload::Unary{std::move(operand)}, t);
}

NodePtr binary(Kind k, NodePtr lhs, NodePtr rhs, TagSet t){
    if(!is_binary(k)) throw shape_error(std::string(kind_name(k)) + " is not a binary operator");
    need_expr(lhs, "left operand"); need_expr(rhs, "right operand");
    return make(k, payload::Binary{std::move(lhs), std::move(rhs)}, t);
}

NodePtr assign_variable(Binding b){
    if(!b.scope) throw shape_error("AssignVariable requires a binding");
    return make(Kind::AssignVariable, payload::Variable{b});
}

NodePtr assign_index(NodePtr base, NodePtr key){
    need_expr(base, "index base"); need_expr(key, "index key");
    return make(Kind::AssignIndex, payload::Index{std::move(base), std::move(key)});
}

NodePtr to_target(NodePtr expr){
    need(expr, "assignment target");
    if(expr->kind == Kind::Variable){
        auto out = assign_variable(expr->as<payload::Variable>().binding);
        out->line = expr->line;
        return out;
    }
    if(expr->kind == Kind::Index){
        auto& ix = expr->as<payload::Index>();
        auto out = assign_index(std::move(ix.base), std::move(ix.key));
        out->line = expr->line;
        return out;
    }
    if(expr->kind == Kind::AssignVariable || expr->kind == Kind::AssignIndex) return expr;
    throw shape_error(std::string("cannot assign to ") + kind_name(expr->kind));
}

NodePtr do_block(NodePtr body){
    need_block(body, "do body");
    return make(Kind::Do, payload::Loop{nullptr, std::move(body)});
}

NodePtr while_loop(NodePtr cond, NodePtr body){
    need_expr(cond, "while condition"); need_block(body, "while body");
    return make(Kind::While, payload::Loop{std::move(cond), std::move(body)});
}

NodePtr repeat_loop(NodePtr body, NodePtr cond){
    need_block(body, "repeat body"); need_expr(cond, "until condition");
    return make(Kind::Repeat, payload::Loop{std::move(cond), std::move(body)});
}

NodePtr if_chain(NodeList conditions, NodeList blocks, NodePtr otherwise){
    if(conditions.empty() || conditions.size() != blocks.size()) throw shape_error("If requires parallel, non-empty condition/block lists");
    need_exprs(conditions, "if condition");
    for(auto& b : blocks) need_block(b, "if branch");
    if(otherwise) need_block(otherwise, "else branch");
    return make(Kind::If, payload::If{std::move(conditions), std::move(blocks), std::move(otherwise)});
}

NodePtr numeric_for(Binding var, NodePtr start, NodePtr limit, NodePtr step, NodePtr body){
    need_expr(start, "for start"); need_expr(limit, "for limit");
    if(step) need_expr(step, "for step");
    need_block(body, "for body");
    if(var.scope != body->as<payload::Block>().scope.get()) throw shape_error("for variable must be declared in the loop body scope");
    return make(Kind::NumericFor, payload::NumericFor{var, std::move(start), std::move(limit), std::move(step), std::move(body)});
}

NodePtr generic_for(Scope* scope, std::vector<SymbolId> ids, NodeList exprs, NodePtr body){
    if(ids.empty() || exprs.empty()) throw shape_error("generic for requires names and expressions");
    need_exprs(exprs, "iterator expression"); need_block(body, "for body");
    if(scope != body->as<payload::Block>().scope.get()) throw shape_error("for variables must be declared in the loop body scope");
    return make(Kind::GenericFor, payload::GenericFor{scope, std::move(ids), std::move(exprs), std::move(body)});
}

NodePtr function_declaration(Binding name, std::vector<std::string> path, std::string method, NodePtr fn){
    if(!name.scope) throw shape_error("FunctionDeclaration requires a binding");
    need(fn, "function");
    if(fn->kind != Kind::FunctionLiteral) throw shape_error("FunctionDeclaration wraps a FunctionLiteral");
    if(!method.empty() && fn->as<payload::Function>().params.empty()) throw shape_error("method declaration requires the implicit self parameter");
    return make(Kind::FunctionDeclaration, payload::FunctionDecl{name, std::move(path), std::move(method), std::move(fn)});
}

NodePtr local_function(Binding name, NodePtr fn){
    if(!name.scope) throw shape_error("LocalFunctionDeclaration requires a binding");
    need(fn, "function");
    if(fn->kind != Kind::FunctionLiteral) throw shape_error("LocalFunctionDeclaration wraps a FunctionLiteral");
    return make(Kind::LocalFunctionDeclaration, payload::FunctionDecl{name, {}, {}, std::move(fn)});
}

NodePtr local(Scope* scope, std::vector<SymbolId> ids, NodeList values){
    if(!scope) throw shape_error("LocalDeclaration requires a scope");
    if(ids.empty()) throw shape_error("LocalDeclaration requires at least one name");
    need_exprs(values, "initializer");
    return make(Kind::LocalDeclaration, payload::Local{scope, std::move(ids), std::move(values)});
}

NodePtr assignment(NodeList targets, NodeList values){
    if(targets.empty() || values.empty()) throw shape_error("Assignment requires targets and values");
    // Fewer values are allowed only when the last one expands to several at runtime.
    if(targets.size() != values.size() && !(values.size() < targets.size() && is_multi_value(*values.back())))
        throw shape_error("Assignment requires equal-length target/value lists");
    for(auto& t : targets){
        need(t, "assignment target");
        if(t->kind != Kind::AssignVariable && t->kind != Kind::AssignIndex) throw shape_error(std::string("bad assignment target ") + kind_name(t->kind));
    }
    need_exprs(values, "assigned value");
    return make(Kind::Assignment, payload::Assign{std::move(targets), std::move(values)});
}

NodePtr compound(Kind k, NodePtr target, NodePtr value){
    if(!is_compound(k)) throw shape_error(std::string(kind_name(k)) + " is not a compound assignment");
    need(target, "compound target");
    if(target->kind != Kind::AssignVariable && target->kind != Kind::AssignIndex) throw shape_error("bad compound assignment target");
    need_expr(value, "compound value");
    return make(k, payload::Assign{list(std::move(target)), list(std::move(value))});
}

NodePtr call_statement(NodePtr c){
    need(c, "call");
    Kind k;
    if(c->kind == Kind::Call) k = Kind::CallStatement;
    else if(c->kind == Kind::MethodCall) k = Kind::MethodCallStatement;
    else throw shape_error(std::string("only calls can be statements, got ") + kind_name(c->kind));
    int line = c->line;
    auto out = make(k, std::move(c->as<payload::Call>()), c->tags);
    out->line = line;
    return out;
}

NodePtr return_stat(NodeList values){
    need_exprs(values, "returned value");
    return make(Kind::Return, payload::List{std::move(values)});
}

NodePtr break_stat(){ return make(Kind::Break, payload::None{}); }
NodePtr continue_stat(){ return make(Kind::Continue, payload::None{}); }

bool is_multi_value(const Node& n){
    return n.kind == Kind::Call || n.kind == Kind::MethodCall || n.kind == Kind::Vararg;
}

} // namespace ast
} // namespace shroud

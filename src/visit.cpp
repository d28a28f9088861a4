#include "shroud/visit.hpp"
#include "shroud/errors.hpp"
#include <iterator>

namespace shroud {

bool VisitContext::in_function_block() const {
    return block && block->as<payload::Block>().function_block;
}

NodePtr VisitContext::reference(Binding b, TagSet t){
    if(!scope) throw scope_error("reference() outside of any scope");
    scope->reference(b);
    return ast::variable(b, t);
}

std::optional<Binding> reference_of(const Node& n){
    switch(n.kind){
    case Kind::Variable:
    case Kind::AssignVariable: return n.as<payload::Variable>().binding;
    case Kind::FunctionDeclaration: return n.as<payload::FunctionDecl>().name;
    default: return std::nullopt;
    }
}

namespace {

class Walker {
public:
    Walker(const Callback& pre, const Callback& post) : pre_(pre), post_(post) {}

    void run(NodePtr& root, Scope* scope){
        if(scope){ push_scope(scope); ctx_.global_scope = scope->global_scope(); }
        NodeList out;
        if(visit(root, false, out)) throw shape_error("the traversal root cannot be spliced");
    }

private:
    Action call(const Callback& cb, NodePtr& slot){ return cb ? cb(slot, ctx_) : keep(); }

    static void check(const NodePtr& n, bool statement, const char* who){
        if(!n) throw shape_error(std::string(who) + " left an empty slot");
        if(statement && !is_statement(n->kind))
            throw shape_error(std::string(who) + " put a " + kind_name(n->kind) + " node into a statement slot");
    }

    // Returns true when the slot was spliced away; the resulting statements are appended to `out`.
    bool visit(NodePtr& slot, bool statement, NodeList& out){
        if(!slot) return false;
        Action a = call(pre_, slot);
        if(std::holds_alternative<action::Skip>(a)){ check(slot, statement, "pre-order skip"); return false; }
        if(auto* r = std::get_if<action::Replace>(&a)){
            check(r->node, statement, "pre-order replacement");
            slot = std::move(r->node);
        } else if(auto* s = std::get_if<action::Splice>(&a)){
            if(!statement) throw shape_error("splice is only valid in a statement slot");
            for(auto& n : s->nodes){
                check(n, true, "pre-order splice");
                NodeList sub;
                if(finish(n, true, sub)) for(auto& x : sub) out.push_back(std::move(x));
                else out.push_back(std::move(n));
            }
            return true;
        } else {
            check(slot, statement, "pre-order callback");
        }
        return finish(slot, statement, out);
    }

    bool finish(NodePtr& slot, bool statement, NodeList& out){
        children(*slot);
        Action b = call(post_, slot);
        if(auto* r = std::get_if<action::Replace>(&b)){
            check(r->node, statement, "post-order replacement");
            slot = std::move(r->node);
            return false;
        }
        if(auto* s = std::get_if<action::Splice>(&b)){
            if(!statement) throw shape_error("splice is only valid in a statement slot");
            for(auto& n : s->nodes){ check(n, true, "post-order splice"); out.push_back(std::move(n)); }
            return true;
        }
        if(std::holds_alternative<action::Skip>(b)) throw shape_error("skip is only valid from the pre-order callback");
        check(slot, statement, "post-order callback");
        return false;
    }

    void expr(NodePtr& slot){
        NodeList none;
        visit(slot, false, none);
    }
    void exprs(NodeList& l){ for(auto& e : l) expr(e); }

    void statements(NodeList& l){
        for(std::size_t i = 0; i < l.size();){
            NodeList out;
            if(!visit(l[i], true, out)){ ++i; continue; }
            l.erase(l.begin() + static_cast<std::ptrdiff_t>(i));
            l.insert(l.begin() + static_cast<std::ptrdiff_t>(i), std::make_move_iterator(out.begin()), std::make_move_iterator(out.end()));
            i += out.size();
        }
    }

    void push_scope(Scope* s){ ctx_.scope_stack.push_back(s); ctx_.scope = s; }
    void pop_scope(){
        ctx_.scope_stack.pop_back();
        ctx_.scope = ctx_.scope_stack.empty() ? nullptr : ctx_.scope_stack.back();
    }

    static void flush_prologue(FunctionData& fd, payload::Block& body){
        if(fd.prologue.empty()) return;
        body.statements.insert(body.statements.begin(), std::make_move_iterator(fd.prologue.begin()), std::make_move_iterator(fd.prologue.end()));
        fd.prologue.clear();
    }

    void enter_function(FunctionData& fd, Node& owner, Scope* body_scope){
        fd.depth = ctx_.function ? ctx_.function->depth + 1 : (owner.kind == Kind::Top ? 0 : 1);
        fd.scope = body_scope;
        fd.node = &owner;
        fd.parent = ctx_.function;
        ctx_.function = &fd;
    }

    void children(Node& n){
        using namespace payload;
        switch(n.kind){
        case Kind::Top: {
            auto& t = n.as<Top>();
            Scope* saved_global = ctx_.global_scope;
            FunctionData* saved_fn = ctx_.function;
            ctx_.global_scope = t.globals.get();
            push_scope(t.globals.get());
            FunctionData fd;
            enter_function(fd, n, t.body->as<Block>().scope.get());
            expr(t.body);
            flush_prologue(fd, t.body->as<Block>());
            ctx_.function = saved_fn;
            pop_scope();
            ctx_.global_scope = saved_global;
            break;
        }
        case Kind::Block: {
            auto& b = n.as<Block>();
            Node* saved = ctx_.block;
            ctx_.block = &n;
            push_scope(b.scope.get());
            statements(b.statements);
            if(b.function_block && ctx_.function && ctx_.function->scope == b.scope.get()) flush_prologue(*ctx_.function, b);
            pop_scope();
            ctx_.block = saved;
            break;
        }
        case Kind::FunctionLiteral: {
            auto& f = n.as<Function>();
            FunctionData* saved_fn = ctx_.function;
            FunctionData fd;
            Scope* body_scope = f.body->as<Block>().scope.get();
            enter_function(fd, n, body_scope);
            push_scope(body_scope);
            exprs(f.params);
            pop_scope();
            expr(f.body);
            flush_prologue(fd, f.body->as<Block>());
            ctx_.function = saved_fn;
            break;
        }
        case Kind::Do:
        case Kind::While: {
            auto& l = n.as<Loop>();
            expr(l.condition);
            expr(l.body);
            break;
        }
        case Kind::Repeat: {
            auto& l = n.as<Loop>();
            expr(l.body);
            // `until` sees the body's locals
            push_scope(l.body->as<Block>().scope.get());
            expr(l.condition);
            pop_scope();
            break;
        }
        case Kind::If: {
            auto& i = n.as<If>();
            for(std::size_t k = 0; k < i.conditions.size(); ++k){ expr(i.conditions[k]); expr(i.blocks[k]); }
            expr(i.otherwise);
            break;
        }
        case Kind::NumericFor: {
            auto& f = n.as<NumericFor>();
            expr(f.start); expr(f.limit); expr(f.step); expr(f.body);
            break;
        }
        case Kind::GenericFor: {
            auto& f = n.as<GenericFor>();
            exprs(f.exprs); expr(f.body);
            break;
        }
        case Kind::FunctionDeclaration:
        case Kind::LocalFunctionDeclaration: expr(n.as<FunctionDecl>().function); break;
        case Kind::LocalDeclaration: exprs(n.as<Local>().values); break;
        case Kind::Assignment:
        case Kind::CompoundAdd: case Kind::CompoundSub: case Kind::CompoundMul: case Kind::CompoundDiv:
        case Kind::CompoundMod: case Kind::CompoundPow: case Kind::CompoundConcat: {
            auto& a = n.as<Assign>();
            exprs(a.targets); exprs(a.values);
            break;
        }
        case Kind::CallStatement: case Kind::MethodCallStatement:
        case Kind::Call: case Kind::MethodCall: {
            auto& c = n.as<Call>();
            expr(c.callee); exprs(c.args);
            break;
        }
        case Kind::Return: exprs(n.as<List>().items); break;
        case Kind::Index:
        case Kind::AssignIndex: {
            auto& i = n.as<Index>();
            expr(i.base); expr(i.key);
            break;
        }
        case Kind::Table: exprs(n.as<Table>().entries); break;
        case Kind::Entry:
        case Kind::KeyedEntry: {
            auto& e = n.as<Entry>();
            expr(e.key); expr(e.value);
            break;
        }
        case Kind::Paren: case Kind::Not: case Kind::Length: case Kind::Negate: expr(n.as<Unary>().operand); break;
        default:
            if(is_binary(n.kind)){ auto& b = n.as<Binary>(); expr(b.lhs); expr(b.rhs); }
            break;
        }
    }

    const Callback& pre_;
    const Callback& post_;
    VisitContext ctx_;
};

} // namespace

void traverse(NodePtr& root, const Callback& pre, const Callback& post, Scope* scope){
    Walker w(pre, post);
    w.run(root, scope);
}

Action Visitor::dispatch(const std::unordered_map<Kind, Callback>& table, const Callback& fallback, NodePtr& slot, VisitContext& ctx){
    if(auto it = table.find(slot->kind); it != table.end()) return it->second(slot, ctx);
    return fallback ? fallback(slot, ctx) : keep();
}

void Visitor::run(NodePtr& root, Scope* scope){
    Callback pre = [this](NodePtr& s, VisitContext& c){ return dispatch(enter_, enter_any_, s, c); };
    Callback post = [this](NodePtr& s, VisitContext& c){ return dispatch(leave_, leave_any_, s, c); };
    traverse(root, pre, post, scope);
}

void forget(NodePtr& subtree, Scope* site){
    Callback pre = [](NodePtr& s, VisitContext& c){
        if(auto b = reference_of(*s)) c.scope->unreference(*b);
        return keep();
    };
    traverse(subtree, pre, nullptr, site);
}

} // namespace shroud

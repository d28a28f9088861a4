#include "shroud/verify.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include "shroud/visit.hpp"
#include <map>
#include <tuple>

namespace shroud {

namespace {

std::string sym(const Binding& b){
    std::string name = b.scope && b.scope->declares(b.id) ? b.scope->variable_name(b.id) : std::string("?");
    return "'" + name + "' (#" + std::to_string(raw(b.id)) + ")";
}

struct Collector {
    VerifyReport report;
    // (site-or-intermediate scope, owner, id) -> expected ledger count
    std::map<std::tuple<const Scope*, const Scope*, SymbolId>, int> ledger;
    // (owner, id) -> expected use count
    std::map<std::pair<const Scope*, SymbolId>, int> uses;
    // every scope seen, to detect over-counts
    std::vector<const Scope*> scopes;

    void declared(Scope* s, SymbolId id, int line, const char* what){
        if(!s || !s->declares(id))
            report.errors.push_back({std::string(what) + " #" + std::to_string(raw(id)) + " is not declared in its scope", line});
    }

    void use(const Binding& b, Scope* site, Scope* global, int line){
        ++report.references;
        if(!b.scope || !b.scope->declares(b.id)){
            report.errors.push_back({"reference to undeclared symbol " + sym(b), line});
            return;
        }
        if(!site){
            report.errors.push_back({"reference " + sym(b) + " outside of any scope", line});
            return;
        }
        if(b.scope->is_global() && b.scope != global){
            report.errors.push_back({"reference " + sym(b) + " binds a foreign global scope", line});
            return;
        }
        if(!b.scope->is_ancestor_of(site)){
            report.errors.push_back({"reference " + sym(b) + " escapes its declaring scope", line});
            return;
        }
        for(const Scope* s = site; s != b.scope; s = s->parent()) ++ledger[{s, b.scope, b.id}];
        ++uses[{b.scope, b.id}];
    }
};

void collect_scopes(const Scope* s, std::vector<const Scope*>& out){
    out.push_back(s);
    for(const Scope* c : s->children()) collect_scopes(c, out);
}

} // namespace

VerifyReport verify_tree(NodePtr& root){
    Collector c;
    Callback pre = [&](NodePtr& slot, VisitContext& ctx){
        Node& n = *slot;
        using namespace payload;
        switch(n.kind){
        case Kind::Variable:
        case Kind::AssignVariable:
            c.use(n.as<Variable>().binding, ctx.scope, ctx.global_scope, n.line);
            break;
        case Kind::FunctionDeclaration:
            c.use(n.as<FunctionDecl>().name, ctx.scope, ctx.global_scope, n.line);
            break;
        case Kind::LocalFunctionDeclaration: {
            auto& b = n.as<FunctionDecl>().name;
            if(b.scope != ctx.scope) c.report.errors.push_back({"local function declared outside the enclosing scope", n.line});
            c.declared(b.scope, b.id, n.line, "local function");
            break;
        }
        case Kind::LocalDeclaration: {
            auto& l = n.as<Local>();
            if(l.scope != ctx.scope) c.report.errors.push_back({"local declaration bound to a scope other than its block", n.line});
            for(SymbolId id : l.ids) c.declared(l.scope, id, n.line, "local");
            break;
        }
        case Kind::Parameter: {
            auto& b = n.as<Variable>().binding;
            c.declared(b.scope, b.id, n.line, "parameter");
            break;
        }
        case Kind::NumericFor: {
            auto& f = n.as<NumericFor>();
            c.declared(f.var.scope, f.var.id, n.line, "loop variable");
            break;
        }
        case Kind::GenericFor: {
            auto& f = n.as<GenericFor>();
            for(SymbolId id : f.ids) c.declared(f.scope, id, n.line, "loop variable");
            break;
        }
        case Kind::Top:
            collect_scopes(n.as<Top>().globals.get(), c.scopes);
            break;
        default: break;
        }
        return keep();
    };
    traverse(root, pre, nullptr);

    for(auto& [key, expected] : c.ledger){
        auto [site, owner, id] = key;
        int actual = site->higher_reference_count(owner, id);
        if(actual < expected)
            c.report.errors.push_back({"ledger under-reports " + sym({const_cast<Scope*>(owner), id}) + " at depth " + std::to_string(site->depth())
                + ": " + std::to_string(actual) + " < " + std::to_string(expected), 0});
    }
    for(auto& [key, expected] : c.uses){
        int actual = key.first->reference_count(key.second);
        if(actual < expected)
            c.report.errors.push_back({"use count under-reports " + sym({const_cast<Scope*>(key.first), key.second})
                + ": " + std::to_string(actual) + " < " + std::to_string(expected), 0});
    }
    for(const Scope* s : c.scopes){
        for(auto& [owner, ids] : s->higher_references()){
            for(auto& [id, n] : ids){
                auto it = c.ledger.find({s, owner, id});
                int expected = it == c.ledger.end() ? 0 : it->second;
                if(n > expected)
                    c.report.notes.push_back({"stale ledger entry for #" + std::to_string(raw(id)) + ": " + std::to_string(n) + " > " + std::to_string(expected), 0});
            }
        }
    }
    for(auto& note : c.report.notes) log::debug("verify", note.message);
    return c.report;
}

void expect_consistent(NodePtr& root, std::string_view where){
    VerifyReport r = verify_tree(root);
    if(r.ok()) return;
    const VerifyIssue& first = r.errors.front();
    std::string msg = first.message;
    if(first.line > 0) msg += " (line " + std::to_string(first.line) + ")";
    if(r.errors.size() > 1) msg += " [+" + std::to_string(r.errors.size() - 1) + " more]";
    if(!where.empty()) msg = std::string(where) + ": " + msg;
    throw scope_error(msg);
}

} // namespace shroud

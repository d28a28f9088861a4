#include "shroud/splice.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include "shroud/visit.hpp"
#include <iterator>
#include <optional>
#include <set>

namespace shroud {

namespace {

// Local of the host chain that code inserted before statement `position` of `block` sees under
// `name`. Host block locals declared at or after `position` are not live there yet.
std::optional<Binding> visible_local(payload::Block& block, std::size_t position, const std::string& name){
    Scope* host = block.scope.get();
    std::set<SymbolId> later;
    for(std::size_t i = position; i < block.statements.size(); ++i){
        const Node& st = *block.statements[i];
        if(st.kind == Kind::LocalDeclaration){
            const auto& l = st.as<payload::Local>();
            if(l.scope == host) later.insert(l.ids.begin(), l.ids.end());
        } else if(st.kind == Kind::LocalFunctionDeclaration){
            const auto& d = st.as<payload::FunctionDecl>();
            if(d.name.scope == host) later.insert(d.name.id);
        }
    }
    std::optional<Binding> found;
    for(SymbolId id : host->variables())
        if(!later.count(id) && host->variable_name(id) == name) found = Binding{host, id};
    if(found) return found;
    return host->parent() ? host->parent()->resolve(name) : std::nullopt;
}

} // namespace

NodePtr Splicer::parse_fragment(std::string_view source, const Scope& host){
    ParseOptions opts = options_;
    opts.counter = host.counter();
    opts.source_name = "<fragment>";
    try {
        return parser_.parse(source, opts);
    } catch(const syntax_error& e){
        log::error("splice", "fragment " + std::to_string(e.line) + ":" + std::to_string(e.column) + ": " + e.what());
        throw;
    }
}

SpliceResult Splicer::splice(Node& host_block, std::size_t position, std::string_view source, const ExportMap& exports){
    if(host_block.kind != Kind::Block) throw shape_error("splice target must be a Block");
    const Scope& host = *host_block.as<payload::Block>().scope;
    return splice(host_block, position, parse_fragment(source, host), exports);
}

SpliceResult Splicer::splice(Node& host_block, std::size_t position, NodePtr fragment, const ExportMap& exports){
    if(host_block.kind != Kind::Block) throw shape_error("splice target must be a Block");
    auto& hb = host_block.as<payload::Block>();
    Scope* host = hb.scope.get();
    if(position > hb.statements.size()) throw shape_error("splice position " + std::to_string(position) + " is past the end of the block");
    if(!fragment || fragment->kind != Kind::Top) throw shape_error("fragment must be a parsed chunk");

    auto& top = fragment->as<payload::Top>();
    Scope* fragment_global = top.globals.get();
    auto& fb = top.body->as<payload::Block>();
    Scope* root = fb.scope.get();
    if(root->counter() != host->counter())
        throw scope_error("fragment was parsed with a foreign symbol counter");
    Scope* host_global = host->global_scope();
    if(!host_global) throw scope_error("host block is not attached to a tree");
    for(auto& [name, b] : exports){
        if(!b.scope || !b.scope->declares(b.id)) throw scope_error("export '" + name + "' is bound to an undeclared host symbol");
        if(b.scope != host_global && !b.scope->is_ancestor_of(host))
            throw scope_error("export '" + name + "' is bound to a symbol that is not visible from the host block");
    }

    std::set<std::string> used;
    auto exported = [&](const std::string& name) -> const Binding* {
        auto it = exports.find(name);
        if(it == exports.end()) return nullptr;
        used.insert(name);
        return &it->second;
    };

    // Top-level declarations of exported names take the host symbol over.
    for(auto& st : fb.statements){
        if(st->kind == Kind::LocalDeclaration){
            auto& l = st->as<payload::Local>();
            for(SymbolId& id : l.ids){
                const std::string& name = root->variable_name(id);
                if(const Binding* e = exported(name)){
                    if(e->scope != host) throw scope_error("fragment declares export '" + name + "' but its host symbol does not belong to the host block");
                    id = e->id;
                }
            }
        } else if(st->kind == Kind::LocalFunctionDeclaration){
            auto& d = st->as<payload::FunctionDecl>();
            if(const Binding* e = exported(root->variable_name(d.name.id))){
                if(e->scope != host) throw scope_error("fragment declares export '" + root->variable_name(d.name.id) + "' but its host symbol does not belong to the host block");
                d.name = *e;
            }
        }
    }

    // Rebind references and unwind their fragment-side ledger entries.
    struct Pending { Scope* site; Binding target; };
    std::vector<Pending> pending;
    Callback rebind = [&](NodePtr& slot, VisitContext& ctx){
        Node& n = *slot;
        Binding* b = nullptr;
        if(n.kind == Kind::Variable || n.kind == Kind::AssignVariable) b = &n.as<payload::Variable>().binding;
        else if(n.kind == Kind::FunctionDeclaration) b = &n.as<payload::FunctionDecl>().name;
        if(!b || (b->scope != fragment_global && b->scope != root)) return keep();
        const std::string& name = b->scope->variable_name(b->id);
        Binding target;
        if(const Binding* e = exported(name)) target = *e;
        else if(b->scope != fragment_global) return keep();
        else if(auto local = visible_local(hb, position, name)) target = *local;
        else target = host_global->resolve_global(name);
        ctx.scope->unreference(*b);
        *b = target;
        pending.push_back({ctx.scope, target});
        return keep();
    };
    traverse(fragment, rebind, nullptr);

    root->set_parent(host);
    for(auto& p : pending) p.site->reference(p.target);

    for(SymbolId id : root->variables()) root->rename_variable(id, reserved_name(id));

    // Whatever still names the fragment root now names the host block scope.
    Callback rehome = [&](NodePtr& slot, VisitContext&){
        Node& n = *slot;
        switch(n.kind){
        case Kind::Variable:
        case Kind::AssignVariable: {
            auto& b = n.as<payload::Variable>().binding;
            if(b.scope == root) b.scope = host;
            break;
        }
        case Kind::FunctionDeclaration:
        case Kind::LocalFunctionDeclaration: {
            auto& b = n.as<payload::FunctionDecl>().name;
            if(b.scope == root) b.scope = host;
            break;
        }
        case Kind::LocalDeclaration: {
            auto& l = n.as<payload::Local>();
            if(l.scope == root) l.scope = host;
            break;
        }
        default: break;
        }
        return keep();
    };
    NodeList statements = std::move(fb.statements);
    fb.statements.clear();
    for(auto& st : statements) traverse(st, rehome, nullptr, host);
    host->absorb(std::move(fb.scope));

    SpliceResult result;
    result.inserted = statements.size();
    hb.statements.insert(hb.statements.begin() + static_cast<std::ptrdiff_t>(position),
        std::make_move_iterator(statements.begin()), std::make_move_iterator(statements.end()));

    for(auto& [name, b] : exports){
        if(used.count(name)) continue;
        result.unused_exports.push_back(name);
        log::warn("splice", "export '" + name + "' does not occur in the fragment; host symbol #" + std::to_string(raw(b.id)) + " stays unused");
    }
    log::debug("splice", "inserted " + std::to_string(result.inserted) + " statement(s) at " + std::to_string(position)
        + ", " + std::to_string(pending.size()) + " reference(s) rebound");
    return result;
}

} // namespace shroud

#include "shroud/scope.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include <algorithm>

namespace shroud {

std::string reserved_name(SymbolId id){ return "__shroud_" + std::to_string(raw(id)); }

std::unique_ptr<Scope> Scope::make_global(std::shared_ptr<SymbolCounter> counter){
    if(!counter) counter = std::make_shared<SymbolCounter>();
    return std::unique_ptr<Scope>(new Scope(std::move(counter), true));
}

Scope::Scope(std::shared_ptr<SymbolCounter> counter, bool global)
    : global_(global), counter_(std::move(counter)) {}

Scope::Scope(Scope* parent) : parent_(parent) {
    if(!parent_) throw scope_error("child scope requires a parent");
    counter_ = parent_->counter_;
    parent_->children_.push_back(this);
}

Scope::~Scope(){
    if(parent_){
        auto& sib = parent_->children_;
        sib.erase(std::remove(sib.begin(), sib.end(), this), sib.end());
    }
    for(Scope* c : children_) c->parent_ = nullptr;
}

Scope* Scope::root(){
    Scope* s = this;
    while(s->parent_) s = s->parent_;
    return s;
}

Scope* Scope::global_scope(){
    Scope* r = root();
    return r->global_ ? r : nullptr;
}

int Scope::depth() const {
    int d = 0;
    for(const Scope* s = parent_; s; s = s->parent_) ++d;
    return d;
}

bool Scope::is_ancestor_of(const Scope* other) const {
    for(const Scope* s = other; s; s = s->parent_) if(s == this) return true;
    return false;
}

void Scope::declare(SymbolId id, std::string name, bool visible){
    order_.push_back(id);
    if(visible) lookup_[name] = id;
    else hidden_.insert(id);
    names_[id] = std::move(name);
}

// Visible symbols in declaration order; the latest declaration of a name wins.
void Scope::rebuild_lookup(){
    lookup_.clear();
    for(SymbolId id : order_) if(!hidden_.count(id)) lookup_[names_.at(id)] = id;
}

SymbolId Scope::add_variable(std::optional<std::string> name_hint){
    SymbolId id = counter_->mint();
    declare(id, name_hint ? std::move(*name_hint) : reserved_name(id), true);
    return id;
}

std::optional<Binding> Scope::resolve(std::string_view name){
    std::string key(name);
    for(Scope* s = this; s && !s->global_; s = s->parent_){
        if(auto it = s->lookup_.find(key); it != s->lookup_.end()) return Binding{s, it->second};
    }
    return std::nullopt;
}

Binding Scope::resolve_global(std::string_view name){
    Scope* g = global_scope();
    if(!g) throw scope_error("resolve_global('" + std::string(name) + "') from a scope with no global root");
    std::string key(name);
    if(auto it = g->lookup_.find(key); it != g->lookup_.end()) return Binding{g, it->second};
    SymbolId id = g->counter_->mint();
    g->declare(id, key, true);
    return Binding{g, id};
}

Binding Scope::lookup(std::string_view name){
    if(auto b = resolve(name)) return *b;
    if(Scope* g = global_scope()){
        if(auto it = g->lookup_.find(std::string(name)); it != g->lookup_.end()) return Binding{g, it->second};
    }
    throw scope_error("unresolved name '" + std::string(name) + "' is neither a visible local nor a known global");
}

const std::string& Scope::variable_name(SymbolId id) const {
    auto it = names_.find(id);
    if(it == names_.end()) throw scope_error("symbol #" + std::to_string(raw(id)) + " is not declared in this scope");
    return it->second;
}

void Scope::rename_variable(SymbolId id, std::string name){
    auto it = names_.find(id);
    if(it == names_.end()) throw scope_error("cannot rename undeclared symbol #" + std::to_string(raw(id)));
    it->second = std::move(name);
    rebuild_lookup();
}

void Scope::add_reference_to_higher_scope(Scope* owner, SymbolId id, int n){
    if(!owner) throw scope_error("reference to a symbol with no owning scope");
    if(!owner->is_ancestor_of(this))
        throw scope_error("symbol #" + std::to_string(raw(id)) + " is owned by a scope that is not an ancestor of the reference");
    for(Scope* s = this; s != owner; s = s->parent_) s->ledger_[owner][id] += n;
    owner->counts_[id] += n;
}

void Scope::remove_reference_to_higher_scope(Scope* owner, SymbolId id, int n){
    if(!owner) throw scope_error("reference to a symbol with no owning scope");
    for(Scope* s = this; s != owner; s = s->parent_){
        if(!s) throw scope_error("ledger removal for symbol #" + std::to_string(raw(id)) + " walked past the root");
        if(s->higher_reference_count(owner, id) < n)
            throw scope_error("ledger underflow for symbol #" + std::to_string(raw(id)));
    }
    if(owner->reference_count(id) < n) throw scope_error("use count underflow for symbol #" + std::to_string(raw(id)));
    for(Scope* s = this; s != owner; s = s->parent_){
        auto& ids = s->ledger_[owner];
        if((ids[id] -= n) == 0) ids.erase(id);
        if(ids.empty()) s->ledger_.erase(owner);
    }
    owner->counts_[id] -= n;
}

int Scope::reference_count(SymbolId id) const {
    auto it = counts_.find(id);
    return it == counts_.end() ? 0 : it->second;
}

int Scope::higher_reference_count(const Scope* owner, SymbolId id) const {
    auto it = ledger_.find(owner);
    if(it == ledger_.end()) return 0;
    auto c = it->second.find(id);
    return c == it->second.end() ? 0 : c->second;
}

void Scope::set_parent(Scope* parent){
    if(!parent) throw scope_error("set_parent(nullptr)");
    if(global_) throw scope_error("the global scope cannot be attached");
    if(attached_) throw scope_error("scope was already attached to a host chain");
    if(parent_ && !parent_->global_) throw scope_error("only a detached root scope can be attached");
    if(parent->counter_ != counter_) throw scope_error("attach across trees with different symbol counters");
    if(is_ancestor_of(parent)) throw scope_error("attach would create a cycle");
    if(parent_){
        if(auto it = ledger_.find(parent_); it != ledger_.end() && !it->second.empty())
            throw scope_error("detached scope still references " + std::to_string(it->second.size()) + " symbol(s) of its old global scope");
        auto& sib = parent_->children_;
        sib.erase(std::remove(sib.begin(), sib.end(), this), sib.end());
    }
    parent_ = parent;
    parent_->children_.push_back(this);
    attached_ = true;
}

void Scope::move_under(Scope* mid){
    if(!mid || !parent_ || mid == this || mid->parent_ != parent_) throw scope_error("move_under() requires a sibling scope");
    if(!mid->order_.empty() || !mid->ledger_.empty() || !mid->children_.empty())
        throw scope_error("move_under() requires a fresh scope");
    mid->ledger_ = ledger_;
    auto& sib = parent_->children_;
    sib.erase(std::remove(sib.begin(), sib.end(), this), sib.end());
    parent_ = mid;
    mid->children_.push_back(this);
}

void Scope::rekey(Scope* s, const Scope* from, const Scope* to){
    if(auto it = s->ledger_.find(from); it != s->ledger_.end()){
        auto moved = std::move(it->second);
        s->ledger_.erase(it);
        auto& dst = s->ledger_[to];
        for(auto& [id, n] : moved) dst[id] += n;
    }
    for(Scope* c : s->children_) rekey(c, from, to);
}

void Scope::absorb(std::unique_ptr<Scope> inner){
    if(!inner || inner->parent_ != this) throw scope_error("absorb() requires a direct child scope");
    for(SymbolId id : inner->order_) declare(id, inner->names_.at(id), false);
    for(auto& [id, n] : inner->counts_) counts_[id] += n;
    // inner's ledger entries all passed through this scope already
    std::vector<Scope*> moved = std::move(inner->children_);
    inner->children_.clear();
    for(Scope* c : moved){
        c->parent_ = this;
        children_.push_back(c);
        rekey(c, inner.get(), this);
    }
    log::debug("scope", "absorbed " + std::to_string(inner->order_.size()) + " symbol(s) into depth " + std::to_string(depth()));
    inner.reset();
}

} // namespace shroud

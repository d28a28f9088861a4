#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace shroud {

// Opaque symbol handle; unique for the lifetime of one tree. Surface names are cosmetic.
enum class SymbolId : std::uint32_t {};
inline std::uint32_t raw(SymbolId id){ return static_cast<std::uint32_t>(id); }

// Per-tree monotonically increasing id source. Shared (not copied) by every scope of a tree
// and lent to fragment parses so fragment ids never collide with host ids.
struct SymbolCounter {
    std::uint32_t next{1};
    SymbolId mint(){ return SymbolId{next++}; }
};

class Scope;

// A resolved (declaring scope, id) pair.
struct Binding {
    Scope* scope{nullptr};
    SymbolId id{};
    bool operator==(const Binding& o) const { return scope == o.scope && id == o.id; }
    bool operator!=(const Binding& o) const { return !(*this == o); }
};

// Reserved surface name given to anonymous and fragment-private symbols.
std::string reserved_name(SymbolId id);

class Scope {
public:
    // owner scope -> (id -> count) for symbols of ancestors used inside this subtree
    using Ledger = std::unordered_map<const Scope*, std::map<SymbolId, int>>;

    static std::unique_ptr<Scope> make_global(std::shared_ptr<SymbolCounter> counter = nullptr);
    explicit Scope(Scope* parent);
    ~Scope();
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    bool is_global() const { return global_; }
    Scope* parent() const { return parent_; }
    Scope* root();
    Scope* global_scope();
    int depth() const;
    const std::vector<Scope*>& children() const { return children_; }
    const std::shared_ptr<SymbolCounter>& counter() const { return counter_; }
    // Inclusive: a scope is its own ancestor.
    bool is_ancestor_of(const Scope* other) const;

    // Declare a fresh local. Shadowing in the same or an outer scope mints a new id;
    // the name lookup then maps to the newest declaration.
    SymbolId add_variable(std::optional<std::string> name_hint = std::nullopt);
    bool declares(SymbolId id) const { return names_.count(id) != 0; }
    const std::vector<SymbolId>& variables() const { return order_; }

    // Locals only, innermost first; stops below the global scope.
    std::optional<Binding> resolve(std::string_view name);
    // Intern `name` in the tree's single flat global namespace.
    Binding resolve_global(std::string_view name);
    // Local, else an already interned global; anything else is a scope_error.
    Binding lookup(std::string_view name);

    const std::string& variable_name(SymbolId id) const;
    void rename_variable(SymbolId id, std::string name);

    // Record / erase `n` uses of owner's `id` from this scope. Walks the chain and bumps the
    // ledger of every scope strictly below `owner`; the owner's own use count is bumped last.
    void add_reference_to_higher_scope(Scope* owner, SymbolId id, int n = 1);
    void remove_reference_to_higher_scope(Scope* owner, SymbolId id, int n = 1);
    void add_reference(SymbolId id, int n = 1){ add_reference_to_higher_scope(this, id, n); }
    void remove_reference(SymbolId id, int n = 1){ remove_reference_to_higher_scope(this, id, n); }
    void reference(const Binding& b, int n = 1){ add_reference_to_higher_scope(b.scope, b.id, n); }
    void unreference(const Binding& b, int n = 1){ remove_reference_to_higher_scope(b.scope, b.id, n); }

    int reference_count(SymbolId id) const;
    int higher_reference_count(const Scope* owner, SymbolId id) const;
    const Ledger& higher_references() const { return ledger_; }

    // One-time attach of a detached root (a scope whose parent is its own tree's global
    // scope) onto a host chain. Ids are unchanged; only the lookup chain moves.
    void set_parent(Scope* parent);
    bool attached() const { return attached_; }

    // Moves this scope under `mid`, a fresh sibling (same parent, no symbols, no ledger). `mid`
    // inherits every ledger entry that passes through this scope.
    void move_under(Scope* mid);

    // Merge a direct child into this scope: its symbols become hidden members of this
    // scope (not reachable by name), its children are re-parented here and every ledger
    // keyed by it is re-keyed to this scope. Callers rebind nodes that named `inner`.
    void absorb(std::unique_ptr<Scope> inner);

private:
    Scope(std::shared_ptr<SymbolCounter> counter, bool global);
    void declare(SymbolId id, std::string name, bool visible);
    void rebuild_lookup();
    static void rekey(Scope* s, const Scope* from, const Scope* to);

    Scope* parent_{nullptr};
    bool global_{false};
    bool attached_{false};
    std::shared_ptr<SymbolCounter> counter_;
    std::vector<Scope*> children_;
    std::vector<SymbolId> order_;
    std::unordered_map<SymbolId, std::string> names_;
    std::unordered_map<std::string, SymbolId> lookup_;
    std::unordered_set<SymbolId> hidden_;
    std::unordered_map<SymbolId, int> counts_;
    Ledger ledger_;
};

} // namespace shroud

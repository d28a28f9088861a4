#pragma once
#include "shroud/ast.hpp"
#include <any>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <variant>

namespace shroud {

// Callback result. Keep: slot unchanged. Replace: slot now holds `node`.
// Splice: a statement becomes zero or more statements (statement slots only).
// Skip: do not descend and do not run the post callback (pre-order only).
namespace action {
struct Keep {};
struct Replace { NodePtr node; };
struct Splice { NodeList nodes; };
struct Skip {};
} // namespace action
using Action = std::variant<action::Keep, action::Replace, action::Splice, action::Skip>;

inline Action keep(){ return action::Keep{}; }
inline Action replace(NodePtr n){ return action::Replace{std::move(n)}; }
inline Action splice(NodeList l){ return action::Splice{std::move(l)}; }
inline Action skip(){ return action::Skip{}; }

// Per enclosing function (the chunk counts as depth 0).
struct FunctionData {
    int depth{0};
    Scope* scope{nullptr};          // body block scope
    Node* node{nullptr};            // FunctionLiteral, or Top for the chunk
    FunctionData* parent{nullptr};
    NodeList prologue;              // inserted, unvisited, at the top of the body when the walk leaves it
    std::any state;                 // pass-owned
};

struct VisitContext {
    Scope* scope{nullptr};          // innermost scope at the current node
    Scope* global_scope{nullptr};
    std::vector<Scope*> scope_stack;
    Node* block{nullptr};           // innermost enclosing Block
    FunctionData* function{nullptr};

    bool in_function_block() const;
    // Binds `b` for a new reference created at the current position and records it in the ledger.
    NodePtr reference(Binding b, TagSet t = {});
};

using Callback = std::function<Action(NodePtr& slot, VisitContext& ctx)>;

// Depth-first walk over every structurally owned child. A pre-order replacement is not fed back
// to `pre`; its children are walked and `post` runs on it. A post-order replacement is final.
// Callbacks must not edit the statement list of a block that is being walked; use Splice or
// FunctionData::prologue instead.
void traverse(NodePtr& root, const Callback& pre, const Callback& post, Scope* scope = nullptr);

// Registry form: per-kind callbacks first, generic fallback otherwise.
class Visitor {
public:
    Visitor& on_enter(Kind k, Callback fn){ enter_[k] = std::move(fn); return *this; }
    Visitor& on_leave(Kind k, Callback fn){ leave_[k] = std::move(fn); return *this; }
    Visitor& on_enter_any(Callback fn){ enter_any_ = std::move(fn); return *this; }
    Visitor& on_leave_any(Callback fn){ leave_any_ = std::move(fn); return *this; }

    void run(NodePtr& root, Scope* scope = nullptr);

private:
    Action dispatch(const std::unordered_map<Kind, Callback>& table, const Callback& fallback, NodePtr& slot, VisitContext& ctx);

    std::unordered_map<Kind, Callback> enter_;
    std::unordered_map<Kind, Callback> leave_;
    Callback enter_any_;
    Callback leave_any_;
};

// Identity-keyed node set for pass-local marks.
using NodeSet = std::unordered_set<const Node*>;

// Removes the ledger entries of every reference inside `subtree`, as seen from `site`.
// Call before discarding a subtree that is not reused.
void forget(NodePtr& subtree, Scope* site);

// Binding carried by Variable/AssignVariable/FunctionDeclaration nodes; nullopt for others.
std::optional<Binding> reference_of(const Node& n);

} // namespace shroud

#pragma once
#include "shroud/ast.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace shroud {

struct VerifyIssue {
    std::string message;
    int line{0};
};

struct VerifyReport {
    std::vector<VerifyIssue> errors; // broken bindings, under-reported ledger entries
    std::vector<VerifyIssue> notes;  // stale over-counts (harmless, renaming just gets more conservative)
    std::size_t references{0};
    bool ok() const { return errors.empty(); }
};

// Checks that every reference is declared in its scope chain (or the global scope) and that the
// upvalue ledger covers every use. Does not modify the tree.
VerifyReport verify_tree(NodePtr& root);

// verify_tree + scope_error naming `where` on the first error.
void expect_consistent(NodePtr& root, std::string_view where = {});

} // namespace shroud

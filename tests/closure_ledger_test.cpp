#include <gtest/gtest.h>
#include "test_util.hpp"
#include "shroud/errors.hpp"
#include "shroud/rename.hpp"
#include "shroud/verify.hpp"
#include "shroud/visit.hpp"
#include <memory>
#include <vector>

using namespace shroud;
using shroud_test::parse;
using shroud_test::print;

// Upvalue ledger behaviour as the renamer relies on it.

TEST(ClosureLedger, ParserRecordsUpvaluesOnEveryIntermediateScope){
    NodePtr t = parse("local a = 1\nlocal function f()\n  do\n    return function() return a end\n  end\nend");
    Scope* chunk = shroud_test::chunk_scope(t);
    SymbolId a = chunk->variables().front();
    int scopes_with_entry = 0;
    std::vector<Scope*> pending{chunk};
    while(!pending.empty()){
        Scope* s = pending.back();
        pending.pop_back();
        if(s->higher_reference_count(chunk, a) == 1) ++scopes_with_entry;
        for(Scope* c : s->children()) pending.push_back(c);
    }
    // f's body, the do block and the inner function's body
    EXPECT_EQ(scopes_with_entry, 3);
    EXPECT_EQ(chunk->reference_count(a), 1);
}

TEST(ClosureLedger, RenamingNeverCapturesAnUpvalue){
    NodePtr t = parse("local function f() local z = 1; return f, z end");
    auto names = make_name_generator("mangled", 0);
    rename_variables(*t, *names);
    EXPECT_EQ(print(*t), "local function a() local b = 1; return a, b end");
}

TEST(ClosureLedger, UnreferencedOuterNamesAreReused){
    NodePtr t = parse("local a = 1; local function f() local b = 2; return a + b end");
    auto names = make_name_generator("mangled", 0);
    rename_variables(*t, *names);
    EXPECT_EQ(print(*t), "local a = 1; local function b() local b = 2; return a + b end");
}

TEST(ClosureLedger, InjectedReferenceBlocksItsNameAfterRename){
    NodePtr t = parse("local keep = 1; local function f() local y = 2; return y end");
    Scope* chunk = shroud_test::chunk_scope(t);
    Binding kept{chunk, chunk->variables().front()};
    // rewrite `return y` into `return y + keep`, introducing a new upvalue use
    Callback post = [&](NodePtr& slot, VisitContext& ctx) -> Action {
        if(slot->kind != Kind::Return) return keep();
        auto& items = slot->as<payload::List>().items;
        items.front() = ast::binary(Kind::Add, std::move(items.front()), ctx.reference(kept));
        return keep();
    };
    traverse(t, nullptr, post);
    ASSERT_TRUE(verify_tree(t).ok());

    auto names = make_name_generator("mangled", 0);
    rename_variables(*t, *names);
    EXPECT_EQ(print(*t), "local a = 1; local function b() local b = 2; return b + a end");
}

TEST(ClosureLedger, MissingLedgerEntryIsCaughtByTheVerifier){
    NodePtr t = parse("local keep = 1; local function f() return 0 end");
    Scope* chunk = shroud_test::chunk_scope(t);
    Binding kept{chunk, chunk->variables().front()};
    Callback post = [&](NodePtr& slot, VisitContext&) -> Action {
        if(slot->kind != Kind::Number || slot->as<payload::Number>().value != 0) return keep();
        return replace(ast::variable(kept));
    };
    traverse(t, nullptr, post);
    VerifyReport r = verify_tree(t);
    EXPECT_FALSE(r.ok());
    EXPECT_THROW(expect_consistent(t, "test"), scope_error);
}

TEST(ClosureLedger, ReferenceMovedIntoANewClosureKeepsItsBinding){
    NodePtr t = parse("local a = 1; local b = a + 2");
    Scope* chunk = shroud_test::chunk_scope(t);
    SymbolId a = chunk->variables().front();
    Scope* body_scope = nullptr;
    // `a` becomes `(function() return a end)()`
    Callback post = [&](NodePtr& slot, VisitContext& ctx) -> Action {
        if(slot->kind != Kind::Variable || slot->as<payload::Variable>().binding.id != a) return keep();
        Binding moved = slot->as<payload::Variable>().binding;
        forget(slot, ctx.scope);
        auto inner = std::make_unique<Scope>(ctx.scope);
        inner->add_reference_to_higher_scope(moved.scope, moved.id);
        body_scope = inner.get();
        NodePtr body = ast::block(std::move(inner), ast::list(ast::return_stat(ast::list(ast::variable(moved)))), true);
        return replace(ast::call(ast::paren(ast::function({}, false, std::move(body))), {}));
    };
    traverse(t, nullptr, post);

    ASSERT_NE(body_scope, nullptr);
    EXPECT_EQ(chunk->variable_name(a), "a");
    ASSERT_TRUE(body_scope->resolve("a"));
    EXPECT_EQ(body_scope->resolve("a")->scope, chunk);
    EXPECT_EQ(body_scope->resolve("a")->id, a);
    EXPECT_EQ(body_scope->higher_reference_count(chunk, a), 1);
    EXPECT_EQ(chunk->reference_count(a), 1);
    EXPECT_TRUE(verify_tree(t).ok());
    EXPECT_EQ(print(*t), "local a = 1; local b = (function() return a end)() + 2");
}

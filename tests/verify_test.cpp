#include <gtest/gtest.h>
#include "test_util.hpp"
#include "shroud/errors.hpp"
#include "shroud/verify.hpp"
#include "shroud/visit.hpp"

using namespace shroud;
using shroud_test::parse;

TEST(Verify, ParsedTreesAreConsistent){
    NodePtr t = parse("local a = 1; local function f(x) for i = 1, x do a = a + i end return a end; print(f(3))");
    VerifyReport r = verify_tree(t);
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.notes.empty());
    EXPECT_GT(r.references, 0u);
    EXPECT_NO_THROW(expect_consistent(t));
}

TEST(Verify, DetectsUndeclaredSymbols){
    NodePtr t = parse("print(1)");
    Scope* chunk = shroud_test::chunk_scope(t);
    Callback post = [&](NodePtr& slot, VisitContext&) -> Action {
        if(slot->kind != Kind::Number) return keep();
        return replace(ast::variable({chunk, SymbolId{9999}}));
    };
    traverse(t, nullptr, post);
    VerifyReport r = verify_tree(t);
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.errors.front().message.find("undeclared"), std::string::npos);
}

TEST(Verify, DetectsReferencesThatEscapeTheirScope){
    NodePtr t = parse("local function f(p) return p end; print(1)");
    const auto& st = shroud_test::chunk_block(t).as<payload::Block>().statements;
    const auto& fn = st[0]->as<payload::FunctionDecl>().function->as<payload::Function>();
    Binding p = fn.params.front()->as<payload::Variable>().binding;
    Callback post = [&](NodePtr& slot, VisitContext&) -> Action {
        if(slot->kind != Kind::Number) return keep();
        return replace(ast::variable(p));
    };
    traverse(t, nullptr, post);
    VerifyReport r = verify_tree(t);
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.errors.front().message.find("escapes"), std::string::npos);
}

TEST(Verify, UnderCountedUsesAreErrors){
    NodePtr t = parse("local a = 1; print(a)");
    Scope* chunk = shroud_test::chunk_scope(t);
    chunk->remove_reference(chunk->variables().front());
    EXPECT_FALSE(verify_tree(t).ok());
    try {
        expect_consistent(t, "after-step");
        FAIL() << "expected a scope_error";
    } catch(const scope_error& e){
        EXPECT_EQ(std::string(e.what()).rfind("after-step: ", 0), 0u);
    }
}

TEST(Verify, StaleOverCountsAreOnlyNotes){
    NodePtr t = parse("local a = 1; local function f() return a end");
    Scope* chunk = shroud_test::chunk_scope(t);
    Scope* fn_scope = chunk->children().front();
    fn_scope->reference({chunk, chunk->variables().front()});
    VerifyReport r = verify_tree(t);
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.notes.empty());
}

TEST(Verify, LocalsMustBeDeclaredWhereTheyAppear){
    NodePtr t = parse("local a = 1; do local b = 2 end");
    auto& st = shroud_test::chunk_block(t).as<payload::Block>().statements;
    Node& inner = *st[1]->as<payload::Loop>().body;
    // move `local a = 1` into the do block without rebinding it
    auto& inner_st = inner.as<payload::Block>().statements;
    inner_st.push_back(std::move(st[0]));
    st.erase(st.begin());
    EXPECT_FALSE(verify_tree(t).ok());
}

#include <gtest/gtest.h>
#include "shroud/errors.hpp"
#include "shroud/names.hpp"
#include "shroud/rename.hpp"
#include "shroud/scope.hpp"
#include "test_util.hpp"

using namespace shroud;

TEST(Scope, ShadowingMintsANewSymbol){
    auto g = Scope::make_global();
    Scope s(g.get());
    SymbolId first = s.add_variable("x");
    SymbolId second = s.add_variable("x");
    EXPECT_NE(first, second);
    auto b = s.resolve("x");
    ASSERT_TRUE(b);
    EXPECT_EQ(b->id, second);
    EXPECT_EQ(s.variable_name(first), "x");
    EXPECT_EQ(s.variables().size(), 2u);
}

TEST(Scope, InnerScopesSeeOuterLocals){
    auto g = Scope::make_global();
    Scope outer(g.get());
    Scope inner(&outer);
    SymbolId x = outer.add_variable("x");
    auto b = inner.resolve("x");
    ASSERT_TRUE(b);
    EXPECT_EQ(b->scope, &outer);
    EXPECT_EQ(b->id, x);
    EXPECT_FALSE(inner.resolve("y"));
    EXPECT_EQ(inner.depth(), 2);
    EXPECT_EQ(inner.global_scope(), g.get());
    EXPECT_TRUE(outer.is_ancestor_of(&inner));
    EXPECT_FALSE(inner.is_ancestor_of(&outer));
}

TEST(Scope, InnerShadowIsInvisibleToSiblings){
    auto g = Scope::make_global();
    Scope outer(g.get());
    Scope inner(&outer);
    Scope sibling(&outer);
    SymbolId x = outer.add_variable("x");
    SymbolId shadow = inner.add_variable("x");
    EXPECT_NE(x, shadow);
    EXPECT_EQ(inner.resolve("x")->id, shadow);
    EXPECT_EQ(inner.resolve("x")->scope, &inner);
    EXPECT_EQ(sibling.resolve("x")->id, x);
    EXPECT_EQ(sibling.resolve("x")->scope, &outer);
    EXPECT_EQ(outer.resolve("x")->id, x);
}

TEST(Scope, ParsedShadowingBindsPerBlock){
    NodePtr t = shroud_test::parse("local x = 1; do local x = 2; print(x) end; do print(x) end");
    auto& stmts = shroud_test::chunk_block(t).as<payload::Block>().statements;
    Binding outer{shroud_test::chunk_scope(t), stmts[0]->as<payload::Local>().ids[0]};
    auto call_arg = [](const Node& block, std::size_t at) -> Binding {
        const auto& call = block.as<payload::Block>().statements[at]->as<payload::Call>();
        return call.args[0]->as<payload::Variable>().binding;
    };
    const Node& first = *stmts[1]->as<payload::Loop>().body;
    const Node& second = *stmts[2]->as<payload::Loop>().body;
    Binding inner = call_arg(first, 1);
    EXPECT_NE(inner, outer);
    EXPECT_EQ(inner.scope, first.as<payload::Block>().scope.get());
    EXPECT_EQ(call_arg(second, 0), outer);
}

TEST(Scope, GlobalsAreInternedOnce){
    auto g = Scope::make_global();
    Scope s(g.get());
    Binding a = s.resolve_global("print");
    Binding b = s.resolve_global("print");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.scope, g.get());
    // locals never resolve to globals
    EXPECT_FALSE(s.resolve("print"));
    EXPECT_EQ(s.lookup("print"), a);
    EXPECT_THROW(s.lookup("missing"), scope_error);
}

TEST(Scope, AnonymousVariablesGetReservedNames){
    auto g = Scope::make_global();
    Scope s(g.get());
    SymbolId id = s.add_variable();
    EXPECT_EQ(s.variable_name(id), reserved_name(id));
    EXPECT_EQ(reserved_name(id).rfind("__shroud_", 0), 0u);
}

TEST(Scope, RenameKeepsLookupInSync){
    auto g = Scope::make_global();
    Scope s(g.get());
    SymbolId id = s.add_variable("old");
    s.rename_variable(id, "fresh");
    EXPECT_FALSE(s.resolve("old"));
    ASSERT_TRUE(s.resolve("fresh"));
    EXPECT_EQ(s.resolve("fresh")->id, id);
    EXPECT_THROW(s.rename_variable(SymbolId{999}, "z"), scope_error);
}

TEST(Scope, RenameSwapKeepsBothNamesResolvable){
    auto g = Scope::make_global();
    Scope s(g.get());
    SymbolId b = s.add_variable("b");
    SymbolId a = s.add_variable("a");
    s.rename_variable(b, "a");
    // two declarations share "a" for now; the later one wins
    EXPECT_EQ(s.resolve("a")->id, a);
    s.rename_variable(a, "b");
    ASSERT_TRUE(s.resolve(s.variable_name(a)));
    EXPECT_EQ(s.resolve(s.variable_name(a))->id, a);
    ASSERT_TRUE(s.resolve(s.variable_name(b)));
    EXPECT_EQ(s.resolve(s.variable_name(b))->id, b);
}

TEST(Scope, RenameLeavesAbsorbedSymbolsHidden){
    auto g = Scope::make_global();
    Scope host(g.get());
    auto inner = std::make_unique<Scope>(&host);
    SymbolId hidden = inner->add_variable("helper");
    host.absorb(std::move(inner));
    SymbolId x = host.add_variable("x");
    host.rename_variable(x, "y");
    EXPECT_FALSE(host.resolve("helper"));
    EXPECT_EQ(host.variable_name(hidden), "helper");
    EXPECT_EQ(host.resolve("y")->id, x);
}

TEST(Scope, RenameVariablesRoundTripsEveryLocal){
    NodePtr t = shroud_test::parse("local b = 1; local a = 2; local c = a + b; print(a, b, c)");
    Scope* chunk = shroud_test::chunk_scope(t);
    auto names = make_name_generator("mangled", 0);
    rename_variables(*t, *names);
    for(SymbolId id : chunk->variables()){
        auto found = chunk->resolve(chunk->variable_name(id));
        ASSERT_TRUE(found) << chunk->variable_name(id);
        EXPECT_EQ(found->id, id);
    }
}

TEST(Scope, LedgerCoversEveryScopeBelowTheOwner){
    auto g = Scope::make_global();
    Scope a(g.get());
    Scope b(&a);
    Scope c(&b);
    SymbolId x = a.add_variable("x");
    c.add_reference_to_higher_scope(&a, x, 2);
    EXPECT_EQ(c.higher_reference_count(&a, x), 2);
    EXPECT_EQ(b.higher_reference_count(&a, x), 2);
    EXPECT_EQ(a.higher_reference_count(&a, x), 0);
    EXPECT_EQ(a.reference_count(x), 2);

    c.remove_reference_to_higher_scope(&a, x);
    EXPECT_EQ(b.higher_reference_count(&a, x), 1);
    EXPECT_EQ(a.reference_count(x), 1);
    c.unreference({&a, x});
    EXPECT_TRUE(c.higher_references().empty());
    EXPECT_TRUE(b.higher_references().empty());
}

TEST(Scope, LedgerUnderflowLeavesCountsUntouched){
    auto g = Scope::make_global();
    Scope a(g.get());
    Scope b(&a);
    SymbolId x = a.add_variable("x");
    b.reference({&a, x});
    EXPECT_THROW(b.unreference({&a, x}, 2), scope_error);
    EXPECT_EQ(b.higher_reference_count(&a, x), 1);
    EXPECT_EQ(a.reference_count(x), 1);
}

TEST(Scope, ReferenceFromOutsideTheOwnerIsRejected){
    auto g = Scope::make_global();
    Scope a(g.get());
    Scope sibling(g.get());
    SymbolId x = a.add_variable("x");
    EXPECT_THROW(sibling.reference({&a, x}), scope_error);
}

TEST(Scope, SetParentAttachesADetachedRootOnce){
    auto counter = std::make_shared<SymbolCounter>();
    auto host_global = Scope::make_global(counter);
    Scope host(host_global.get());
    auto fragment_global = Scope::make_global(counter);
    Scope fragment(fragment_global.get());
    SymbolId f = fragment.add_variable("f");

    fragment.set_parent(&host);
    EXPECT_TRUE(fragment.attached());
    EXPECT_EQ(fragment.parent(), &host);
    EXPECT_EQ(fragment.global_scope(), host_global.get());
    EXPECT_TRUE(fragment_global->children().empty());
    EXPECT_EQ(fragment.resolve("f")->id, f);
    EXPECT_THROW(fragment.set_parent(&host), scope_error);
}

TEST(Scope, SetParentRejectsForeignCountersAndNestedScopes){
    auto host_global = Scope::make_global();
    Scope host(host_global.get());
    auto other_global = Scope::make_global();
    Scope other(other_global.get());
    EXPECT_THROW(other.set_parent(&host), scope_error);

    Scope nested(&host);
    Scope deeper(&nested);
    EXPECT_THROW(deeper.set_parent(&host), scope_error);
    EXPECT_THROW(host_global->set_parent(&host), scope_error);
}

TEST(Scope, SetParentRejectsLeftoverGlobalReferences){
    auto counter = std::make_shared<SymbolCounter>();
    auto host_global = Scope::make_global(counter);
    Scope host(host_global.get());
    auto fragment_global = Scope::make_global(counter);
    Scope fragment(fragment_global.get());
    fragment.reference(fragment.resolve_global("print"));
    EXPECT_THROW(fragment.set_parent(&host), scope_error);
}

TEST(Scope, MoveUnderCopiesTheLedgerToTheNewParent){
    auto g = Scope::make_global();
    auto body = std::make_unique<Scope>(g.get());
    Binding print = body->resolve_global("print");
    body->reference(print, 3);

    auto outer = std::make_unique<Scope>(g.get());
    body->move_under(outer.get());
    EXPECT_EQ(body->parent(), outer.get());
    EXPECT_EQ(outer->higher_reference_count(g.get(), print.id), 3);
    EXPECT_EQ(body->higher_reference_count(g.get(), print.id), 3);
    ASSERT_EQ(g->children().size(), 1u);
    EXPECT_EQ(g->children().front(), outer.get());

    Scope used(g.get());
    used.add_variable("x");
    EXPECT_THROW(outer->move_under(&used), scope_error);
}

TEST(Scope, AbsorbHidesSymbolsAndRekeysTheLedger){
    auto g = Scope::make_global();
    Scope host(g.get());
    auto inner = std::make_unique<Scope>(&host);
    Scope* inner_raw = inner.get();
    SymbolId hidden = inner->add_variable("helper");
    auto grandchild = std::make_unique<Scope>(inner_raw);
    grandchild->reference({inner_raw, hidden});

    host.absorb(std::move(inner));
    EXPECT_TRUE(host.declares(hidden));
    EXPECT_FALSE(host.resolve("helper"));
    EXPECT_EQ(grandchild->parent(), &host);
    EXPECT_EQ(grandchild->higher_reference_count(&host, hidden), 1);
    EXPECT_EQ(host.reference_count(hidden), 1);
}

TEST(Scope, AbsorbRequiresADirectChild){
    auto g = Scope::make_global();
    Scope host(g.get());
    auto stranger = std::make_unique<Scope>(g.get());
    EXPECT_THROW(host.absorb(std::move(stranger)), scope_error);
}

#include <gtest/gtest.h>
#include "shroud/ast.hpp"
#include "shroud/errors.hpp"

using namespace shroud;

namespace {

struct Tree {
    std::unique_ptr<Scope> globals = Scope::make_global();
    std::unique_ptr<Scope> body = std::make_unique<Scope>(globals.get());
};

} // namespace

TEST(Ast, KindPredicates){
    EXPECT_TRUE(is_statement(Kind::LocalDeclaration));
    EXPECT_TRUE(is_statement(Kind::Continue));
    EXPECT_FALSE(is_statement(Kind::Call));
    EXPECT_TRUE(is_expression(Kind::Call));
    EXPECT_TRUE(is_expression(Kind::Negate));
    EXPECT_FALSE(is_expression(Kind::Block));
    EXPECT_TRUE(is_binary(Kind::Concat));
    EXPECT_FALSE(is_binary(Kind::Not));
    EXPECT_TRUE(is_unary(Kind::Length));
    EXPECT_TRUE(is_compound(Kind::CompoundConcat));
    EXPECT_EQ(compound_operator(Kind::CompoundMod), Kind::Mod);
    EXPECT_THROW(compound_operator(Kind::Add), shape_error);
    EXPECT_STREQ(kind_name(Kind::FunctionLiteral), "FunctionLiteral");
}

TEST(Ast, TagsAreFixedAtConstruction){
    auto n = ast::number(3, {Tag::Generated, Tag::NoRewrite});
    EXPECT_TRUE(n->has(Tag::Generated));
    EXPECT_TRUE(n->has(Tag::NoRewrite));
    auto plain = ast::string("x");
    EXPECT_TRUE(plain->tags.empty());
}

TEST(Ast, PayloadMismatchIsShapeError){
    auto n = ast::number(1);
    EXPECT_DOUBLE_EQ(n->as<payload::Number>().value, 1.0);
    EXPECT_THROW(n->as<payload::String>(), shape_error);
}

TEST(Ast, RejectsMalformedNodes){
    Tree t;
    Binding x{t.body.get(), t.body->add_variable("x")};
    EXPECT_THROW(ast::unary(Kind::Add, ast::number(1)), shape_error);
    EXPECT_THROW(ast::binary(Kind::Not, ast::number(1), ast::number(2)), shape_error);
    EXPECT_THROW(ast::call(nullptr, {}), shape_error);
    EXPECT_THROW(ast::call_statement(ast::number(1)), shape_error);
    EXPECT_THROW(ast::local(t.body.get(), {}, {}), shape_error);
    EXPECT_THROW(ast::assignment(ast::list(ast::assign_variable(x)), {}), shape_error);
    // two targets, one single-valued expression
    EXPECT_THROW(ast::assignment(ast::list(ast::assign_variable(x), ast::assign_variable(x)), ast::list(ast::number(1))), shape_error);
    EXPECT_THROW(ast::to_target(ast::number(1)), shape_error);
    EXPECT_THROW(ast::if_chain({}, {}), shape_error);
    EXPECT_THROW(ast::block(nullptr, {}), shape_error);
}

TEST(Ast, AssignmentMayBeShortOnlyBeforeAMultiValue){
    Tree t;
    Binding a{t.body.get(), t.body->add_variable("a")};
    Binding b{t.body.get(), t.body->add_variable("b")};
    Binding f = t.body->resolve_global("f");
    auto stmt = ast::assignment(ast::list(ast::assign_variable(a), ast::assign_variable(b)),
                                ast::list(ast::call(ast::variable(f), {})));
    EXPECT_EQ(stmt->kind, Kind::Assignment);
    EXPECT_EQ(stmt->as<payload::Assign>().values.size(), 1u);
}

TEST(Ast, FunctionBodyMustBeAFunctionBlock){
    Tree t;
    auto inner = std::make_unique<Scope>(t.body.get());
    EXPECT_THROW(ast::function({}, false, ast::block(std::move(inner), {}, false)), shape_error);

    auto fs = std::make_unique<Scope>(t.body.get());
    Scope* raw_scope = fs.get();
    NodeList params = ast::list(ast::parameter({raw_scope, raw_scope->add_variable("p")}));
    auto fn = ast::function(std::move(params), true, ast::block(std::move(fs), {}, true));
    EXPECT_EQ(fn->kind, Kind::FunctionLiteral);
    EXPECT_TRUE(fn->as<payload::Function>().vararg);
}

TEST(Ast, ParametersBelongToTheBodyScope){
    Tree t;
    auto fs = std::make_unique<Scope>(t.body.get());
    Binding outside{t.body.get(), t.body->add_variable("p")};
    EXPECT_THROW(ast::function(ast::list(ast::parameter(outside)), false, ast::block(std::move(fs), {}, true)), shape_error);
}

TEST(Ast, CallStatementKeepsTheCall){
    Tree t;
    Binding print = t.body->resolve_global("print");
    auto c = ast::call(ast::variable(print), ast::list(ast::string("hi")));
    c->line = 4;
    auto s = ast::call_statement(std::move(c));
    EXPECT_EQ(s->kind, Kind::CallStatement);
    EXPECT_EQ(s->line, 4);
    EXPECT_EQ(s->as<payload::Call>().args.size(), 1u);

    auto m = ast::call_statement(ast::method_call(ast::variable(print), "m", {}));
    EXPECT_EQ(m->kind, Kind::MethodCallStatement);
}

TEST(Ast, MultiValueExpressions){
    Tree t;
    Binding f = t.body->resolve_global("f");
    EXPECT_TRUE(ast::is_multi_value(*ast::call(ast::variable(f), {})));
    EXPECT_TRUE(ast::is_multi_value(*ast::vararg()));
    EXPECT_FALSE(ast::is_multi_value(*ast::paren(ast::vararg())));
    EXPECT_FALSE(ast::is_multi_value(*ast::number(1)));
}

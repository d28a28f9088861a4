#include <gtest/gtest.h>
#include "test_util.hpp"
#include "shroud/errors.hpp"
#include "shroud/steps.hpp"
#include "shroud/verify.hpp"
#include "shroud/visit.hpp"
#include <cmath>

using namespace shroud;
using shroud_test::StepHarness;
using shroud_test::parse;
using shroud_test::print;

namespace {

const char* kProgram = R"lua(
local greeting = "hello"
local count = 42
local function shout(s, n)
    local out = s
    for i = 1, n do out = out .. "!" end
    return out
end
local t = {name = "box", size = 3}
t.size = t.size + 1
print(shout(greeting, count % 5), t.name, t["size"])
)lua";

// Re-parses printed output and checks the result is a consistent tree.
std::string settle(NodePtr& tree, PrintStyle style = PrintStyle::Line){
    std::string out = print(*tree, style);
    NodePtr again = parse(out);
    EXPECT_TRUE(verify_tree(again).ok()) << out;
    return out;
}

// Value of a constant expression built from numbers, arithmetic, comparison and and/or.
struct Value {
    bool boolean{false};
    bool truth{false};
    double number{0};
    bool truthy() const { return boolean ? truth : true; }
};

Value eval(const Node& n){
    switch(n.kind){
    case Kind::Number: return {false, false, n.as<payload::Number>().value};
    case Kind::Negate: return {false, false, -eval(*n.as<payload::Unary>().operand).number};
    case Kind::Equal: {
        const auto& b = n.as<payload::Binary>();
        return {true, eval(*b.lhs).number == eval(*b.rhs).number, 0};
    }
    case Kind::And: {
        const auto& b = n.as<payload::Binary>();
        Value l = eval(*b.lhs);
        return l.truthy() ? eval(*b.rhs) : l;
    }
    case Kind::Or: {
        const auto& b = n.as<payload::Binary>();
        Value l = eval(*b.lhs);
        return l.truthy() ? l : eval(*b.rhs);
    }
    default: break;
    }
    const auto& b = n.as<payload::Binary>();
    double l = eval(*b.lhs).number, r = eval(*b.rhs).number;
    switch(n.kind){
    case Kind::Add: return {false, false, l + r};
    case Kind::Sub: return {false, false, l - r};
    case Kind::Mul: return {false, false, l * r};
    case Kind::Div: return {false, false, l / r};
    default: throw shape_error(std::string("unexpected ") + kind_name(n.kind));
    }
}

bool contains(const std::string& haystack, const std::string& needle){ return haystack.find(needle) != std::string::npos; }

} // namespace

TEST(Cipher, DecryptInvertsEncrypt){
    std::string plain = std::string("bytes \0\xff and text", 17);
    std::string sealed = cipher::encrypt(plain, 4242);
    EXPECT_NE(sealed, plain);
    EXPECT_EQ(cipher::decrypt(sealed, 4242), plain);
}

TEST(Cipher, Base64MatchesTheStandardAlphabet){
    const char* standard = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    EXPECT_EQ(cipher::base64("Man", standard), "TWFu");
    EXPECT_EQ(cipher::base64("Ma", standard), "TWE=");
    EXPECT_EQ(cipher::base64("M", standard), "TQ==");
    EXPECT_EQ(cipher::base64("", standard), "");
    EXPECT_THROW(cipher::base64("x", "short"), config_error);
}

TEST(Steps, RegistryKnowsEveryBuiltin){
    StepRegistry r;
    register_builtin_steps(r);
    for(const char* n : {"EncryptStrings", "ConstantArray", "NumbersToExpressions", "ProxifyLocals", "AntiTamper", "WrapInFunction"})
        EXPECT_TRUE(r.contains(n)) << n;
    EXPECT_TRUE(r.contains("wrapinfunction"));
    EXPECT_EQ(r.create("constantarray")->name(), std::string("ConstantArray"));
    EXPECT_THROW(r.create("Vmify"), config_error);
}

TEST(Steps, EncryptStringsHidesLiterals){
    StepHarness h;
    NodePtr t = parse(kProgram);
    h.apply("EncryptStrings", t);
    std::string out = settle(t);
    EXPECT_FALSE(contains(out, "\"hello\""));
    EXPECT_FALSE(contains(out, "\"box\""));
    EXPECT_TRUE(contains(out, "string.byte"));
}

TEST(Steps, EncryptStringsWithZeroThresholdChangesNothing){
    StepHarness h;
    NodePtr t = parse(kProgram);
    std::string before = print(*t);
    h.apply("EncryptStrings", t, {{"Threshold", "0"}});
    EXPECT_EQ(print(*t), before);
}

TEST(Steps, ConstantArrayMovesStringsIntoTheArray){
    StepHarness h;
    NodePtr t = parse(kProgram);
    h.apply("ConstantArray", t, {{"Encoding", "none"}, {"StringsOnly", "true"}, {"Rotate", "false"}});
    std::string out = settle(t);
    // the literal survives only inside the array constructor
    auto first = out.find("\"hello\"");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(out.find("\"hello\"", first + 1), std::string::npos);
    EXPECT_LT(first, out.find("local greeting"));
    EXPECT_TRUE(contains(out, "local count = 42"));
}

TEST(Steps, ConstantArrayEncodesAndRotates){
    StepHarness h(99);
    NodePtr t = parse(kProgram);
    h.apply("ConstantArray", t);
    std::string out = settle(t);
    EXPECT_FALSE(contains(out, "\"hello\""));
    EXPECT_FALSE(contains(out, "= 42"));
    EXPECT_TRUE(contains(out, "table.insert"));
    EXPECT_TRUE(contains(out, "string.char"));
}

TEST(Steps, ConstantArrayDeduplicatesConstants){
    StepHarness h;
    NodePtr t = parse("print('a', 'a', 'b')");
    h.apply("ConstantArray", t, {{"Encoding", "none"}, {"Rotate", "false"}});
    const Node& arr = *shroud_test::chunk_block(t).as<payload::Block>().statements.front();
    ASSERT_EQ(arr.kind, Kind::LocalDeclaration);
    EXPECT_EQ(arr.as<payload::Local>().values.front()->as<payload::Table>().entries.size(), 2u);
}

TEST(Steps, NumbersToExpressionsPreservesValues){
    StepHarness h(7);
    NodePtr t = parse("local a, b, c, d = 42, -0, 0, 1000000");
    h.apply("NumbersToExpressions", t, {{"InternalThreshold", "0.8"}, {"MaxDepth", "4"}});
    const auto& values = shroud_test::chunk_block(t).as<payload::Block>().statements.front()->as<payload::Local>().values;
    EXPECT_NE(values[0]->kind, Kind::Number);
    EXPECT_DOUBLE_EQ(eval(*values[0]).number, 42);
    // the minus stays, only its operand is rewritten
    EXPECT_EQ(values[1]->kind, Kind::Negate);
    EXPECT_DOUBLE_EQ(eval(*values[2]).number, 0);
    EXPECT_DOUBLE_EQ(eval(*values[3]).number, 1000000);
    settle(t);
}

TEST(Steps, NumbersToExpressionsLeavesFractionsAlone){
    StepHarness h;
    NodePtr t = parse("local x = 0.5");
    h.apply("NumbersToExpressions", t);
    EXPECT_EQ(print(*t), "local x = 0.5");
}

TEST(Steps, ProxifyLocalsWrapsEligibleLocals){
    for(const char* literal : {"dictionary", "number", "string", "any"}){
        StepHarness h(11);
        NodePtr t = parse(kProgram);
        h.apply("ProxifyLocals", t, {{"LiteralType", literal}});
        std::string out = settle(t);
        EXPECT_TRUE(contains(out, "setmetatable")) << literal;
        EXPECT_TRUE(contains(out, "rawget")) << literal;
        EXPECT_TRUE(contains(out, "rawset")) << literal;
    }
}

TEST(Steps, ProxifyLocalsKeepsLockedSymbols){
    StepHarness h;
    NodePtr t = parse("local M = {}; function M.f() end; local a, b = g(); for i = 1, 2 do print(i, a, b) end; return M");
    h.apply("ProxifyLocals", t);
    EXPECT_EQ(print(*t), "local M = {}; function M.f() end; local a, b = g(); for i = 1, 2 do print(i, a, b) end; return M");
}

TEST(Steps, ProxifyLocalsHandlesAssignmentForms){
    StepHarness h(5, Dialect::LuaU);
    NodePtr t = parse("local x, y = 1, 2; x = 3; x, y = y, x; x += 1; print(x, y)", Dialect::LuaU);
    h.apply("ProxifyLocals", t);
    NodePtr again = parse(print(*t), Dialect::LuaU);
    EXPECT_TRUE(verify_tree(again).ok());
}

TEST(Steps, AntiTamperPrependsAGuard){
    StepHarness h;
    NodePtr t = parse("print(1)");
    h.apply("AntiTamper", t);
    std::string out = settle(t);
    EXPECT_EQ(out.rfind("do ", 0), 0u);
    EXPECT_TRUE(contains(out, "pcall"));
    EXPECT_TRUE(contains(out, "getinfo"));
    EXPECT_TRUE(contains(out, "print(1)"));
}

TEST(Steps, AntiTamperWithoutDebug){
    StepHarness h;
    NodePtr t = parse("print(1)");
    h.apply("AntiTamper", t, {{"UseDebug", "false"}});
    std::string out = settle(t);
    EXPECT_FALSE(contains(out, "getinfo"));
}

TEST(Steps, AntiTamperSkipsPrettyOutput){
    StepHarness h(1234, Dialect::Lua51, true);
    NodePtr t = parse("print(1)");
    h.apply("AntiTamper", t);
    EXPECT_EQ(print(*t), "print(1)");
}

TEST(Steps, WrapInFunctionWrapsTheChunk){
    StepHarness h;
    NodePtr t = parse("print(...)");
    h.apply("WrapInFunction", t);
    EXPECT_EQ(settle(t), "return (function(...) print(...) end)(...)");

    NodePtr twice = parse("local x = 1; return x");
    h.apply("WrapInFunction", twice, {{"Iterations", "2"}});
    EXPECT_EQ(settle(twice), "return (function(...) return (function(...) local x = 1; return x end)(...) end)(...)");
}

TEST(Steps, StepsRequireATopNode){
    StepHarness h;
    auto step = h.registry.create("WrapInFunction");
    step->configure(resolve_settings(step->name(), step->schema(), {}));
    NodePtr n = ast::nil();
    EXPECT_THROW(step->apply(n, h.ctx), shape_error);
}

TEST(Steps, AllStepsComposeInOrder){
    StepHarness h(2024);
    NodePtr t = parse(kProgram);
    for(const char* s : {"EncryptStrings", "AntiTamper", "ConstantArray", "ProxifyLocals", "NumbersToExpressions", "WrapInFunction"})
        h.apply(s, t);
    settle(t, PrintStyle::Minify);
    settle(t, PrintStyle::Pretty);
}

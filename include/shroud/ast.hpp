#pragma once
#include "shroud/scope.hpp"
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace shroud {

enum class Kind : std::uint8_t {
    Top, Block,
    // statements
    Do, While, Repeat, If, NumericFor, GenericFor,
    FunctionDeclaration, LocalFunctionDeclaration, LocalDeclaration,
    Assignment, CompoundAdd, CompoundSub, CompoundMul, CompoundDiv, CompoundMod, CompoundPow, CompoundConcat,
    CallStatement, MethodCallStatement, Return, Break, Continue,
    // assignment targets
    AssignVariable, AssignIndex,
    // function parameter declarations
    Parameter,
    // expressions
    Nil, Boolean, Number, String, Vararg, Variable, Index, Call, MethodCall, FunctionLiteral, Table, Paren,
    Or, And, Less, Greater, LessEqual, GreaterEqual, NotEqual, Equal, Concat, Add, Sub, Mul, Div, Mod, Pow,
    Not, Length, Negate,
    // table constructor entries
    Entry, KeyedEntry,
};

const char* kind_name(Kind k);
bool is_statement(Kind k);
bool is_expression(Kind k);
bool is_binary(Kind k);
bool is_unary(Kind k);
bool is_compound(Kind k);
// Binary operator kind a compound assignment applies (CompoundAdd -> Add).
Kind compound_operator(Kind k);

// Pass-authored markers, fixed when the node is built.
enum class Tag : std::uint8_t { Generated = 1, NoRewrite = 2 };

class TagSet {
public:
    TagSet() = default;
    TagSet(std::initializer_list<Tag> tags){ for(Tag t : tags) bits_ |= static_cast<std::uint8_t>(t); }
    bool has(Tag t) const { return (bits_ & static_cast<std::uint8_t>(t)) != 0; }
    bool empty() const { return bits_ == 0; }
private:
    std::uint8_t bits_{0};
};

struct Node;
using NodePtr = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

namespace payload {
struct None {};
struct Top { std::unique_ptr<Scope> globals; NodePtr body; };
// `function_block`: body of a function literal or of the chunk itself.
struct Block { std::unique_ptr<Scope> scope; NodeList statements; bool function_block{false}; };
struct Boolean { bool value{false}; };
struct Number { double value{0}; };
struct String { std::string value; };
// Variable, AssignVariable, Parameter. `binding.scope` is the declaring scope.
struct Variable { Binding binding; };
// Not, Length, Negate, Paren
struct Unary { NodePtr operand; };
struct Binary { NodePtr lhs; NodePtr rhs; };
// Index, AssignIndex
struct Index { NodePtr base; NodePtr key; };
// Call, MethodCall, CallStatement, MethodCallStatement. `method` empty for plain calls.
struct Call { NodePtr callee; std::string method; NodeList args; };
// FunctionLiteral. Parameters are Parameter nodes declared in the body block's scope.
struct Function { NodeList params; bool vararg{false}; NodePtr body; };
// FunctionDeclaration (`function a.b.c:m()`, name is a reference) and
// LocalFunctionDeclaration (name declared in the enclosing scope). `function` is a FunctionLiteral;
// with a method name its first parameter is the implicit `self`.
struct FunctionDecl { Binding name; std::vector<std::string> path; std::string method; NodePtr function; };
struct Local { Scope* scope{nullptr}; std::vector<SymbolId> ids; NodeList values; };
// Assignment and compound assignments
struct Assign { NodeList targets; NodeList values; };
// Return
struct List { NodeList items; };
struct If { NodeList conditions; NodeList blocks; NodePtr otherwise; };
// While, Repeat (condition) and Do (no condition)
struct Loop { NodePtr condition; NodePtr body; };
// The loop variable is declared in the body block's scope.
struct NumericFor { Binding var; NodePtr start; NodePtr limit; NodePtr step; NodePtr body; };
struct GenericFor { Scope* scope{nullptr}; std::vector<SymbolId> ids; NodeList exprs; NodePtr body; };
struct Table { NodeList entries; };
// Entry (no key) and KeyedEntry
struct Entry { NodePtr key; NodePtr value; };
} // namespace payload

using Payload = std::variant<payload::None, payload::Top, payload::Block, payload::Boolean, payload::Number,
    payload::String, payload::Variable, payload::Unary, payload::Binary, payload::Index, payload::Call,
    payload::Function, payload::FunctionDecl, payload::Local, payload::Assign, payload::List, payload::If,
    payload::Loop, payload::NumericFor, payload::GenericFor, payload::Table, payload::Entry>;

struct Node {
    const Kind kind;
    Payload data;
    const TagSet tags;
    int line{0};

    Node(Kind k, Payload p, TagSet t = {}) : kind(k), data(std::move(p)), tags(t) {}
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    bool has(Tag t) const { return tags.has(t); }

    // Typed payload access; a mismatch is a shape_error.
    template<typename T> T& as(){
        if(auto* p = std::get_if<T>(&data)) return *p;
        throw_bad_payload();
    }
    template<typename T> const T& as() const {
        if(auto* p = std::get_if<T>(&data)) return *p;
        throw_bad_payload();
    }
private:
    [[noreturn]] void throw_bad_payload() const;
};

// Well-formed node constructors. Each enforces its kind's shape and throws shape_error.
namespace ast {
NodePtr top(std::unique_ptr<Scope> globals, NodePtr body);
NodePtr block(std::unique_ptr<Scope> scope, NodeList statements, bool function_block = false);

NodePtr nil(TagSet t = {});
NodePtr boolean(bool v, TagSet t = {});
NodePtr number(double v, TagSet t = {});
NodePtr string(std::string v, TagSet t = {});
NodePtr vararg(TagSet t = {});
NodePtr variable(Binding b, TagSet t = {});
NodePtr parameter(Binding b);
NodePtr index(NodePtr base, NodePtr key, TagSet t = {});
NodePtr call(NodePtr callee, NodeList args, TagSet t = {});
NodePtr method_call(NodePtr base, std::string method, NodeList args, TagSet t = {});
NodePtr function(NodeList params, bool vararg, NodePtr body, TagSet t = {});
NodePtr table(NodeList entries, TagSet t = {});
NodePtr entry(NodePtr value);
NodePtr keyed_entry(NodePtr key, NodePtr value);
NodePtr paren(NodePtr inner, TagSet t = {});
NodePtr unary(Kind k, NodePtr operand, TagSet t = {});
NodePtr binary(Kind k, NodePtr lhs, NodePtr rhs, TagSet t = {});

NodePtr assign_variable(Binding b);
NodePtr assign_index(NodePtr base, NodePtr key);
// Converts a Variable/Index expression into the matching assignment target.
NodePtr to_target(NodePtr expr);

NodePtr do_block(NodePtr body);
NodePtr while_loop(NodePtr cond, NodePtr body);
NodePtr repeat_loop(NodePtr body, NodePtr cond);
NodePtr if_chain(NodeList conditions, NodeList blocks, NodePtr otherwise = nullptr);
NodePtr numeric_for(Binding var, NodePtr start, NodePtr limit, NodePtr step, NodePtr body);
NodePtr generic_for(Scope* scope, std::vector<SymbolId> ids, NodeList exprs, NodePtr body);
NodePtr function_declaration(Binding name, std::vector<std::string> path, std::string method, NodePtr fn);
NodePtr local_function(Binding name, NodePtr fn);
NodePtr local(Scope* scope, std::vector<SymbolId> ids, NodeList values);
NodePtr assignment(NodeList targets, NodeList values);
NodePtr compound(Kind k, NodePtr target, NodePtr value);
// Wraps a Call/MethodCall expression as a statement.
NodePtr call_statement(NodePtr call);
NodePtr return_stat(NodeList values);
NodePtr break_stat();
NodePtr continue_stat();

// True for expressions that may yield more than one value (calls, `...`).
bool is_multi_value(const Node& n);
// Convenience for building NodeLists from move-only nodes.
template<typename... Ts> NodeList list(Ts&&... ns){
    NodeList out; out.reserve(sizeof...(Ts));
    (out.push_back(std::forward<Ts>(ns)), ...);
    return out;
}
} // namespace ast

} // namespace shroud

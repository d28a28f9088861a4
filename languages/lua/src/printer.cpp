#include "shroud_lua/printer.hpp"
#include "shroud/errors.hpp"
#include "shroud/names.hpp"
#include <llvm/Support/raw_ostream.h>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace shroud::lua {

std::string quote(std::string_view bytes){
    std::string out = "\"";
    for(char ch : bytes){
        unsigned char c = static_cast<unsigned char>(ch);
        switch(c){
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:
            if(c >= 32 && c < 127) out += ch;
            else {
                char buf[5];
                std::snprintf(buf, sizeof buf, "\\%03u", static_cast<unsigned>(c));
                out += buf;
            }
        }
    }
    out += '"';
    return out;
}

std::string format_number(double v){
    if(std::isnan(v)) return "(0/0)";
    if(std::isinf(v)) return v > 0 ? "(1/0)" : "(-1/0)";
    char buf[64];
    if(v == std::floor(v) && std::fabs(v) < 1e16){
        if(v == 0 && std::signbit(v)) return "-0";
        std::snprintf(buf, sizeof buf, "%.0f", v);
        return buf;
    }
    for(int p = 1; p <= 17; ++p){
        std::snprintf(buf, sizeof buf, "%.*g", p, v);
        if(std::strtod(buf, nullptr) == v) break;
    }
    return buf;
}

namespace {

using namespace payload;

int precedence(const Node& n){
    switch(n.kind){
    case Kind::Or: return 1;
    case Kind::And: return 2;
    case Kind::Less: case Kind::Greater: case Kind::LessEqual: case Kind::GreaterEqual:
    case Kind::NotEqual: case Kind::Equal: return 3;
    case Kind::Concat: return 4;
    case Kind::Add: case Kind::Sub: return 5;
    case Kind::Mul: case Kind::Div: case Kind::Mod: return 6;
    case Kind::Not: case Kind::Length: case Kind::Negate: return 7;
    case Kind::Pow: return 8;
    case Kind::Number: {
        double v = n.as<payload::Number>().value;
        return !std::isnan(v) && !std::isinf(v) && std::signbit(v) ? 7 : 10;
    }
    default: return 10;
    }
}

bool right_assoc(Kind k){ return k == Kind::Concat || k == Kind::Pow; }

const char* op_text(Kind k){
    switch(k){
    case Kind::Or: return "or";
    case Kind::And: return "and";
    case Kind::Less: return "<";
    case Kind::Greater: return ">";
    case Kind::LessEqual: return "<=";
    case Kind::GreaterEqual: return ">=";
    case Kind::NotEqual: return "~=";
    case Kind::Equal: return "==";
    case Kind::Concat: return "..";
    case Kind::Add: return "+";
    case Kind::Sub: return "-";
    case Kind::Mul: return "*";
    case Kind::Div: return "/";
    case Kind::Mod: return "%";
    case Kind::Pow: return "^";
    case Kind::Not: return "not";
    case Kind::Length: return "#";
    case Kind::Negate: return "-";
    case Kind::CompoundAdd: return "+=";
    case Kind::CompoundSub: return "-=";
    case Kind::CompoundMul: return "*=";
    case Kind::CompoundDiv: return "/=";
    case Kind::CompoundMod: return "%=";
    case Kind::CompoundPow: return "^=";
    case Kind::CompoundConcat: return "..=";
    default: return "?";
    }
}

bool is_prefix(const Node& n){
    return n.kind == Kind::Variable || n.kind == Kind::Index || n.kind == Kind::Call
        || n.kind == Kind::MethodCall || n.kind == Kind::Paren;
}

std::string name_of(const Binding& b){ return b.scope->variable_name(b.id); }

class Writer {
public:
    Writer(llvm::raw_ostream& os, const PrintOptions& o) : os_(os), opt_(o) {}

    void chunk(const Node& top){
        if(top.kind != Kind::Top) throw shape_error("printer expects a Top node");
        const auto& stmts = top.as<Top>().body->as<Block>().statements;
        for(std::size_t i = 0; i < stmts.size(); ++i){
            if(i > 0) separator(*stmts[i]);
            else if(opt_.style != PrintStyle::Pretty && starts_with_paren(*stmts[i])) put(";");
            statement(*stmts[i]);
        }
        if(opt_.style == PrintStyle::Pretty && !stmts.empty()) os_ << '\n';
    }

private:
    // tokens
    static bool word(char c){ return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

    void put(std::string_view t, bool number = false){
        if(t.empty()) return;
        char f = t.front();
        bool space = (word(last_) && word(f)) || (last_ == '-' && f == '-') || (last_number_ && f == '.')
            || (last_ == '.' && f == '.') || (last_ == '[' && (f == '[' || f == '='));
        if(space) os_ << ' ';
        os_ << t;
        last_ = t.back();
        last_number_ = number;
    }
    void sp(){
        if(opt_.style == PrintStyle::Minify) return;
        os_ << ' ';
        last_ = ' ';
        last_number_ = false;
    }
    void newline(){
        os_ << '\n';
        for(int i = 0; i < depth_; ++i) os_ << opt_.indent;
        last_ = ' ';
        last_number_ = false;
    }
    void comma(){ put(","); sp(); }

    void separator(const Node& next){
        switch(opt_.style){
        case PrintStyle::Pretty:
            newline();
            if(starts_with_paren(next)) put(";");
            break;
        case PrintStyle::Line: put(";"); sp(); break;
        case PrintStyle::Minify: put(";"); break;
        }
    }

    static const Node& leftmost(const Node& n){
        switch(n.kind){
        case Kind::Index: case Kind::AssignIndex: return leftmost(*n.as<payload::Index>().base);
        case Kind::Call: case Kind::MethodCall: case Kind::CallStatement: case Kind::MethodCallStatement:
            return leftmost(*n.as<payload::Call>().callee);
        default: return n;
        }
    }
    // A statement whose text begins with '(' would continue the previous call.
    static bool starts_with_paren(const Node& s){
        if(s.kind == Kind::CallStatement || s.kind == Kind::MethodCallStatement) return leftmost(s).kind != Kind::Variable;
        if(s.kind == Kind::Assignment || is_compound(s.kind)){
            const Node& t = *s.as<Assign>().targets.front();
            return t.kind == Kind::AssignIndex && leftmost(t).kind != Kind::Variable;
        }
        return false;
    }

    // blocks: called right after the opening keyword; the caller writes the closing keyword
    void body(const Node& block){
        const auto& stmts = block.as<Block>().statements;
        switch(opt_.style){
        case PrintStyle::Pretty:
            ++depth_;
            for(std::size_t i = 0; i < stmts.size(); ++i){
                newline();
                if(starts_with_paren(*stmts[i])) put(";");
                statement(*stmts[i]);
            }
            --depth_;
            newline();
            break;
        case PrintStyle::Line:
            for(std::size_t i = 0; i < stmts.size(); ++i){
                if(i > 0) put(";");
                sp();
                statement(*stmts[i]);
            }
            sp();
            break;
        case PrintStyle::Minify:
            for(std::size_t i = 0; i < stmts.size(); ++i){
                if(i > 0 || starts_with_paren(*stmts[i])) put(";");
                statement(*stmts[i]);
            }
            break;
        }
    }

    void exprs(const NodeList& l){
        for(std::size_t i = 0; i < l.size(); ++i){
            if(i > 0) comma();
            expr(*l[i]);
        }
    }

    void function_tail(const Function& f, bool skip_self){
        put("(");
        bool first = true;
        for(std::size_t i = skip_self ? 1 : 0; i < f.params.size(); ++i){
            if(!first) comma();
            put(name_of(f.params[i]->as<Variable>().binding));
            first = false;
        }
        if(f.vararg){
            if(!first) comma();
            put("...");
        }
        put(")");
        body(*f.body);
        put("end");
    }

    void statement(const Node& n){
        switch(n.kind){
        case Kind::LocalDeclaration: {
            const auto& l = n.as<Local>();
            put("local");
            for(std::size_t i = 0; i < l.ids.size(); ++i){
                if(i > 0) comma();
                put(l.scope->variable_name(l.ids[i]));
            }
            if(!l.values.empty()){ sp(); put("="); sp(); exprs(l.values); }
            break;
        }
        case Kind::LocalFunctionDeclaration: {
            const auto& d = n.as<FunctionDecl>();
            put("local"); put("function"); put(name_of(d.name));
            function_tail(d.function->as<Function>(), false);
            break;
        }
        case Kind::FunctionDeclaration: {
            const auto& d = n.as<FunctionDecl>();
            put("function");
            put(name_of(d.name));
            for(auto& p : d.path){ put("."); put(p); }
            if(!d.method.empty()){ put(":"); put(d.method); }
            function_tail(d.function->as<Function>(), !d.method.empty());
            break;
        }
        case Kind::Assignment: {
            const auto& a = n.as<Assign>();
            exprs(a.targets);
            sp(); put("="); sp();
            exprs(a.values);
            break;
        }
        case Kind::CallStatement: case Kind::MethodCallStatement: call(n.as<Call>()); break;
        case Kind::Return:
            put("return");
            if(!n.as<List>().items.empty()){ sp(); exprs(n.as<List>().items); }
            break;
        case Kind::Break: put("break"); break;
        case Kind::Continue: put("continue"); break;
        case Kind::Do:
            put("do"); body(*n.as<Loop>().body); put("end");
            break;
        case Kind::While: {
            const auto& l = n.as<Loop>();
            put("while"); sp(); expr(*l.condition); sp(); put("do");
            body(*l.body); put("end");
            break;
        }
        case Kind::Repeat: {
            const auto& l = n.as<Loop>();
            put("repeat"); body(*l.body); put("until"); sp(); expr(*l.condition);
            break;
        }
        case Kind::If: {
            const auto& i = n.as<If>();
            for(std::size_t k = 0; k < i.conditions.size(); ++k){
                put(k == 0 ? "if" : "elseif"); sp();
                expr(*i.conditions[k]); sp();
                put("then");
                body(*i.blocks[k]);
            }
            if(i.otherwise){ put("else"); body(*i.otherwise); }
            put("end");
            break;
        }
        case Kind::NumericFor: {
            const auto& f = n.as<NumericFor>();
            put("for"); put(name_of(f.var)); sp(); put("="); sp();
            expr(*f.start); comma(); expr(*f.limit);
            if(f.step){ comma(); expr(*f.step); }
            sp(); put("do"); body(*f.body); put("end");
            break;
        }
        case Kind::GenericFor: {
            const auto& f = n.as<GenericFor>();
            put("for");
            for(std::size_t i = 0; i < f.ids.size(); ++i){
                if(i > 0) comma();
                put(f.scope->variable_name(f.ids[i]));
            }
            put("in"); sp(); exprs(f.exprs); sp(); put("do");
            body(*f.body); put("end");
            break;
        }
        default:
            if(is_compound(n.kind)){
                const auto& a = n.as<Assign>();
                expr(*a.targets.front()); sp(); put(op_text(n.kind)); sp(); expr(*a.values.front());
                break;
            }
            throw shape_error(std::string("cannot print statement ") + kind_name(n.kind));
        }
    }

    void prefix(const Node& n){
        if(is_prefix(n)) expr(n);
        else { put("("); expr(n); put(")"); }
    }

    void call(const Call& c){
        prefix(*c.callee);
        if(!c.method.empty()){ put(":"); put(c.method); }
        put("(");
        exprs(c.args);
        put(")");
    }

    void operand(const Node& n, bool paren){
        if(paren){ put("("); expr(n); put(")"); }
        else expr(n);
    }

    void expr(const Node& n){
        switch(n.kind){
        case Kind::Nil: put("nil"); return;
        case Kind::Boolean: put(n.as<payload::Boolean>().value ? "true" : "false"); return;
        case Kind::Number: put(format_number(n.as<payload::Number>().value), true); return;
        case Kind::String: put(quote(n.as<payload::String>().value)); return;
        case Kind::Vararg: put("..."); return;
        case Kind::Variable: case Kind::AssignVariable: put(name_of(n.as<Variable>().binding)); return;
        case Kind::Index: case Kind::AssignIndex: {
            const auto& i = n.as<payload::Index>();
            prefix(*i.base);
            if(i.key->kind == Kind::String && is_lua_identifier(i.key->as<payload::String>().value)){
                put("."); put(i.key->as<payload::String>().value);
            } else {
                put("["); expr(*i.key); put("]");
            }
            return;
        }
        case Kind::Call: case Kind::MethodCall: call(n.as<Call>()); return;
        case Kind::FunctionLiteral: put("function"); function_tail(n.as<Function>(), false); return;
        case Kind::Paren: put("("); expr(*n.as<Unary>().operand); put(")"); return;
        case Kind::Table: {
            const auto& t = n.as<payload::Table>();
            put("{");
            for(std::size_t i = 0; i < t.entries.size(); ++i){
                if(i > 0) comma();
                const Node& e = *t.entries[i];
                const auto& en = e.as<Entry>();
                if(e.kind == Kind::KeyedEntry){
                    if(en.key->kind == Kind::String && is_lua_identifier(en.key->as<payload::String>().value))
                        put(en.key->as<payload::String>().value);
                    else { put("["); expr(*en.key); put("]"); }
                    sp(); put("="); sp();
                }
                expr(*en.value);
            }
            put("}");
            return;
        }
        case Kind::Not: case Kind::Length: case Kind::Negate: {
            const Node& o = *n.as<Unary>().operand;
            put(op_text(n.kind));
            operand(o, precedence(o) < precedence(n));
            return;
        }
        default: break;
        }
        if(!is_binary(n.kind)) throw shape_error(std::string("cannot print expression ") + kind_name(n.kind));
        const auto& b = n.as<Binary>();
        int p = precedence(n);
        bool ra = right_assoc(n.kind);
        operand(*b.lhs, ra ? precedence(*b.lhs) <= p : precedence(*b.lhs) < p);
        sp(); put(op_text(n.kind)); sp();
        operand(*b.rhs, ra ? precedence(*b.rhs) < p : precedence(*b.rhs) <= p);
    }

    llvm::raw_ostream& os_;
    const PrintOptions& opt_;
    int depth_{0};
    char last_{'\0'};
    bool last_number_{false};
};

} // namespace

void Printer::print(const Node& root, const PrintOptions& options, llvm::raw_ostream& os){
    Writer w(os, options);
    w.chunk(root);
}

} // namespace shroud::lua

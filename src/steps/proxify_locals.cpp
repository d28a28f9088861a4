#include "shroud/steps.hpp"
#include "shroud/log.hpp"
#include "shroud/visit.hpp"
#include "support.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace shroud {

namespace {

using namespace steps_detail;

const char* metamethod(Kind k){
    switch(k){
    case Kind::Add: return "__add";
    case Kind::Sub: return "__sub";
    case Kind::Mul: return "__mul";
    case Kind::Div: return "__div";
    case Kind::Mod: return "__mod";
    case Kind::Pow: return "__pow";
    case Kind::Concat: return "__concat";
    case Kind::Negate: return "__unm";
    case Kind::Length: return "__len";
    default: throw shape_error(std::string("no metamethod for ") + kind_name(k));
    }
}

const std::vector<std::string>& dictionary(){
    static const std::vector<std::string> words{
        "value", "count", "index", "buffer", "result", "state", "handle", "cache", "entry", "offset",
        "length", "target", "source", "option", "flag", "context", "record", "stream", "token", "node"};
    return words;
}

// How one local is stored: a table holding the value under `key`, read through `get` and written through `set`.
struct Proxy {
    Kind get;
    Kind set;
    std::string key;
};

using Symbol = std::pair<const Scope*, SymbolId>;

class ProxifyLocals : public Step {
public:
    const char* name() const override { return "ProxifyLocals"; }
    const char* description() const override { return "Keeps locals inside metatable proxies read and written through operators"; }
    const SettingsSchema& schema() const override {
        static const SettingsSchema s{
            {"LiteralType", SettingType::Enum, std::string("string"), std::nullopt, std::nullopt,
                {"dictionary", "number", "string", "any"}, "Kind of operand paired with a proxy on reads"},
        };
        return s;
    }
    void configure(const Settings& s) override { literal_type_ = s.text("LiteralType"); }

    void apply(NodePtr& root, PipelineContext& ctx) override {
        ctx_ = &ctx;
        Node& body = chunk_block(root);
        Scope* scope = chunk_scope(root);

        // Only plain `local` declarations qualify; parameters, loop variables, local functions,
        // names assigned by `function x.y()` and multi-value declarations stay as they are.
        std::set<Symbol> eligible, locked;
        Callback scan = [&](NodePtr& slot, VisitContext&) -> Action {
            const Node& n = *slot;
            if(n.kind == Kind::LocalDeclaration){
                const auto& l = n.as<payload::Local>();
                bool multi = !l.values.empty() && l.values.size() < l.ids.size() && ast::is_multi_value(*l.values.back());
                if(!multi) for(SymbolId id : l.ids) eligible.insert({l.scope, id});
            } else if(n.kind == Kind::FunctionDeclaration){
                const auto& b = n.as<payload::FunctionDecl>().name;
                locked.insert({b.scope, b.id});
            }
            return keep();
        };
        traverse(root, scan, nullptr);
        for(auto& s : locked) eligible.erase(s);
        if(eligible.empty()){
            log::debug(name(), "no eligible local");
            return;
        }

        setmetatable_ = Binding{scope, scope->add_variable()};
        empty_ = Binding{scope, scope->add_variable()};
        proxies_.clear();
        for(auto& s : eligible) proxies_.emplace(s, make_proxy());

        NodeSet ignored;
        auto proxy_of = [&](const Binding& b) -> const Proxy* {
            auto it = proxies_.find({b.scope, b.id});
            return it == proxies_.end() ? nullptr : &it->second;
        };

        Callback pre = [&](NodePtr& slot, VisitContext& v) -> Action {
            Node& n = *slot;
            if(n.kind != Kind::Assignment && !is_compound(n.kind)) return keep();
            auto& a = n.as<payload::Assign>();
            if(n.kind == Kind::Assignment && a.targets.size() == 1 && a.targets[0]->kind == Kind::AssignVariable){
                Binding b = a.targets[0]->as<payload::Variable>().binding;
                if(const Proxy* p = proxy_of(b)){
                    // x = v  ->  EMPTY(x <set> v); the target's ledger entry moves to the new read
                    NodePtr x = ast::variable(b);
                    ignored.insert(x.get());
                    NodePtr write = ast::binary(p->set, std::move(x), std::move(a.values[0]), {Tag::Generated});
                    return replace(ast::call_statement(ast::call(v.reference(empty_), ast::list(std::move(write)), {Tag::Generated})));
                }
            }
            for(auto& t : a.targets){
                if(t->kind != Kind::AssignVariable) continue;
                Binding b = t->as<payload::Variable>().binding;
                const Proxy* p = proxy_of(b);
                if(!p) continue;
                NodePtr x = ast::variable(b);
                ignored.insert(x.get());
                t = ast::assign_index(std::move(x), key_expr(p->key));
            }
            return keep();
        };

        std::size_t reads = 0;
        Callback post = [&](NodePtr& slot, VisitContext& v) -> Action {
            Node& n = *slot;
            if(n.kind == Kind::Variable){
                if(ignored.count(&n)) return keep();
                const Proxy* p = proxy_of(n.as<payload::Variable>().binding);
                if(!p) return keep();
                ++reads;
                NodePtr x = std::move(slot);
                if(p->get == Kind::Negate || p->get == Kind::Length) return replace(ast::unary(p->get, std::move(x), {Tag::Generated}));
                return replace(ast::binary(p->get, std::move(x), literal(), {Tag::Generated}));
            }
            if(n.kind == Kind::LocalDeclaration){
                auto& l = n.as<payload::Local>();
                for(std::size_t i = 0; i < l.ids.size(); ++i){
                    const Proxy* p = proxy_of(Binding{l.scope, l.ids[i]});
                    if(!p) continue;
                    while(l.values.size() <= i) l.values.push_back(ast::nil());
                    l.values[i] = wrap(*p, std::move(l.values[i]), v);
                }
            }
            return keep();
        };
        traverse(root, pre, post);

        // local SETMT = setmetatable; local EMPTY = function() end
        auto& statements = body.as<payload::Block>().statements;
        Binding global = scope->resolve_global("setmetatable");
        scope->reference(global);
        NodePtr empty_fn = ast::function({}, false, ast::block(std::make_unique<Scope>(scope), {}, true), {Tag::Generated});
        statements.insert(statements.begin(), ast::local(scope, {empty_.id}, ast::list(std::move(empty_fn))));
        statements.insert(statements.begin(), ast::local(scope, {setmetatable_.id}, ast::list(ast::variable(global))));

        log::info(name(), "proxified " + std::to_string(proxies_.size()) + " local(s), " + std::to_string(reads) + " read(s)");
        proxies_.clear();
        ctx_ = nullptr;
    }

private:
    Proxy make_proxy(){
        std::vector<Kind> ops{Kind::Add, Kind::Sub, Kind::Mul, Kind::Div, Kind::Mod, Kind::Pow, Kind::Concat};
        std::shuffle(ops.begin(), ops.end(), ctx_->rng());
        Proxy p{ops[0], ops[1], ctx_->generate_name()};
        // unary reads; `#` only reaches __len on tables in Luau
        double unary = ctx_->random();
        if(unary < 0.15) p.get = Kind::Negate;
        else if(unary < 0.25 && ctx_->dialect() == Dialect::LuaU) p.get = Kind::Length;
        return p;
    }

    // "valueName" -> "val" .. "ueN" .. "ame"
    NodePtr key_expr(const std::string& key){
        if(key.size() < 4) return ast::string(key, {Tag::Generated});
        NodePtr out;
        for(std::size_t at = 0; at < key.size();){
            std::size_t len = static_cast<std::size_t>(ctx_->random_int(2, (long long)std::min<std::size_t>(4, key.size() - at)));
            if(key.size() - at == 1) len = 1;
            NodePtr part = ast::string(key.substr(at, len), {Tag::Generated});
            out = out ? ast::binary(Kind::Concat, std::move(out), std::move(part), {Tag::Generated}) : std::move(part);
            at += len;
        }
        return out;
    }

    NodePtr literal(){
        std::string type = literal_type_;
        if(type == "any"){
            static const char* kinds[] = {"dictionary", "number", "string"};
            type = kinds[ctx_->random_int(0, 2)];
        }
        if(type == "number") return ast::number(static_cast<double>(ctx_->random_int(-65536, 65536)), {Tag::Generated});
        if(type == "dictionary"){
            const auto& words = dictionary();
            return ast::string(words[static_cast<std::size_t>(ctx_->random_int(0, (long long)words.size() - 1))], {Tag::Generated});
        }
        return ast::string(ctx_->generate_name(), {Tag::Generated});
    }

    // function(self, arg) return rawget(self, KEY) end / function(self, arg) rawset(self, KEY, arg) end
    NodePtr accessor(Scope* site, const Proxy& p, bool setter){
        auto body_scope = std::make_unique<Scope>(site);
        Scope* fs = body_scope.get();
        Binding self{fs, fs->add_variable()};
        Binding arg{fs, fs->add_variable()};
        auto use = [fs](Binding b){ fs->reference(b); return ast::variable(b); };
        Binding raw = fs->resolve_global(setter ? "rawset" : "rawget");
        NodeList stmts;
        if(setter){
            stmts.push_back(ast::call_statement(ast::call(use(raw), ast::list(use(self), key_expr(p.key), use(arg)))));
        } else {
            stmts.push_back(ast::return_stat(ast::list(ast::call(use(raw), ast::list(use(self), key_expr(p.key))))));
        }
        return ast::function(ast::list(ast::parameter(self), ast::parameter(arg)), false,
            ast::block(std::move(body_scope), std::move(stmts), true), {Tag::Generated});
    }

    // SETMT({[KEY] = value}, {__<set> = setter, __<get> = getter})
    NodePtr wrap(const Proxy& p, NodePtr value, VisitContext& v){
        NodeList meta;
        meta.push_back(ast::keyed_entry(ast::string(metamethod(p.set), {Tag::Generated}), accessor(v.scope, p, true)));
        meta.push_back(ast::keyed_entry(ast::string(metamethod(p.get), {Tag::Generated}), accessor(v.scope, p, false)));
        NodePtr raw = ast::table(ast::list(ast::keyed_entry(key_expr(p.key), std::move(value))), {Tag::Generated});
        return ast::call(v.reference(setmetatable_), ast::list(std::move(raw), ast::table(std::move(meta), {Tag::Generated})), {Tag::Generated});
    }

    std::string literal_type_{"string"};
    PipelineContext* ctx_{nullptr};
    Binding setmetatable_;
    Binding empty_;
    std::map<Symbol, Proxy> proxies_;
};

} // namespace

std::unique_ptr<Step> make_proxify_locals(){ return std::make_unique<ProxifyLocals>(); }

} // namespace shroud

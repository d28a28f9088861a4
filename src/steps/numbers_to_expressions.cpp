#include "shroud/steps.hpp"
#include "shroud/log.hpp"
#include "shroud/visit.hpp"
#include "support.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <functional>

namespace shroud {

namespace {

constexpr double kLimit = 2147483648.0; // 2^31

class NumbersToExpressions : public Step {
public:
    const char* name() const override { return "NumbersToExpressions"; }
    const char* description() const override { return "Turns integral number literals into arithmetic and logic expressions"; }
    const SettingsSchema& schema() const override {
        static const SettingsSchema s{
            {"Threshold", SettingType::Number, 1.0, 0.0, 1.0, {}, "Share of literals to rewrite"},
            {"InternalThreshold", SettingType::Number, 0.5, 0.0, 0.8, {}, "Chance to keep expanding a generated operand"},
            {"MaxDepth", SettingType::Number, 5.0, 1.0, 15.0, {}, "Deepest expansion"},
        };
        return s;
    }
    void configure(const Settings& s) override {
        threshold_ = s.number("Threshold");
        internal_ = s.number("InternalThreshold");
        max_depth_ = static_cast<int>(s.number("MaxDepth"));
    }

    void apply(NodePtr& root, PipelineContext& ctx) override {
        ctx_ = &ctx;
        std::size_t count = 0;
        Callback post = [&](NodePtr& slot, VisitContext&) -> Action {
            const Node& n = *slot;
            if(n.kind != Kind::Number || n.has(Tag::NoRewrite)) return keep();
            double v = n.as<payload::Number>().value;
            if(v != std::floor(v) || std::fabs(v) >= kLimit || (v == 0 && std::signbit(v))) return keep();
            if(ctx.random() >= threshold_) return keep();
            ++count;
            return replace(expand(v, 0));
        };
        traverse(root, nullptr, post);
        ctx_ = nullptr;
        log::info(name(), "rewrote " + std::to_string(count) + " number literal(s)");
    }

private:
    static NodePtr leaf(double v){ return ast::number(v, {Tag::Generated, Tag::NoRewrite}); }

    NodePtr expand(double v, int depth){
        if(depth > max_depth_ || (depth > 0 && ctx_->random() >= internal_)) return leaf(v);
        std::array<int, 6> order{0, 1, 2, 3, 4, 5};
        std::shuffle(order.begin(), order.end(), ctx_->rng());
        for(int g : order) if(NodePtr n = generate(g, v, depth + 1)) return n;
        return leaf(v);
    }

    // Null when the generator does not apply to `v`.
    NodePtr generate(int which, double v, int depth){
        const TagSet gen{Tag::Generated};
        switch(which){
        case 0: {
            double r = static_cast<double>(ctx_->random_int(-1000, 1000));
            return ast::binary(Kind::Add, expand(r, depth), expand(v - r, depth), gen);
        }
        case 1: {
            double r = static_cast<double>(ctx_->random_int(-1000, 1000));
            return ast::binary(Kind::Sub, expand(v + r, depth), expand(r, depth), gen);
        }
        case 2: {
            if(v == 0) return nullptr;
            double f = static_cast<double>(ctx_->random_int(2, 5));
            if(std::fmod(v, f) != 0) return nullptr;
            return ast::binary(Kind::Mul, expand(f, depth), expand(v / f, depth), gen);
        }
        case 3: {
            double f = static_cast<double>(ctx_->random_int(2, 5));
            return ast::binary(Kind::Div, expand(v * f, depth), expand(f, depth), gen);
        }
        case 4: {
            // (c == c) and v or junk; numbers are always truthy
            double c = static_cast<double>(ctx_->random_int(1, 100));
            double junk = static_cast<double>(ctx_->random_int(-5000, 5000));
            NodePtr cond = ast::binary(Kind::Equal, expand(c, depth), expand(c, depth), gen);
            NodePtr pick = ast::binary(Kind::And, std::move(cond), expand(v, depth), gen);
            return ast::binary(Kind::Or, std::move(pick), expand(junk, depth), gen);
        }
        case 5:
            return ast::unary(Kind::Negate, ast::unary(Kind::Negate, expand(v, depth), gen), gen);
        }
        return nullptr;
    }

    double threshold_{1.0};
    double internal_{0.5};
    int max_depth_{5};
    PipelineContext* ctx_{nullptr};
};

} // namespace

std::unique_ptr<Step> make_numbers_to_expressions(){ return std::make_unique<NumbersToExpressions>(); }

} // namespace shroud

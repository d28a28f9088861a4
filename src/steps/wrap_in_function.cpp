#include "shroud/steps.hpp"
#include "shroud/log.hpp"
#include "support.hpp"

namespace shroud {

namespace {

// Chunk body B becomes `return (function(...) B end)(...)`. The old body block keeps its scope,
// which moves under the new chunk scope.
class WrapInFunction : public Step {
public:
    const char* name() const override { return "WrapInFunction"; }
    const char* description() const override { return "Wraps the whole script in a vararg function call"; }
    const SettingsSchema& schema() const override {
        static const SettingsSchema s{
            {"Iterations", SettingType::Number, 1.0, 1.0, 16.0, {}, "Number of nested wrappers"},
        };
        return s;
    }
    void configure(const Settings& s) override { iterations_ = static_cast<int>(s.number("Iterations")); }

    void apply(NodePtr& root, PipelineContext&) override {
        steps_detail::chunk_block(root);
        auto& top = root->as<payload::Top>();
        for(int i = 0; i < iterations_; ++i){
            NodePtr inner = std::move(top.body);
            Scope* inner_scope = inner->as<payload::Block>().scope.get();
            auto outer = std::make_unique<Scope>(top.globals.get());
            inner_scope->move_under(outer.get());
            NodePtr fn = ast::function({}, true, std::move(inner), {Tag::Generated});
            NodePtr call = ast::call(std::move(fn), ast::list(ast::vararg({Tag::Generated})), {Tag::Generated});
            top.body = ast::block(std::move(outer), ast::list(ast::return_stat(ast::list(std::move(call)))), true);
        }
        log::info(name(), "wrapped the chunk " + std::to_string(iterations_) + " time(s)");
    }

private:
    int iterations_{1};
};

} // namespace

std::unique_ptr<Step> make_wrap_in_function(){ return std::make_unique<WrapInFunction>(); }

} // namespace shroud

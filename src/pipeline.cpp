#include "shroud/pipeline.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include "shroud/rename.hpp"
#include "shroud/verify.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace shroud {

namespace {

std::string lower(std::string_view text){
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

double elapsed_ms(std::chrono::steady_clock::time_point since){
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

PipelineContext::PipelineContext(Dialect dialect, SourceParser& parser, std::uint32_t seed, NameGenerator& names, bool pretty)
    : dialect_(dialect), parser_(parser), splicer_(parser, ParseOptions{dialect, nullptr, "<fragment>"}),
      rng_(seed), names_(names), pretty_(pretty) {}

double PipelineContext::random(){
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

long long PipelineContext::random_int(long long lo, long long hi){
    if(hi < lo) std::swap(lo, hi);
    return std::uniform_int_distribution<long long>(lo, hi)(rng_);
}

std::string PipelineContext::generate_name(std::optional<std::size_t> index){
    std::size_t i = index ? *index : static_cast<std::size_t>(random_int(0, 4095));
    std::string name = names_.generate(i);
    while(!is_lua_identifier(name)) name = names_.generate(++i);
    return name;
}

void StepRegistry::add(std::string name, StepFactory factory){
    factories_[std::move(name)] = std::move(factory);
}

bool StepRegistry::contains(std::string_view name) const {
    std::string key = lower(name);
    return std::any_of(factories_.begin(), factories_.end(), [&](const auto& f){ return lower(f.first) == key; });
}

std::unique_ptr<Step> StepRegistry::create(std::string_view name) const {
    std::string key = lower(name);
    for(auto& [n, factory] : factories_) if(lower(n) == key) return factory();
    throw config_error("unknown step '" + std::string(name) + "'");
}

std::vector<std::string> StepRegistry::names() const {
    std::vector<std::string> out;
    for(auto& f : factories_) out.push_back(f.first);
    return out;
}

const std::vector<Preset>& presets(){
    static const std::vector<Preset> all{
        {"Minify", "mangled", {}},
        {"Weak", "mangled_shuffled", {
            {"ConstantArray", {{"Threshold", "1"}, {"StringsOnly", "true"}, {"Shuffle", "true"}, {"Rotate", "false"}}},
            {"WrapInFunction", {}},
        }},
        {"Medium", "mangled_shuffled", {
            {"EncryptStrings", {}},
            {"AntiTamper", {{"UseDebug", "false"}}},
            {"ConstantArray", {{"Threshold", "1"}, {"StringsOnly", "true"}, {"Shuffle", "true"}, {"Rotate", "false"}}},
            {"NumbersToExpressions", {}},
            {"WrapInFunction", {}},
        }},
        {"Strong", "mangled_shuffled", {
            {"EncryptStrings", {}},
            {"AntiTamper", {}},
            {"ConstantArray", {{"Threshold", "1"}, {"StringsOnly", "true"}, {"Shuffle", "true"}, {"Rotate", "true"}}},
            {"ProxifyLocals", {}},
            {"NumbersToExpressions", {}},
            {"WrapInFunction", {}},
        }},
    };
    return all;
}

const Preset& find_preset(std::string_view name){
    std::string key = lower(name);
    for(auto& p : presets()) if(lower(p.name) == key) return p;
    throw config_error("unknown preset '" + std::string(name) + "'");
}

void apply_preset(PipelineConfig& config, const Preset& preset){
    config.steps = preset.steps;
    config.name_generator = preset.name_generator;
}

Pipeline::Pipeline(PipelineConfig config, const StepRegistry& registry, SourceParser& parser, SourcePrinter& printer)
    : config_(std::move(config)), parser_(parser), printer_(printer) {
    seed_ = config_.seed ? *config_.seed : std::random_device{}();
    // fail early on a bad generator name
    make_name_generator(config_.name_generator, seed_);
    for(auto& sc : config_.steps){
        auto step = registry.create(sc.name);
        step->configure(resolve_settings(step->name(), step->schema(), sc.settings));
        steps_.push_back(std::move(step));
    }
    log::debug("pipeline", std::to_string(steps_.size()) + " step(s), seed " + std::to_string(seed_));
}

void Pipeline::apply_step(Step& step, NodePtr& tree, PipelineContext& ctx){
    try {
        step.apply(tree, ctx);
        if(config_.verify) expect_consistent(tree, step.name());
    } catch(const scope_error& e){
        throw pass_error(step.name(), e.what());
    } catch(const shape_error& e){
        throw pass_error(step.name(), e.what());
    } catch(const syntax_error& e){
        throw pass_error(step.name(), "generated fragment " + std::to_string(e.line) + ":" + std::to_string(e.column) + ": " + e.what());
    }
}

NodePtr Pipeline::transform(std::string_view source, std::string_view source_name){
    auto start = std::chrono::steady_clock::now();
    ParseOptions po{config_.dialect, nullptr, std::string(source_name)};
    NodePtr tree = parser_.parse(source, po);
    if(config_.verify) expect_consistent(tree, "parse");

    auto names = make_name_generator(config_.name_generator, seed_);
    PipelineContext ctx(config_.dialect, parser_, seed_, *names, config_.print.style == PrintStyle::Pretty);
    for(auto& step : steps_){
        auto t = std::chrono::steady_clock::now();
        log::info("pipeline", std::string("applying step '") + step->name() + "'");
        apply_step(*step, tree, ctx);
        log::debug("pipeline", std::string(step->name()) + " took " + std::to_string(elapsed_ms(t)) + " ms");
    }

    if(config_.rename){
        log::info("pipeline", std::string("renaming variables (") + names->name() + ")");
        try {
            rename_variables(*tree, *names);
        } catch(const scope_error& e){
            throw pass_error("rename", e.what());
        }
    }
    log::info("pipeline", "transformed " + std::string(source_name) + " in " + std::to_string(elapsed_ms(start)) + " ms");
    return tree;
}

std::string Pipeline::run(std::string_view source, std::string_view source_name){
    NodePtr tree = transform(source, source_name);
    std::string out = printer_.to_source(*tree, config_.print);
    log::debug("pipeline", std::to_string(source.size()) + " -> " + std::to_string(out.size()) + " byte(s)");
    return out;
}

} // namespace shroud

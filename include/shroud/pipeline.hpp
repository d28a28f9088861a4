#pragma once
#include "shroud/ast.hpp"
#include "shroud/frontend.hpp"
#include "shroud/names.hpp"
#include "shroud/settings.hpp"
#include "shroud/splice.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace shroud {

// What a step sees of the running pipeline.
class PipelineContext {
public:
    PipelineContext(Dialect dialect, SourceParser& parser, std::uint32_t seed, NameGenerator& names, bool pretty);

    Dialect dialect() const { return dialect_; }
    SourceParser& parser() { return parser_; }
    Splicer& splicer() { return splicer_; }
    std::mt19937& rng() { return rng_; }
    bool pretty() const { return pretty_; }

    // Uniform in [0, 1).
    double random();
    // Uniform in [lo, hi].
    long long random_int(long long lo, long long hi);
    // Identifier drawn from the name generator at `index`, or at a random index.
    std::string generate_name(std::optional<std::size_t> index = std::nullopt);

private:
    Dialect dialect_;
    SourceParser& parser_;
    Splicer splicer_;
    std::mt19937 rng_;
    NameGenerator& names_;
    bool pretty_;
};

// One rewrite applied to the whole tree.
class Step {
public:
    virtual ~Step() = default;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const SettingsSchema& schema() const = 0;
    virtual void configure(const Settings& settings) = 0;
    virtual void apply(NodePtr& root, PipelineContext& ctx) = 0;
};

using StepFactory = std::function<std::unique_ptr<Step>()>;

class StepRegistry {
public:
    void add(std::string name, StepFactory factory);
    bool contains(std::string_view name) const;
    // Case-insensitive; unknown names are a config_error.
    std::unique_ptr<Step> create(std::string_view name) const;
    std::vector<std::string> names() const;
private:
    std::map<std::string, StepFactory> factories_;
};

struct StepConfig {
    std::string name;
    SettingOverrides settings;
};

struct PipelineConfig {
    Dialect dialect{Dialect::Lua51};
    std::optional<std::uint32_t> seed;
    PrintOptions print;
    bool rename{true};
    std::string name_generator{"mangled_shuffled"};
    bool verify{false};
    std::vector<StepConfig> steps;
};

struct Preset {
    std::string name;
    std::string name_generator;
    std::vector<StepConfig> steps;
};

const std::vector<Preset>& presets();
// Case-insensitive; unknown names are a config_error.
const Preset& find_preset(std::string_view name);
// Copies the preset's steps and generator into `config`.
void apply_preset(PipelineConfig& config, const Preset& preset);

// Parse, run the configured steps, rename and print.
class Pipeline {
public:
    // Instantiates and configures every step; bad step names or settings throw config_error.
    Pipeline(PipelineConfig config, const StepRegistry& registry, SourceParser& parser, SourcePrinter& printer);

    std::string run(std::string_view source, std::string_view source_name = "<memory>");
    // Everything but printing.
    NodePtr transform(std::string_view source, std::string_view source_name = "<memory>");

    const PipelineConfig& config() const { return config_; }
    std::uint32_t seed() const { return seed_; }
    const std::vector<std::unique_ptr<Step>>& steps() const { return steps_; }

private:
    void apply_step(Step& step, NodePtr& tree, PipelineContext& ctx);

    PipelineConfig config_;
    SourceParser& parser_;
    SourcePrinter& printer_;
    std::uint32_t seed_{0};
    std::vector<std::unique_ptr<Step>> steps_;
};

} // namespace shroud

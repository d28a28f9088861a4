#include "shroud/env.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include "shroud/pipeline.hpp"
#include "shroud/steps.hpp"
#include "shroud_lua/parser.hpp"
#include "shroud_lua/printer.hpp"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/ToolOutputFile.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

using namespace llvm;

static cl::OptionCategory g_category("shroud options");

static cl::opt<std::string> g_input(cl::Positional, cl::desc("<input.lua | ->"), cl::init("-"), cl::cat(g_category));
static cl::opt<std::string> g_output("o", cl::desc("Output file (default: stdout)"), cl::value_desc("file"), cl::init("-"), cl::cat(g_category));
static cl::opt<std::string> g_preset("preset", cl::desc("Step preset: Minify, Weak, Medium, Strong"), cl::cat(g_category));
static cl::list<std::string> g_steps("steps", cl::desc("Comma separated step list (overrides the preset's steps)"), cl::CommaSeparated, cl::cat(g_category));
static cl::list<std::string> g_set("set", cl::desc("Step setting, e.g. ConstantArray.Threshold=0.5"), cl::value_desc("Step.Option=value"), cl::cat(g_category));
static cl::opt<std::string> g_dialect("dialect", cl::desc("lua51 | luau"), cl::init("lua51"), cl::cat(g_category));
static cl::opt<unsigned> g_seed("seed", cl::desc("Random seed (default: SHROUD_SEED or random)"), cl::cat(g_category));
static cl::opt<std::string> g_style("style", cl::desc("pretty | line | minify"), cl::init("line"), cl::cat(g_category));
static cl::opt<bool> g_no_rename("no-rename", cl::desc("Keep local variable names"), cl::cat(g_category));
static cl::opt<std::string> g_names("name-generator", cl::desc("mangled | mangled_shuffled | il | number"), cl::cat(g_category));
static cl::opt<bool> g_verify("verify", cl::desc("Check scope invariants after every step"), cl::cat(g_category));
static cl::opt<bool> g_list("list-steps", cl::desc("Print the available steps and their settings"), cl::cat(g_category));
static cl::opt<std::string> g_log("log-level", cl::desc("error | warn | info | debug"), cl::cat(g_category));

namespace {

void list_steps(const shroud::StepRegistry& registry){
    auto& os = outs();
    for(auto& n : registry.names()){
        auto step = registry.create(n);
        os << step->name() << ": " << step->description() << "\n";
        for(auto& d : step->schema()){
            os << "    " << d.name << " (" << shroud::setting_type_name(d.type) << ", default " << shroud::format_setting(d.default_value) << ")";
            if(!d.values.empty()){
                os << " {";
                for(std::size_t i = 0; i < d.values.size(); ++i) os << (i ? ", " : "") << d.values[i];
                os << "}";
            }
            if(!d.description.empty()) os << ": " << d.description;
            os << "\n";
        }
    }
    os << "presets:";
    for(auto& p : shroud::presets()) os << " " << p.name;
    os << "\n";
}

// Applies every `Step.Option=value` to the configured steps of that name.
void apply_overrides(shroud::PipelineConfig& config){
    for(const std::string& item : g_set){
        auto dot = item.find('.');
        auto eq = item.find('=');
        if(dot == std::string::npos || eq == std::string::npos || dot > eq)
            throw shroud::config_error("--set expects Step.Option=value, got '" + item + "'");
        std::string step = item.substr(0, dot);
        std::string option = item.substr(dot + 1, eq - dot - 1);
        std::string value = item.substr(eq + 1);
        bool found = false;
        for(auto& sc : config.steps){
            if(StringRef(sc.name).equals_insensitive(step)){
                sc.settings[option] = value;
                found = true;
            }
        }
        if(!found) throw shroud::config_error("--set " + item + ": step '" + step + "' is not part of the pipeline");
    }
}

shroud::PipelineConfig build_config(const shroud::Env& env){
    shroud::PipelineConfig config;
    auto dialect = shroud::parse_dialect(g_dialect.getValue());
    if(!dialect) throw shroud::config_error("unknown dialect '" + g_dialect.getValue() + "'");
    config.dialect = *dialect;
    auto style = shroud::parse_style(g_style.getValue());
    if(!style) throw shroud::config_error("unknown print style '" + g_style.getValue() + "'");
    config.print.style = *style;

    if(!g_preset.empty()) shroud::apply_preset(config, shroud::find_preset(g_preset.getValue()));
    if(!g_steps.empty()){
        config.steps.clear();
        for(auto& s : g_steps) config.steps.push_back({s, {}});
    }
    apply_overrides(config);

    if(!g_names.empty()) config.name_generator = g_names.getValue();
    config.rename = !g_no_rename;
    config.verify = g_verify || env.verify;
    if(g_seed.getNumOccurrences()) config.seed = static_cast<std::uint32_t>(g_seed.getValue());
    else config.seed = env.seed;
    return config;
}

} // namespace

int main(int argc, char** argv){
    InitLLVM init(argc, argv);
    cl::HideUnrelatedOptions(g_category);
    cl::ParseCommandLineOptions(argc, argv, "shroud - Lua source obfuscator\n");

    shroud::Env env = shroud::detect_env();
    if(env.log_level) shroud::log::set_level(*env.log_level);
    if(!g_log.empty()){
        auto lvl = shroud::log::parse_level(g_log.getValue());
        if(!lvl){
            errs() << "shroud: unknown log level '" << g_log.getValue() << "'\n";
            return 2;
        }
        shroud::log::set_level(*lvl);
    }

    shroud::StepRegistry registry;
    shroud::register_builtin_steps(registry);
    if(g_list){
        list_steps(registry);
        return 0;
    }

    auto buffer = MemoryBuffer::getFileOrSTDIN(g_input.getValue());
    if(std::error_code ec = buffer.getError()){
        errs() << "shroud: cannot read '" << g_input.getValue() << "': " << ec.message() << "\n";
        return 2;
    }
    std::string name = g_input.getValue() == "-" ? "<stdin>" : g_input.getValue();

    try {
        shroud::lua::Parser parser;
        shroud::lua::Printer printer;
        shroud::Pipeline pipeline(build_config(env), registry, parser, printer);
        std::string out = pipeline.run((*buffer)->getBuffer(), name);

        std::error_code ec;
        ToolOutputFile file(g_output.getValue(), ec, sys::fs::OF_Text);
        if(ec){
            errs() << "shroud: cannot open '" << g_output.getValue() << "': " << ec.message() << "\n";
            return 2;
        }
        file.os() << out;
        if(!out.empty() && out.back() != '\n') file.os() << "\n";
        file.keep();
        shroud::log::info("shroud", "seed " + std::to_string(pipeline.seed()));
        return 0;
    } catch(const shroud::syntax_error& e){
        errs() << name << ":" << e.line << ":" << e.column << ": syntax error: " << e.what() << "\n";
        return 1;
    } catch(const shroud::config_error& e){
        errs() << "shroud: " << e.what() << "\n";
        return 2;
    } catch(const shroud::pass_error& e){
        errs() << "shroud: " << e.what() << "\n";
        return 3;
    } catch(const std::exception& e){
        errs() << "shroud: internal error: " << e.what() << "\n";
        return 3;
    }
}

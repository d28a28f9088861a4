#pragma once
#include "shroud/ast.hpp"
#include "shroud/frontend.hpp"
#include "shroud/names.hpp"
#include "shroud/pipeline.hpp"
#include "shroud/settings.hpp"
#include "shroud_lua/parser.hpp"
#include "shroud_lua/printer.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace shroud_test {

shroud::NodePtr parse(std::string_view source, shroud::Dialect dialect = shroud::Dialect::Lua51);
std::string print(const shroud::Node& top, shroud::PrintStyle style = shroud::PrintStyle::Line);
// parse + print
std::string reprint(std::string_view source, shroud::Dialect dialect = shroud::Dialect::Lua51);

shroud::Node& chunk_block(shroud::NodePtr& top);
shroud::Scope* chunk_scope(shroud::NodePtr& top);
shroud::Scope* globals(shroud::NodePtr& top);

// Everything a step needs to run outside a Pipeline.
struct StepHarness {
    explicit StepHarness(std::uint32_t seed = 1234, shroud::Dialect dialect = shroud::Dialect::Lua51, bool pretty = false);

    // Builds the named step with `overrides`, applies it and checks the tree stays consistent.
    void apply(std::string_view step, shroud::NodePtr& tree, const shroud::SettingOverrides& overrides = {});

    shroud::lua::Parser parser;
    std::unique_ptr<shroud::NameGenerator> names;
    shroud::StepRegistry registry;
    shroud::PipelineContext ctx;
};

} // namespace shroud_test

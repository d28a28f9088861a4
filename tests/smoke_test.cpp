#include <cassert>
#include <string>
#include "test_util.hpp"
#include "shroud/errors.hpp"
#include "shroud/steps.hpp"
#include "shroud/verify.hpp"

using namespace shroud;

namespace {

const char* kSample = R"lua(
local counter = 0
local function bump(n)
    counter = counter + (n or 1)
    return counter
end
local t = {1, 2, three = 3, ["four"] = 4}
for i = 1, #t do bump(t[i]) end
for k, v in pairs(t) do
    if type(k) == "string" then bump(v) elseif v > 1 then bump() else bump(0) end
end
while counter < 100 do counter = counter * 2 end
repeat local done = counter > 10 until done
print(("total: %d"):format(counter), ...)
)lua";

} // namespace

void run_parser_smoke_test(){
    {
        NodePtr t = shroud_test::parse(kSample);
        assert(t && t->kind == Kind::Top);
        assert(verify_tree(t).ok() && "parsed tree must be consistent");
    }
    {
        NodePtr t = shroud_test::parse("local x = 1\nx += 2\nfor i = 1, 3 do if i == 2 then continue end end", Dialect::LuaU);
        assert(verify_tree(t).ok());
    }
    {
        bool threw = false;
        try { (void)shroud_test::parse("x += 1"); } catch(const syntax_error&){ threw = true; }
        assert(threw && "compound assignment is Luau only");
    }
}

void run_printer_smoke_test(){
    for(PrintStyle style : {PrintStyle::Pretty, PrintStyle::Line, PrintStyle::Minify}){
        NodePtr t = shroud_test::parse(kSample);
        std::string once = shroud_test::print(*t, style);
        NodePtr again = shroud_test::parse(once);
        assert(verify_tree(again).ok());
        assert(shroud_test::print(*again, style) == once && "printing is a fixed point");
    }
}

void run_pipeline_smoke_test(){
    StepRegistry registry;
    register_builtin_steps(registry);
    for(const Preset& preset : presets()){
        PipelineConfig config;
        apply_preset(config, preset);
        config.seed = 7;
        config.verify = true;
        lua::Parser parser;
        lua::Printer printer;
        Pipeline pipeline(config, registry, parser, printer);
        std::string out = pipeline.run(kSample, "sample.lua");
        assert(!out.empty());
        NodePtr back = shroud_test::parse(out);
        assert(verify_tree(back).ok() && "obfuscated output must parse back");
    }
}

#include "shroud/steps.hpp"
#include "shroud/log.hpp"
#include "shroud_lua/printer.hpp"
#include "support.hpp"

namespace shroud {

namespace {

using namespace steps_detail;

const char* kGuardHead = R"lua(
do
    local valid = true
    local function kill()
        while true do
            error("Tamper Detected!")
        end
    end
    local ok, msg = pcall(function()
        return @A@ - @GUARD@ ^ @B@
    end)
    if ok or type(msg) ~= "string" or not string.match(msg, ":%d+:") then
        valid = false
    end
)lua";

// Native functions must still be native and free of upvalues/locals.
const char* kGuardDebug = R"lua(
    local dbg = debug
    if not dbg or not dbg.getinfo then
        valid = false
    else
        local funcs = {pcall, tostring, string.char, dbg.getinfo}
        for i = 1, #funcs do
            local info = dbg.getinfo(funcs[i])
            if not info or info.what ~= "C" then
                valid = false
            end
            if dbg.getupvalue and dbg.getupvalue(funcs[i], 1) then
                valid = false
            end
        end
    end
)lua";

// pcall/unpack must hand back exactly what was packed.
const char* kGuardTail = R"lua(
    local r = math.random
    local unpackv = table.unpack or unpack
    local a1, a2 = 0, 0
    for i = 1, r(8, 32) do
        local len = r(5, 50)
        local idx = r(1, len)
        local v = r(0, 255)
        local arr = {pcall(function()
            local t = {}
            for j = 1, len do
                t[j] = r(0, 255)
            end
            t[idx] = v
            return unpackv(t)
        end)}
        if not arr[1] then
            valid = false
        else
            a1 = (a1 + arr[idx + 1]) % 256
            a2 = (a2 + v) % 256
        end
    end
    valid = valid and a1 == a2
    if not valid then
        kill()
    end
end
)lua";

class AntiTamper : public Step {
public:
    const char* name() const override { return "AntiTamper"; }
    const char* description() const override { return "Prepends a guard that stops the script when its runtime was tampered with"; }
    const SettingsSchema& schema() const override {
        static const SettingsSchema s{
            {"UseDebug", SettingType::Boolean, true, std::nullopt, std::nullopt, {}, "Inspect native functions through the debug library"},
        };
        return s;
    }
    void configure(const Settings& s) override { use_debug_ = s.boolean("UseDebug"); }

    void apply(NodePtr& root, PipelineContext& ctx) override {
        if(ctx.pretty()){
            log::warn(name(), "cannot be combined with pretty printing; skipped");
            return;
        }
        std::string code = kGuardHead;
        if(use_debug_) code += kGuardDebug;
        code += kGuardTail;
        // "_" keeps the guard string from ever parsing as a number
        code = fill(code, {
            {"A", std::to_string(ctx.random_int(1, 1 << 24))},
            {"B", std::to_string(ctx.random_int(1, 1 << 24))},
            {"GUARD", lua::quote("_" + ctx.generate_name())},
        });
        auto result = ctx.splicer().splice(chunk_block(root), 0, code, {});
        log::info(name(), "inserted " + std::to_string(result.inserted) + " guard statement(s)" + (use_debug_ ? " using the debug library" : ""));
    }

private:
    bool use_debug_{true};
};

} // namespace

std::unique_ptr<Step> make_anti_tamper(){ return std::make_unique<AntiTamper>(); }

} // namespace shroud

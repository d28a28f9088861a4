#include "shroud/steps.hpp"
#include "shroud/log.hpp"
#include "shroud/visit.hpp"
#include "shroud_lua/printer.hpp"
#include "support.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <map>

namespace shroud {

std::string cipher::base64(std::string_view bytes, std::string_view alphabet){
    if(alphabet.size() != 64) throw config_error("base64 alphabet must have 64 characters");
    std::string out;
    std::size_t i = 0;
    for(; i + 2 < bytes.size(); i += 3){
        std::uint32_t v = (std::uint32_t)(unsigned char)bytes[i] << 16 | (std::uint32_t)(unsigned char)bytes[i + 1] << 8 | (unsigned char)bytes[i + 2];
        out += alphabet[v >> 18 & 63]; out += alphabet[v >> 12 & 63]; out += alphabet[v >> 6 & 63]; out += alphabet[v & 63];
    }
    if(bytes.size() - i == 1){
        std::uint32_t v = (std::uint32_t)(unsigned char)bytes[i] << 16;
        out += alphabet[v >> 18 & 63]; out += alphabet[v >> 12 & 63]; out += "==";
    } else if(bytes.size() - i == 2){
        std::uint32_t v = (std::uint32_t)(unsigned char)bytes[i] << 16 | (std::uint32_t)(unsigned char)bytes[i + 1] << 8;
        out += alphabet[v >> 18 & 63]; out += alphabet[v >> 12 & 63]; out += alphabet[v >> 6 & 63]; out += '=';
    }
    return out;
}

namespace {

using namespace steps_detail;

const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Undoes the load-time rotation: `@SHIFT@` right rotations by one.
const char* kRotate = R"lua(
do
    local arr = ARR
    for i = 1, @SHIFT@ do
        table.insert(arr, 1, table.remove(arr))
    end
end
)lua";

// Decodes every string entry in place. Padding characters are not in the table and are skipped.
const char* kDecode = R"lua(
do
    local arr, chars, lookup = ARR, @ALPHABET@, {}
    local sub, char, floor = string.sub, string.char, math.floor
    for i = 1, 64 do
        lookup[sub(chars, i, i)] = i - 1
    end
    for i = 1, #arr do
        local s = arr[i]
        if type(s) == "string" then
            local out, acc, bits = {}, 0, 0
            for j = 1, #s do
                local v = lookup[sub(s, j, j)]
                if v then
                    acc = acc * 64 + v
                    bits = bits + 6
                    if bits >= 8 then
                        bits = bits - 8
                        out[#out + 1] = char(floor(acc / 2 ^ bits))
                        acc = acc % 2 ^ bits
                    end
                end
            end
            arr[i] = table.concat(out)
        end
    end
end
)lua";

const char* kWrapper = R"lua(
local function WRAPPER(k)
    return ARR[k @OFFSET@]
end
)lua";

struct Constant {
    bool is_string{false};
    std::string text;
    double number{0};
};

std::string constant_key(const Node& n){
    if(n.kind == Kind::String) return "s" + n.as<payload::String>().value;
    double v = n.as<payload::Number>().value;
    char bits[sizeof v];
    std::memcpy(bits, &v, sizeof v);
    return "n" + std::string(bits, sizeof v);
}

class ConstantArray : public Step {
public:
    const char* name() const override { return "ConstantArray"; }
    const char* description() const override { return "Moves constants into one array read through an offset wrapper"; }
    const SettingsSchema& schema() const override {
        static const SettingsSchema s{
            {"Threshold", SettingType::Number, 1.0, 0.0, 1.0, {}, "Share of constants to move"},
            {"StringsOnly", SettingType::Boolean, false, std::nullopt, std::nullopt, {}, "Leave numbers in place"},
            {"Shuffle", SettingType::Boolean, true, std::nullopt, std::nullopt, {}, "Shuffle the array"},
            {"Rotate", SettingType::Boolean, true, std::nullopt, std::nullopt, {}, "Store the array rotated and rotate it back at load time"},
            {"Encoding", SettingType::Enum, std::string("base64"), std::nullopt, std::nullopt, {"none", "base64"}, "Encoding of string entries"},
            {"MaxWrapperOffset", SettingType::Number, 65535.0, 0.0, std::nullopt, {}, "Largest index offset applied by the wrapper"},
        };
        return s;
    }
    void configure(const Settings& s) override {
        threshold_ = s.number("Threshold");
        strings_only_ = s.boolean("StringsOnly");
        shuffle_ = s.boolean("Shuffle");
        rotate_ = s.boolean("Rotate");
        base64_ = s.text("Encoding") == "base64";
        max_offset_ = static_cast<long long>(s.number("MaxWrapperOffset"));
    }

    void apply(NodePtr& root, PipelineContext& ctx) override {
        Node& body = chunk_block(root);
        Scope* scope = chunk_scope(root);

        // Collect first; indices are final only after shuffling.
        std::vector<Constant> constants;
        std::map<std::string, std::size_t> lookup;
        NodeSet marked;
        Callback collect = [&](NodePtr& slot, VisitContext&) -> Action {
            const Node& n = *slot;
            if(n.has(Tag::NoRewrite)) return keep();
            bool str = n.kind == Kind::String;
            bool num = n.kind == Kind::Number && !strings_only_ && std::isfinite(n.as<payload::Number>().value);
            if(!str && !num) return keep();
            if(ctx.random() >= threshold_) return keep();
            std::string key = constant_key(n);
            if(!lookup.count(key)){
                lookup[key] = constants.size();
                constants.push_back(str ? Constant{true, n.as<payload::String>().value, 0} : Constant{false, {}, n.as<payload::Number>().value});
            }
            marked.insert(&n);
            return keep();
        };
        traverse(root, collect, nullptr);
        if(constants.empty()){
            log::debug(name(), "no constant selected");
            return;
        }

        // order[i] = constant stored at 1-based array index i + 1
        std::vector<std::size_t> order(constants.size());
        for(std::size_t i = 0; i < order.size(); ++i) order[i] = i;
        if(shuffle_) std::shuffle(order.begin(), order.end(), ctx.rng());
        std::vector<std::size_t> position(constants.size());
        for(std::size_t i = 0; i < order.size(); ++i) position[order[i]] = i + 1;

        long long offset = ctx.random_int(-max_offset_, max_offset_);
        Binding arr{scope, scope->add_variable()};
        Binding wrapper{scope, scope->add_variable()};

        Callback rewrite = [&](NodePtr& slot, VisitContext& v) -> Action {
            if(!marked.count(slot.get())) return keep();
            double index = static_cast<double>(position[lookup.at(constant_key(*slot))]) - static_cast<double>(offset);
            return replace(ast::call(v.reference(wrapper), ast::list(ast::number(index, {Tag::Generated})), {Tag::Generated}));
        };
        traverse(root, nullptr, rewrite);

        std::size_t shift = rotate_ && constants.size() > 1 ? static_cast<std::size_t>(ctx.random_int(1, (long long)constants.size() - 1)) : 0;
        std::string alphabet = kAlphabet;
        if(base64_) std::shuffle(alphabet.begin(), alphabet.end(), ctx.rng());

        NodeList entries;
        for(std::size_t i = 0; i < order.size(); ++i){
            const Constant& c = constants[order[(i + shift) % order.size()]];
            NodePtr value = c.is_string
                ? ast::string(base64_ ? cipher::base64(c.text, alphabet) : c.text, {Tag::Generated})
                : ast::number(c.number, {Tag::Generated, Tag::NoRewrite});
            entries.push_back(ast::entry(std::move(value)));
        }
        auto& statements = body.as<payload::Block>().statements;
        statements.insert(statements.begin(), ast::local(scope, {arr.id}, ast::list(ast::table(std::move(entries), {Tag::Generated}))));

        std::size_t at = 1;
        Splicer& splicer = ctx.splicer();
        if(shift) at += splicer.splice(body, at, fill(kRotate, {{"SHIFT", std::to_string(shift)}}), {{"ARR", arr}}).inserted;
        if(base64_) at += splicer.splice(body, at, fill(kDecode, {{"ALPHABET", lua::quote(alphabet)}}), {{"ARR", arr}}).inserted;
        std::string off = offset < 0 ? "- " + std::to_string(-offset) : "+ " + std::to_string(offset);
        splicer.splice(body, at, fill(kWrapper, {{"OFFSET", off}}), {{"ARR", arr}, {"WRAPPER", wrapper}});

        log::info(name(), std::to_string(constants.size()) + " constant(s), " + std::to_string(marked.size()) + " use(s), offset "
            + std::to_string(offset) + ", rotation " + std::to_string(shift));
    }

private:
    double threshold_{1.0};
    bool strings_only_{false};
    bool shuffle_{true};
    bool rotate_{true};
    bool base64_{true};
    long long max_offset_{65535};
};

} // namespace

std::unique_ptr<Step> make_constant_array(){ return std::make_unique<ConstantArray>(); }

} // namespace shroud

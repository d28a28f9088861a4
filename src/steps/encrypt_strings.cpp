#include "shroud/steps.hpp"
#include "shroud/log.hpp"
#include "shroud/visit.hpp"
#include "support.hpp"

namespace shroud {

namespace cipher {

namespace {
std::uint32_t next_state(std::uint32_t s){ return (s * 75 + 74) % 65537; }
} // namespace

std::string encrypt(std::string_view plain, std::uint32_t seed){
    std::string out;
    out.reserve(plain.size());
    std::uint32_t state = seed;
    for(char c : plain){
        state = next_state(state);
        out += static_cast<char>((static_cast<unsigned char>(c) + state % 256) % 256);
    }
    return out;
}

std::string decrypt(std::string_view data, std::uint32_t seed){
    std::string out;
    out.reserve(data.size());
    std::uint32_t state = seed;
    for(char c : data){
        state = next_state(state);
        out += static_cast<char>((static_cast<unsigned char>(c) + 256 - state % 256) % 256);
    }
    return out;
}

} // namespace cipher

namespace {

using namespace steps_detail;

// Runtime counterpart of cipher::decrypt.
const char* kDecoder = R"lua(
local function DECRYPT(s, seed)
    local byte, char = string.byte, string.char
    local out, state = {}, seed
    for i = 1, #s do
        state = (state * 75 + 74) % 65537
        out[i] = char((byte(s, i) - state % 256) % 256)
    end
    return table.concat(out)
end
)lua";

class EncryptStrings : public Step {
public:
    const char* name() const override { return "EncryptStrings"; }
    const char* description() const override { return "Replaces string literals with calls to a generated decoder"; }
    const SettingsSchema& schema() const override {
        static const SettingsSchema s{
            {"Threshold", SettingType::Number, 1.0, 0.0, 1.0, {}, "Share of string literals to encrypt"},
        };
        return s;
    }
    void configure(const Settings& s) override { threshold_ = s.number("Threshold"); }

    void apply(NodePtr& root, PipelineContext& ctx) override {
        Node& body = chunk_block(root);
        Scope* scope = chunk_scope(root);
        std::optional<Binding> decrypt;
        std::size_t count = 0;

        Callback post = [&](NodePtr& slot, VisitContext& v) -> Action {
            Node& n = *slot;
            if(n.kind != Kind::String || n.has(Tag::NoRewrite)) return keep();
            if(ctx.random() >= threshold_) return keep();
            if(!decrypt) decrypt = Binding{scope, scope->add_variable()};
            auto seed = static_cast<std::uint32_t>(ctx.random_int(1, 65536));
            NodeList args = ast::list(
                ast::string(cipher::encrypt(n.as<payload::String>().value, seed), {Tag::Generated}),
                ast::number(seed, {Tag::Generated}));
            ++count;
            return replace(ast::call(v.reference(*decrypt), std::move(args), {Tag::Generated}));
        };
        traverse(root, nullptr, post);

        if(!decrypt){
            log::debug(name(), "no string literal selected");
            return;
        }
        ctx.splicer().splice(body, 0, kDecoder, {{"DECRYPT", *decrypt}});
        log::info(name(), "encrypted " + std::to_string(count) + " string literal(s)");
    }

private:
    double threshold_{1.0};
};

} // namespace

std::unique_ptr<Step> make_encrypt_strings(){ return std::make_unique<EncryptStrings>(); }

} // namespace shroud

#include "shroud/names.hpp"
#include "shroud/errors.hpp"
#include <algorithm>
#include <cctype>
#include <random>

namespace shroud {

namespace {

const std::string kStart = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
const std::string kRest = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

// Bijective digits: first character from `start`, the rest from `rest`.
std::string encode(std::size_t index, const std::string& start, const std::string& rest){
    std::string out;
    out += start[index % start.size()];
    index /= start.size();
    while(index > 0){
        out += rest[index % rest.size()];
        index /= rest.size();
    }
    return out;
}

class Mangled : public NameGenerator {
public:
    std::string generate(std::size_t index) override { return encode(index, kStart, kRest); }
    const char* name() const override { return "mangled"; }
};

class MangledShuffled : public NameGenerator {
public:
    explicit MangledShuffled(std::uint32_t seed) : start_(kStart), rest_(kRest) {
        std::mt19937 rng(seed);
        std::shuffle(start_.begin(), start_.end(), rng);
        std::shuffle(rest_.begin(), rest_.end(), rng);
    }
    std::string generate(std::size_t index) override { return encode(index, start_, rest_); }
    const char* name() const override { return "mangled_shuffled"; }
private:
    std::string start_;
    std::string rest_;
};

// Names made of I, l and 1 only, padded to a minimum length.
class Il : public NameGenerator {
public:
    explicit Il(std::uint32_t seed){
        std::mt19937 rng(seed);
        offset_ = std::uniform_int_distribution<std::size_t>(0, 512)(rng);
    }
    std::string generate(std::size_t index) override {
        std::size_t v = index + offset_;
        std::string out;
        out += "Il"[v % 2];
        v /= 2;
        while(v > 0 || out.size() < kMinLength){
            out += "Il1"[v % 3];
            v /= 3;
        }
        return out;
    }
    const char* name() const override { return "il"; }
private:
    static constexpr std::size_t kMinLength = 6;
    std::size_t offset_{0};
};

class Number : public NameGenerator {
public:
    std::string generate(std::size_t index) override { return "_" + std::to_string(index); }
    const char* name() const override { return "number"; }
};

} // namespace

std::unique_ptr<NameGenerator> make_name_generator(std::string_view kind, std::uint32_t seed){
    if(kind == "mangled") return std::make_unique<Mangled>();
    if(kind == "mangled_shuffled") return std::make_unique<MangledShuffled>(seed);
    if(kind == "il") return std::make_unique<Il>(seed);
    if(kind == "number") return std::make_unique<Number>();
    throw config_error("unknown name generator '" + std::string(kind) + "'");
}

const std::vector<std::string>& name_generator_kinds(){
    static const std::vector<std::string> kinds{"mangled", "mangled_shuffled", "il", "number"};
    return kinds;
}

const std::vector<std::string>& lua_keywords(){
    static const std::vector<std::string> words{
        "and", "break", "do", "else", "elseif", "end", "false", "for", "function", "if", "in",
        "local", "nil", "not", "or", "repeat", "return", "then", "true", "until", "while"};
    return words;
}

bool is_lua_keyword(std::string_view word){
    const auto& w = lua_keywords();
    return std::find(w.begin(), w.end(), word) != w.end();
}

bool is_lua_identifier(std::string_view word){
    if(word.empty() || std::isdigit((unsigned char)word[0])) return false;
    for(char c : word) if(!(std::isalnum((unsigned char)c) || c == '_')) return false;
    return !is_lua_keyword(word);
}

} // namespace shroud

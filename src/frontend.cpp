#include "shroud/frontend.hpp"
#include <llvm/Support/raw_ostream.h>
#include <algorithm>
#include <cctype>

namespace shroud {

namespace {
std::string lower(std::string_view text){
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}
} // namespace

const char* dialect_name(Dialect d){ return d == Dialect::LuaU ? "luau" : "lua51"; }

std::optional<Dialect> parse_dialect(std::string_view text){
    std::string s = lower(text);
    if(s == "lua51" || s == "lua5.1" || s == "lua") return Dialect::Lua51;
    if(s == "luau" || s == "roblox") return Dialect::LuaU;
    return std::nullopt;
}

const char* style_name(PrintStyle s){
    switch(s){
    case PrintStyle::Pretty: return "pretty";
    case PrintStyle::Line: return "line";
    case PrintStyle::Minify: return "minify";
    }
    return "?";
}

std::optional<PrintStyle> parse_style(std::string_view text){
    std::string s = lower(text);
    if(s == "pretty") return PrintStyle::Pretty;
    if(s == "line") return PrintStyle::Line;
    if(s == "minify" || s == "min") return PrintStyle::Minify;
    return std::nullopt;
}

std::string SourcePrinter::to_source(const Node& root, const PrintOptions& options){
    std::string out;
    llvm::raw_string_ostream os(out);
    print(root, options, os);
    os.flush();
    return out;
}

} // namespace shroud

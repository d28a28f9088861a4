#include "shroud/log.hpp"
#include <llvm/Support/raw_ostream.h>
#include <algorithm>
#include <cctype>

namespace shroud::log {

namespace {
Level g_level = Level::Warn;
llvm::raw_ostream* g_sink = nullptr;

const char* tag(Level l){
    switch(l){
    case Level::Error: return "err";
    case Level::Warn: return "warn";
    case Level::Info: return "info";
    case Level::Debug: return "dbg";
    }
    return "?";
}
} // namespace

void set_level(Level l){ g_level = l; }
Level level(){ return g_level; }
void set_sink(llvm::raw_ostream* os){ g_sink = os; }

std::optional<Level> parse_level(std::string_view text){
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if(s == "error") return Level::Error;
    if(s == "warn" || s == "warning") return Level::Warn;
    if(s == "info") return Level::Info;
    if(s == "debug" || s == "dbg") return Level::Debug;
    return std::nullopt;
}

void write(Level l, std::string_view channel, std::string_view msg){
    if(!enabled(l)) return;
    llvm::raw_ostream& os = g_sink ? *g_sink : llvm::errs();
    os << '[' << tag(l) << "][" << channel << "] " << msg << '\n';
}

} // namespace shroud::log

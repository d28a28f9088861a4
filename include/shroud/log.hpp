#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace llvm { class raw_ostream; }

namespace shroud::log {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_level(Level l);
Level level();
inline bool enabled(Level l){ return static_cast<int>(l) <= static_cast<int>(level()); }

// "error" | "warn" | "info" | "debug" (case-insensitive); nullopt otherwise.
std::optional<Level> parse_level(std::string_view text);

// Redirect output (tests). nullptr restores llvm::errs().
void set_sink(llvm::raw_ostream* os);

// Writes "[lvl][channel] msg\n" when the level is enabled.
void write(Level l, std::string_view channel, std::string_view msg);

inline void error(std::string_view ch, std::string_view msg){ write(Level::Error, ch, msg); }
inline void warn(std::string_view ch, std::string_view msg){ write(Level::Warn, ch, msg); }
inline void info(std::string_view ch, std::string_view msg){ write(Level::Info, ch, msg); }
inline void debug(std::string_view ch, std::string_view msg){ write(Level::Debug, ch, msg); }

} // namespace shroud::log

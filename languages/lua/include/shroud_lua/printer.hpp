#pragma once
#include "shroud/frontend.hpp"

namespace shroud::lua {

class Printer : public SourcePrinter {
public:
    void print(const Node& root, const PrintOptions& options, llvm::raw_ostream& os) override;
};

// Quoted Lua string literal with \ddd escapes for anything outside printable ASCII.
std::string quote(std::string_view bytes);
// Shortest exact spelling of a number; inf/nan become parenthesised divisions.
std::string format_number(double v);

} // namespace shroud::lua

#pragma once
#include "shroud/ast.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace llvm { class raw_ostream; }

namespace shroud {

enum class Dialect { Lua51, LuaU };

const char* dialect_name(Dialect d);
std::optional<Dialect> parse_dialect(std::string_view text);

struct ParseOptions {
    Dialect dialect{Dialect::Lua51};
    // Id source for the new tree. Null: a fresh counter. Fragments borrow the host's.
    std::shared_ptr<SymbolCounter> counter;
    std::string source_name{"<memory>"};
};

// Parser collaborator: whole chunk in, Top node out. Throws syntax_error; never returns a partial tree.
class SourceParser {
public:
    virtual ~SourceParser() = default;
    virtual NodePtr parse(std::string_view source, const ParseOptions& options) = 0;
};

enum class PrintStyle { Pretty, Line, Minify };

const char* style_name(PrintStyle s);
std::optional<PrintStyle> parse_style(std::string_view text);

struct PrintOptions {
    PrintStyle style{PrintStyle::Line};
    std::string indent{"    "};
};

// Code emitter collaborator. Reads surface names from each scope's name table.
class SourcePrinter {
public:
    virtual ~SourcePrinter() = default;
    virtual void print(const Node& root, const PrintOptions& options, llvm::raw_ostream& os) = 0;
    std::string to_source(const Node& root, const PrintOptions& options);
};

} // namespace shroud

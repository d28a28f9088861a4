#pragma once
#include "shroud/ast.hpp"
#include "shroud/frontend.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace shroud {

// Fragment surface name -> host binding chosen by the pass (usually a fresh
// `host_scope->add_variable()` or a host global).
using ExportMap = std::map<std::string, Binding>;

struct SpliceResult {
    std::size_t inserted{0};
    std::vector<std::string> unused_exports;
};

// Merges independently parsed fragments into a host block.
//
// References to an exported name (fragment global or fragment top-level local) are rebound to
// the export's host binding; other fragment globals are re-interned in the host's global
// namespace. The fragment's root scope is attached under the host block scope, its top-level
// statements are moved in at `position`, and the root scope is absorbed into the host block
// scope with its private symbols renamed to reserved names.
class Splicer {
public:
    Splicer(SourceParser& parser, ParseOptions options) : parser_(parser), options_(std::move(options)) {}

    // Parses `source` with the host's symbol counter. Throws syntax_error.
    NodePtr parse_fragment(std::string_view source, const Scope& host);

    SpliceResult splice(Node& host_block, std::size_t position, std::string_view source, const ExportMap& exports);
    // Consumes an already parsed fragment (a Top node sharing the host's counter).
    SpliceResult splice(Node& host_block, std::size_t position, NodePtr fragment, const ExportMap& exports);

private:
    SourceParser& parser_;
    ParseOptions options_;
};

} // namespace shroud

#pragma once
#include <stdexcept>
#include <string>

namespace shroud {

// Malformed source text (program or fragment). Carries the 1-based location.
struct syntax_error : std::runtime_error {
    int line{0};
    int column{0};
    syntax_error(const std::string& msg, int l, int c) : std::runtime_error(msg), line(l), column(c) {}
};

// Ill-formed scope chain: undeclared non-global name, ledger underflow, bad attach.
struct scope_error : std::logic_error {
    using std::logic_error::logic_error;
};

// Node built or rewritten with the wrong arity/shape for its kind.
struct shape_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Bad step settings, preset names or CLI options.
struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A step left the tree inconsistent; names the step so the driver can report it.
struct pass_error : std::runtime_error {
    std::string step;
    pass_error(std::string s, const std::string& msg)
        : std::runtime_error("step '" + s + "' failed: " + msg), step(std::move(s)) {}
};

} // namespace shroud

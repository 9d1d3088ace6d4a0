//! # Diagnostic Rendering
//!
//! Renders a `ParseError` against its source for the terminal or for tools.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category | Example                          |
//! |--------|----------|----------------------------------|
//! | L      | Lexer    | L002 - Unterminated string       |
//! | P      | Parser   | P001 - Unexpected token          |
//!
//! ## Text Output
//!
//! ```text
//! error[P001]: expected a string literal, found an identifier
//!   --> component.profile:1:11
//!      |
//!    1 | implement foo with "comp"
//!      |           ^^^
//!      |
//! ```
//!
//! With `--error-format=json` each error is one JSON object on its own line.

#pragma once

#include "common.hpp"
#include "lexer/source.hpp"

#include <iostream>
#include <string>

namespace pdl::cli {

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightBlue = "\033[94m";
};

/// Writes diagnostics for parse errors.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    /// Renders `error`, resolving its span against `source`.
    ///
    /// The format follows `ToolOptions::diagnostic_format`.
    void emit(const lexer::Source& source, const ParseError& error);

    size_t error_count() const {
        return error_count_;
    }

    static std::string escape_json_string(std::string_view s);

private:
    std::ostream& out_;
    bool use_colors_ = true;
    size_t error_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_text(const lexer::Source& source, const ParseError& error);
    void emit_json(const lexer::Source& source, const ParseError& error);
};

/// Returns the process-wide emitter writing to stderr.
DiagnosticEmitter& get_diagnostic_emitter();

/// Checks if stderr is a terminal that understands ANSI colors.
bool terminal_supports_colors();

} // namespace pdl::cli

//! # Profile Formatter
//!
//! Renders a parsed `Ast` back to canonical profile text.
//!
//! ## Canonical Form
//!
//! - One declaration per line, doc comments on the lines before it
//! - Declarations separated by one blank line
//! - Identifiers printed bare when they lex as a single identifier and are
//!   not keywords, quoted otherwise
//! - `implement` operands always quoted
//!
//! Formatting is idempotent: formatting the output again yields the same text.

#ifndef PDL_FORMAT_FORMATTER_HPP
#define PDL_FORMAT_FORMATTER_HPP

#include "common.hpp"
#include "parser/ast.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace pdl::format {

/// Formatter options.
struct FormatOptions {
    bool blank_line_between = true; ///< Separate declarations with a blank line
    bool quote_all = false;         ///< Quote every identifier, even bare-safe ones
};

/// Profile source formatter.
class Formatter {
public:
    explicit Formatter(FormatOptions options = {});

    /// Formats a complete profile. Empty profiles format to an empty string.
    auto format(const parser::Ast& ast) -> std::string;

private:
    FormatOptions options_;
    std::stringstream output_;

    void emit(std::string_view text);
    void emit_line(std::string_view text);
    void emit_newline();

    // Declarations
    void format_item(const parser::Item& item);
    void format_docs(const parser::Docs& docs);
    void format_decl(const parser::Extend& extend);
    void format_decl(const parser::Provide& provide);
    void format_decl(const parser::Require& require);
    void format_decl(const parser::Implement& implement);

    auto format_id(const parser::Id& id) const -> std::string;
};

/// Renders `value` as a string literal, escaping what the lexer would not
/// read back verbatim.
[[nodiscard]] auto quote_string(std::string_view value) -> std::string;

/// Formats `ast` with default options.
[[nodiscard]] auto format_profile(const parser::Ast& ast) -> std::string;

/// Parses and formats `input`.
///
/// The tree keeps only comments that document a `provide`, `require` or
/// `implement`. Any other comment (before an `extend`, or after the last
/// declaration) would vanish from the output, so it is reported as an F001
/// error at the comment instead.
[[nodiscard]] auto format_source(std::string_view input, FormatOptions options = {})
    -> Result<std::string, ParseError>;

} // namespace pdl::format

#endif // PDL_FORMAT_FORMATTER_HPP

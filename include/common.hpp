//! # Shared Types
//!
//! Everything the tokenizer, parser, formatter and CLI agree on:
//!
//! | Type             | Purpose                                             |
//! |------------------|-----------------------------------------------------|
//! | `Span`           | Half-open byte range into the profile text          |
//! | `SourceLocation` | Line/column form of an offset, for diagnostics      |
//! | `ParseError`     | The only error lexing and parsing produce           |
//! | `Result<T, E>`   | Success-or-error return, inspected with `is_err()`  |
//! | `ToolOptions`    | Rendering switches set by the `pdl` driver          |
//!
//! Spans and views point into the caller's buffer, which must outlive
//! anything derived from it.

#ifndef PDL_COMMON_HPP
#define PDL_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace pdl {

// ============================================================================
// Version Information
// ============================================================================

/// Printed by `pdl --version`.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Tool Configuration
// ============================================================================

/// Output format for diagnostics.
enum class DiagnosticFormat {
    Text, ///< Human-readable text output (default)
    JSON  ///< One JSON object per diagnostic, for editor integration
};

/// Global tool options.
///
/// Set from command-line flags by the `pdl` driver. These only affect how
/// results and errors are rendered; parsing never reads them.
struct ToolOptions {
    /// Enable verbose output.
    static inline bool verbose = false;

    /// Output format for diagnostics.
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;

    /// Allow ANSI colors when stderr is a terminal.
    static inline bool color = true;
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A half-open byte range `[start, end)` into a source buffer.
///
/// Invariant: `start <= end`. Composite spans are built from the start of a
/// leading keyword and the end of the last consumed element.
struct Span {
    uint32_t start = 0; ///< Offset of the first byte.
    uint32_t end = 0;   ///< Offset one past the last byte.

    /// Returns the number of bytes covered.
    [[nodiscard]] auto length() const -> uint32_t {
        return end - start;
    }

    /// Returns the span covering `a` through `b`.
    [[nodiscard]] static auto merge(const Span& a, const Span& b) -> Span {
        return {a.start, b.end};
    }

    [[nodiscard]] auto operator==(const Span& other) const -> bool = default;
};

/// A resolved position in a source file, used when rendering diagnostics.
///
/// - `file`: Name of the source file
/// - `line`: 1-based line number
/// - `column`: 1-based column, counted in bytes
/// - `offset`: 0-based byte offset from file start
struct SourceLocation {
    std::string_view file;
    uint32_t line;
    uint32_t column;
    uint32_t offset;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Parse Errors
// ============================================================================

/// The single error produced by the tokenizer and the parser.
///
/// Messages always read `expected <what>, found <what>`. The first error
/// aborts the parse; no partial tree accompanies it.
struct ParseError {
    std::string message; ///< Human-readable description.
    Span span;           ///< Offending source range (zero-width at end of input).
    std::string code;    ///< Diagnostic code, `L...` for lexical, `P...` for syntax.
};

/// Diagnostic codes carried by `ParseError::code`.
namespace error_codes {
constexpr const char* LEX_INVALID_CHAR = "L001";
constexpr const char* LEX_UNTERMINATED_STRING = "L002";
constexpr const char* LEX_INVALID_ESCAPE = "L004";
constexpr const char* LEX_UNTERMINATED_COMMENT = "L012";
constexpr const char* PARSE_UNEXPECTED_TOKEN = "P001";
constexpr const char* FORMAT_DROPPED_COMMENT = "F001";
} // namespace error_codes

// ============================================================================
// Result Type
// ============================================================================

/// Either a value or an error; fallible operations return one instead of
/// throwing.
///
/// Propagation is explicit:
///
/// ```cpp
/// auto result = parser::parse_profile("provide foo");
/// if (is_err(result)) {
///     report(unwrap_err(result));
///     return;
/// }
/// const auto& ast = unwrap(result);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Success value; `std::bad_variant_access` if `result` holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Error value; `std::bad_variant_access` if `result` holds a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace pdl

#endif // PDL_COMMON_HPP

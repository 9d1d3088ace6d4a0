//! # Profile Tokenizer
//!
//! This module implements the tokenizer for profile files. It converts source
//! text into `(kind, span)` tokens on demand.
//!
//! ## Cursor Model
//!
//! A `Tokenizer` is a view of the input plus a byte position. Copying it is
//! cheap, and a copy advances independently of its source cursor, which is how
//! lookahead works: copy, read ahead on the copy, and either assign the copy
//! back (commit) or drop it (rewind).
//!
//! ```cpp
//! Tokenizer tokens(input);
//!
//! // Peek the next significant token without consuming it
//! auto ahead = tokens;
//! auto next = ahead.next();
//!
//! // Commit: tokens = ahead;
//! ```
//!
//! ## Raw vs Filtered
//!
//! - `next_raw()` returns every token, including whitespace and comments
//! - `next()` skips whitespace and comments; all syntax-level parsing uses it
//!
//! ## Errors
//!
//! Lexical errors (unrecognized character, unterminated string or block
//! comment, invalid escape) come back as `ParseError` with the span of the
//! offending text. The tokenizer does not recover past an error.

#ifndef PDL_LEXER_LEXER_HPP
#define PDL_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdl::lexer {

/// A token, or `std::nullopt` at end of input.
using TokenResult = Result<std::optional<Token>, ParseError>;

/// Tokenizer for the profile language.
///
/// Holds a non-owning view of the input; the buffer must outlive the
/// tokenizer and every copy of it.
class Tokenizer {
public:
    /// Creates a tokenizer positioned at the start of `input`.
    explicit Tokenizer(std::string_view input);

    /// Returns the next token, including whitespace and comments.
    [[nodiscard]] auto next_raw() -> TokenResult;

    /// Returns the next token that is not whitespace or a comment.
    [[nodiscard]] auto next() -> TokenResult;

    /// Returns what `next()` would return without moving this cursor.
    [[nodiscard]] auto peek() const -> TokenResult;

    /// Consumes the next significant token, requiring it to be `kind`.
    ///
    /// Returns the token's span, or an "expected K, found ..." error.
    [[nodiscard]] auto expect(TokenKind kind) -> Result<Span, ParseError>;

    /// Tokenizes the remaining input into raw tokens.
    [[nodiscard]] auto tokenize() -> Result<std::vector<Token>, ParseError>;

    /// Returns the source text covered by `span`.
    [[nodiscard]] auto get_span(Span span) const -> std::string_view;

    /// Decodes the string literal covered by `span` (quotes included).
    ///
    /// Escape sequences are resolved and `\u{...}` escapes are encoded as UTF-8.
    [[nodiscard]] auto parse_str(Span span) const -> Result<std::string, ParseError>;

    /// Builds the "expected <expected>, found <found>" error.
    ///
    /// With a token, the error carries that token's span and description.
    /// Without one, it reports end of input at a zero-width span at the end
    /// of the buffer.
    [[nodiscard]] auto format_expected_error(std::string_view expected,
                                             const std::optional<Token>& found) const
        -> ParseError;

    /// Zero-width span at the end of the input.
    [[nodiscard]] auto eof_span() const -> Span;

    /// Returns true if `text` lexes as exactly one `Id` token (keywords excluded).
    [[nodiscard]] static auto is_identifier(std::string_view text) -> bool;

    /// Current byte position of this cursor.
    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }

    /// The full input this tokenizer reads from.
    [[nodiscard]] auto input() const -> std::string_view {
        return input_;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek_char() const -> char;
    [[nodiscard]] auto peek_next_char() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind, size_t start) const -> Token;

    void lex_whitespace();
    void lex_line_comment();
    [[nodiscard]] auto lex_block_comment(size_t start) -> std::optional<ParseError>;
    [[nodiscard]] auto lex_identifier(size_t start) -> Token;
    [[nodiscard]] auto lex_string(size_t start) -> TokenResult;

    // ========================================================================
    // Character Classes
    // ========================================================================

    [[nodiscard]] static auto is_whitespace(char c) -> bool;
    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;

    [[nodiscard]] auto unexpected_char_error(size_t start) const -> ParseError;
};

/// Builds a `ParseError` reading "expected <expected>, found <found>".
[[nodiscard]] auto expected_error(std::string_view expected, std::string_view found, Span span,
                                  const char* code) -> ParseError;

/// Decodes the escape sequence that starts at `input[pos]` (the backslash).
///
/// On success `pos` is left just past the escape. On failure the error span
/// covers the malformed escape.
[[nodiscard]] auto decode_escape(std::string_view input, size_t& pos)
    -> Result<char32_t, ParseError>;

/// Appends the UTF-8 encoding of `cp` to `out`.
void encode_utf8(std::string& out, char32_t cp);

} // namespace pdl::lexer

#endif // PDL_LEXER_LEXER_HPP

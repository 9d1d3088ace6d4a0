//! # Token Definitions
//!
//! This module defines the tokens produced by the profile tokenizer.
//!
//! ## Overview
//!
//! The token set is closed and small:
//!
//! - **Trivia**: whitespace runs and comments, returned by the raw tokenizer
//!   so that comments can be attached as documentation
//! - **Names**: bare identifiers and quoted string literals
//! - **Keywords**: `extend`, `provide`, `require`, `implement`, `with`
//!
//! A token carries only its kind and span. Text is recovered by slicing the
//! source buffer, or by decoding escapes for string literals.

#ifndef PDL_LEXER_TOKEN_HPP
#define PDL_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <string_view>

namespace pdl::lexer {

/// All token kinds in the profile language.
enum class TokenKind : uint8_t {
    Whitespace, ///< Run of spaces, tabs, carriage returns and newlines
    Comment,    ///< `// ...` to end of line, or nested `/* ... */`
    Id,         ///< Bare identifier: `foo`, `wasi-http`, `_x1`
    StrLit,     ///< Quoted string: `"iface"`, `"a\u{2603}b"`

    KwExtend,    ///< `extend` - base profile
    KwProvide,   ///< `provide` - exported interface
    KwRequire,   ///< `require` - imported interface
    KwImplement, ///< `implement` - interface bound to a component
    KwWith,      ///< `with` - separates interface and component in `implement`
};

// ============================================================================
// Token Utilities
// ============================================================================

/// Returns a short name for a token kind (`comment`, `extend`, ...).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Returns the phrase used in error messages (`an identifier`, ``keyword `with` ``).
[[nodiscard]] auto describe(TokenKind kind) -> std::string_view;

/// Checks if a token kind is a keyword.
[[nodiscard]] auto is_keyword(TokenKind kind) -> bool;

/// Checks if a token kind is whitespace or a comment.
[[nodiscard]] auto is_trivia(TokenKind kind) -> bool;

/// Looks up a keyword by identifier text; returns `TokenKind::Id` if none matches.
[[nodiscard]] auto keyword_or_id(std::string_view ident) -> TokenKind;

// ============================================================================
// Token
// ============================================================================

/// A lexical token: a kind and the byte range it covers.
struct Token {
    TokenKind kind;
    Span span;

    /// Checks if this token is of the given kind.
    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }
};

} // namespace pdl::lexer

#endif // PDL_LEXER_TOKEN_HPP

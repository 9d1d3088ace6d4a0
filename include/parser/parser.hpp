//! # Profile Parser
//!
//! Recursive-descent parser for profile files. It drives a `lexer::Tokenizer`
//! directly, one declaration at a time, and stops at the first error.
//!
//! ## Grammar
//!
//! ```text
//! profile     := declaration*
//! declaration := extend | provide | require | implement
//! extend      := 'extend' ident
//! provide     := docs 'provide' ident
//! require     := docs 'require' ident
//! implement   := docs 'implement' STRLIT 'with' STRLIT
//! ident       := IDENT | STRLIT
//! docs        := COMMENT*
//! ```
//!
//! ## Lookahead
//!
//! All lookahead is done on copies of the tokenizer. A copy that was only
//! inspected is dropped; the parser's own cursor moves only when a token is
//! actually consumed.

#ifndef PDL_PARSER_PARSER_HPP
#define PDL_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "parser/ast.hpp"

#include <string_view>

namespace pdl::parser {

/// Parser for profile source text.
///
/// The input buffer must outlive the parser and the returned `Ast`.
class Parser {
public:
    explicit Parser(std::string_view input);

    /// Parses every declaration until end of input.
    [[nodiscard]] auto parse() -> Result<Ast, ParseError>;

    /// Collects the comments before the next declaration.
    ///
    /// Whitespace between comments is skipped. The cursor is left at the end
    /// of the last comment, so the next significant token is still unread.
    [[nodiscard]] auto parse_docs() -> Result<Docs, ParseError>;

    /// Parses a bare identifier or a string literal.
    [[nodiscard]] auto parse_id() -> Result<Id, ParseError>;

    /// Parses one declaration, dispatching on its leading keyword.
    [[nodiscard]] auto parse_item(Docs docs) -> Result<Item, ParseError>;

    /// Current cursor (for inspection in tests and tools).
    [[nodiscard]] auto tokens() const -> const lexer::Tokenizer& {
        return tokens_;
    }

private:
    lexer::Tokenizer tokens_;

    auto parse_extend() -> Result<Item, ParseError>;
    auto parse_provide(Docs docs) -> Result<Item, ParseError>;
    auto parse_require(Docs docs) -> Result<Item, ParseError>;
    auto parse_implement(Docs docs) -> Result<Item, ParseError>;

    /// Consumes a string literal and decodes it.
    auto parse_string() -> Result<std::pair<std::string, Span>, ParseError>;
};

/// Parses a whole profile.
[[nodiscard]] auto parse_profile(std::string_view input) -> Result<Ast, ParseError>;

/// Parses `source.content()`.
[[nodiscard]] auto parse_profile(const lexer::Source& source) -> Result<Ast, ParseError>;

} // namespace pdl::parser

#endif // PDL_PARSER_PARSER_HPP

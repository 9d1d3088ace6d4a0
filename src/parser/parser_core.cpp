//! # Parser Core
//!
//! This file implements the parser's driver loop and the two building blocks
//! every declaration shares.
//!
//! | Method         | Description                                   |
//! |----------------|-----------------------------------------------|
//! | `parse()`      | Docs, then one declaration, until end of input|
//! | `parse_docs()` | Collect comments before a declaration         |
//! | `parse_id()`   | Bare identifier or string literal             |
//!
//! ## Doc Attachment
//!
//! Comments attach to the next declaration as long as only whitespace
//! separates them; blank lines do not break a run. Comments at the end of
//! the file, with no declaration after them, are dropped.

#include "parser/parser.hpp"

#include "log/log.hpp"

namespace pdl::parser {

Parser::Parser(std::string_view input) : tokens_(input) {}

auto Parser::parse() -> Result<Ast, ParseError> {
    Ast ast;

    while (true) {
        auto ahead = tokens_.peek();
        if (is_err(ahead)) {
            return unwrap_err(ahead);
        }
        if (!unwrap(ahead).has_value()) {
            break;
        }

        auto docs = parse_docs();
        if (is_err(docs)) {
            return unwrap_err(docs);
        }

        auto item = parse_item(std::move(unwrap(docs)));
        if (is_err(item)) {
            return unwrap_err(item);
        }
        ast.items.push_back(std::move(unwrap(item)));
    }

    PDL_LOG_DEBUG("parser", "parsed " << ast.items.size() << " declaration(s)");
    return ast;
}

auto Parser::parse_docs() -> Result<Docs, ParseError> {
    Docs docs;
    auto scan = tokens_;

    while (true) {
        auto result = scan.next_raw();
        if (is_err(result)) {
            return unwrap_err(result);
        }

        const auto& token = unwrap(result);
        if (!token) {
            break;
        }
        if (token->kind == lexer::TokenKind::Whitespace) {
            continue;
        }
        if (token->kind != lexer::TokenKind::Comment) {
            break;
        }

        docs.docs.push_back(scan.get_span(token->span));
        // Commit only through the comment; trailing whitespace stays unread
        tokens_ = scan;
    }

    if (!docs.empty()) {
        PDL_LOG_TRACE("parser", "collected " << docs.docs.size() << " doc comment(s)");
    }
    return docs;
}

auto Parser::parse_id() -> Result<Id, ParseError> {
    auto result = tokens_.next();
    if (is_err(result)) {
        return unwrap_err(result);
    }

    const auto& token = unwrap(result);
    if (token && token->kind == lexer::TokenKind::Id) {
        return Id{.name = Name::borrowed(tokens_.get_span(token->span)), .span = token->span};
    }
    if (token && token->kind == lexer::TokenKind::StrLit) {
        auto value = tokens_.parse_str(token->span);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        return Id{.name = Name::owned(std::move(unwrap(value))), .span = token->span};
    }

    return tokens_.format_expected_error("an identifier or string", token);
}

auto Parser::parse_string() -> Result<std::pair<std::string, Span>, ParseError> {
    auto result = tokens_.next();
    if (is_err(result)) {
        return unwrap_err(result);
    }

    const auto& token = unwrap(result);
    if (!token || token->kind != lexer::TokenKind::StrLit) {
        return tokens_.format_expected_error(lexer::describe(lexer::TokenKind::StrLit), token);
    }

    auto value = tokens_.parse_str(token->span);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return std::make_pair(std::move(unwrap(value)), token->span);
}

auto parse_profile(std::string_view input) -> Result<Ast, ParseError> {
    Parser parser(input);
    return parser.parse();
}

auto parse_profile(const lexer::Source& source) -> Result<Ast, ParseError> {
    PDL_LOG_DEBUG("parser", "parsing " << source.filename() << " (" << source.length()
                                       << " bytes)");
    return parse_profile(source.content());
}

} // namespace pdl::parser

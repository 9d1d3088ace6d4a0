//! # Tokenizer Core
//!
//! This file implements the tokenizer's dispatch and trivia handling:
//!
//! - **Character access**: `peek_char()`, `advance()`, `is_at_end()`
//! - **Dispatch**: `next_raw()` picks a lexer by the first character
//! - **Filtering**: `next()` and `peek()` skip whitespace and comments
//! - **Comments**: line (`//`) and nested block (`/* */`) comments
//! - **Errors**: the shared "expected ..., found ..." builder
//!
//! ## Dispatch Order
//!
//! 1. Whitespace run
//! 2. `//` or `/*` comment
//! 3. `"` string literal
//! 4. Identifier or keyword
//! 5. Anything else is an unrecognized character

#include "lexer/lexer.hpp"
#include "log/log.hpp"

#include <cstdio>

namespace pdl::lexer {

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

auto Tokenizer::peek_char() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto Tokenizer::peek_next_char() const -> char {
    return pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
}

auto Tokenizer::advance() -> char {
    char c = peek_char();
    ++pos_;
    return c;
}

auto Tokenizer::is_at_end() const -> bool {
    return pos_ >= input_.size();
}

auto Tokenizer::make_token(TokenKind kind, size_t start) const -> Token {
    return Token{.kind = kind,
                 .span = Span{static_cast<uint32_t>(start), static_cast<uint32_t>(pos_)}};
}

auto Tokenizer::is_whitespace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// ============================================================================
// Token Dispatch
// ============================================================================

auto Tokenizer::next_raw() -> TokenResult {
    if (is_at_end()) {
        return std::nullopt;
    }

    size_t start = pos_;
    char c = peek_char();

    if (is_whitespace(c)) {
        lex_whitespace();
        return make_token(TokenKind::Whitespace, start);
    }

    if (c == '/') {
        if (peek_next_char() == '/') {
            lex_line_comment();
            return make_token(TokenKind::Comment, start);
        }
        if (peek_next_char() == '*') {
            if (auto error = lex_block_comment(start)) {
                return *error;
            }
            return make_token(TokenKind::Comment, start);
        }
        return unexpected_char_error(start);
    }

    if (c == '"') {
        return lex_string(start);
    }

    if (is_identifier_start(c)) {
        return lex_identifier(start);
    }

    return unexpected_char_error(start);
}

auto Tokenizer::next() -> TokenResult {
    while (true) {
        auto result = next_raw();
        if (is_err(result)) {
            return result;
        }
        const auto& token = unwrap(result);
        if (!token || !is_trivia(token->kind)) {
            return result;
        }
    }
}

auto Tokenizer::peek() const -> TokenResult {
    Tokenizer ahead = *this;
    return ahead.next();
}

auto Tokenizer::expect(TokenKind kind) -> Result<Span, ParseError> {
    auto result = next();
    if (is_err(result)) {
        return unwrap_err(result);
    }

    const auto& token = unwrap(result);
    if (token && token->kind == kind) {
        return token->span;
    }
    return format_expected_error(describe(kind), token);
}

auto Tokenizer::tokenize() -> Result<std::vector<Token>, ParseError> {
    std::vector<Token> tokens;
    while (true) {
        auto result = next_raw();
        if (is_err(result)) {
            return unwrap_err(result);
        }
        const auto& token = unwrap(result);
        if (!token) {
            return tokens;
        }
        tokens.push_back(*token);
    }
}

auto Tokenizer::get_span(Span span) const -> std::string_view {
    return input_.substr(span.start, span.end - span.start);
}

auto Tokenizer::eof_span() const -> Span {
    auto end = static_cast<uint32_t>(input_.size());
    return Span{end, end};
}

// ============================================================================
// Whitespace and Comments
// ============================================================================

void Tokenizer::lex_whitespace() {
    while (!is_at_end() && is_whitespace(peek_char())) {
        advance();
    }
}

void Tokenizer::lex_line_comment() {
    // Skip //
    advance();
    advance();

    while (!is_at_end() && peek_char() != '\n') {
        // Leave the CR of a CRLF pair to the whitespace token
        if (peek_char() == '\r' && peek_next_char() == '\n') {
            return;
        }
        advance();
    }
}

auto Tokenizer::lex_block_comment(size_t start) -> std::optional<ParseError> {
    // Skip /*
    advance();
    advance();

    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (peek_char() == '/' && peek_next_char() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek_char() == '*' && peek_next_char() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        PDL_LOG_DEBUG("lexer", "unterminated block comment at offset " << start);
        return expected_error("'*/' to close block comment", "end of input",
                              Span{static_cast<uint32_t>(start), eof_span().end},
                              error_codes::LEX_UNTERMINATED_COMMENT);
    }
    return std::nullopt;
}

// ============================================================================
// Errors
// ============================================================================

auto expected_error(std::string_view expected, std::string_view found, Span span,
                    const char* code) -> ParseError {
    std::string message = "expected ";
    message += expected;
    message += ", found ";
    message += found;
    return ParseError{.message = std::move(message), .span = span, .code = code};
}

auto Tokenizer::format_expected_error(std::string_view expected,
                                      const std::optional<Token>& found) const -> ParseError {
    if (found) {
        return expected_error(expected, describe(found->kind), found->span,
                              error_codes::PARSE_UNEXPECTED_TOKEN);
    }
    return expected_error(expected, "end of input", eof_span(),
                          error_codes::PARSE_UNEXPECTED_TOKEN);
}

auto Tokenizer::unexpected_char_error(size_t start) const -> ParseError {
    auto c = static_cast<unsigned char>(input_[start]);

    std::string found = "character ";
    if (c >= 0x20 && c < 0x7F) {
        found += '\'';
        found += static_cast<char>(c);
        found += '\'';
    } else {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(c));
        found += buf;
    }

    PDL_LOG_DEBUG("lexer", "unrecognized " << found << " at offset " << start);
    return expected_error("a token", found,
                          Span{static_cast<uint32_t>(start), static_cast<uint32_t>(start + 1)},
                          error_codes::LEX_INVALID_CHAR);
}

} // namespace pdl::lexer

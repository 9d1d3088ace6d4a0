//! # Tokenizer - Identifiers
//!
//! ## Identifier Rules
//!
//! - Start with an ASCII letter, `_` or `-`
//! - Continue with letters, digits, `_` or `-` (`wasi-http` is one identifier)
//! - Any non-ASCII UTF-8 byte is accepted in both positions
//!
//! After lexing, the text is looked up in the keyword table; `extend`,
//! `provide`, `require`, `implement` and `with` become keyword tokens.

#include "lexer/lexer.hpp"

namespace pdl::lexer {

auto Tokenizer::is_identifier_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '-' || u >= 0x80;
}

auto Tokenizer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto Tokenizer::lex_identifier(size_t start) -> Token {
    while (!is_at_end() && is_identifier_continue(peek_char())) {
        advance();
    }

    auto text = input_.substr(start, pos_ - start);
    return make_token(keyword_or_id(text), start);
}

auto Tokenizer::is_identifier(std::string_view text) -> bool {
    if (text.empty() || !is_identifier_start(text.front())) {
        return false;
    }
    for (char c : text.substr(1)) {
        if (!is_identifier_continue(c)) {
            return false;
        }
    }
    return keyword_or_id(text) == TokenKind::Id;
}

} // namespace pdl::lexer

//! # Tokenizer - Strings
//!
//! This file implements string literal lexing and decoding.
//!
//! ## Escape Sequences
//!
//! | Escape    | Character              |
//! |-----------|------------------------|
//! | `\"`      | Double quote           |
//! | `\'`      | Single quote           |
//! | `\\`      | Backslash              |
//! | `\n`      | Newline                |
//! | `\r`      | Carriage return        |
//! | `\t`      | Tab                    |
//! | `\u{N}`   | Unicode scalar value   |
//!
//! Escapes are validated while lexing, so `parse_str()` only has to decode.
//! A raw newline inside a string is allowed and kept as-is.

#include "lexer/lexer.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace pdl::lexer {

void encode_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static auto is_hex_digit(char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

static auto hex_value(char c) -> uint32_t {
    if (c >= '0' && c <= '9') {
        return static_cast<uint32_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint32_t>(c - 'a' + 10);
    }
    return static_cast<uint32_t>(c - 'A' + 10);
}

static auto invalid_escape(std::string_view input, size_t start, size_t end) -> ParseError {
    end = std::min(end, input.size());

    std::string found = "'";
    found += input.substr(start, end - start);
    found += "'";

    PDL_LOG_DEBUG("lexer", "invalid escape " << found << " at offset " << start);
    return expected_error("a valid escape sequence", found,
                          Span{static_cast<uint32_t>(start), static_cast<uint32_t>(end)},
                          error_codes::LEX_INVALID_ESCAPE);
}

auto decode_escape(std::string_view input, size_t& pos) -> Result<char32_t, ParseError> {
    size_t start = pos;
    ++pos; // backslash

    if (pos >= input.size()) {
        return invalid_escape(input, start, pos);
    }

    char c = input[pos++];
    switch (c) {
    case '"':
        return char32_t('"');
    case '\'':
        return char32_t('\'');
    case '\\':
        return char32_t('\\');
    case 'n':
        return char32_t('\n');
    case 'r':
        return char32_t('\r');
    case 't':
        return char32_t('\t');
    case 'u':
        break;
    default:
        // Report the whole offending character, not one byte of it
        while (pos < input.size() && (static_cast<unsigned char>(input[pos]) & 0xC0) == 0x80) {
            ++pos;
        }
        return invalid_escape(input, start, pos);
    }

    // \u{NNNN}
    if (pos >= input.size() || input[pos] != '{') {
        return invalid_escape(input, start, pos);
    }
    ++pos;

    uint32_t value = 0;
    size_t digits = 0;
    while (pos < input.size() && input[pos] != '}') {
        if (!is_hex_digit(input[pos]) || digits == 6) {
            return invalid_escape(input, start, pos + 1);
        }
        value = (value << 4) | hex_value(input[pos]);
        ++digits;
        ++pos;
    }

    if (pos >= input.size() || digits == 0) {
        return invalid_escape(input, start, pos + 1);
    }
    ++pos; // '}'

    if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        return invalid_escape(input, start, pos);
    }

    return char32_t(value);
}

auto Tokenizer::lex_string(size_t start) -> TokenResult {
    // Skip opening quote
    advance();

    while (!is_at_end()) {
        char c = peek_char();
        if (c == '"') {
            advance();
            return make_token(TokenKind::StrLit, start);
        }
        if (c == '\\') {
            if (pos_ + 1 >= input_.size()) {
                break;
            }
            auto escape = decode_escape(input_, pos_);
            if (is_err(escape)) {
                return unwrap_err(escape);
            }
            continue;
        }
        advance();
    }

    PDL_LOG_DEBUG("lexer", "unterminated string literal at offset " << start);
    return expected_error("'\"' to close string literal", "end of input",
                          Span{static_cast<uint32_t>(start), eof_span().end},
                          error_codes::LEX_UNTERMINATED_STRING);
}

auto Tokenizer::parse_str(Span span) const -> Result<std::string, ParseError> {
    auto text = get_span(span);
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        std::string found = "'";
        found += text;
        found += "'";
        return expected_error(describe(TokenKind::StrLit), found, span,
                              error_codes::PARSE_UNEXPECTED_TOKEN);
    }

    auto body = text.substr(1, text.size() - 2);
    if (body.find('\\') == std::string_view::npos) {
        return std::string(body);
    }

    std::string value;
    value.reserve(body.size());

    size_t pos = span.start + 1;
    size_t end = span.end - 1;
    while (pos < end) {
        if (input_[pos] == '\\') {
            auto escape = decode_escape(input_, pos);
            if (is_err(escape)) {
                return unwrap_err(escape);
            }
            encode_utf8(value, unwrap(escape));
        } else {
            value += input_[pos++];
        }
    }

    return value;
}

} // namespace pdl::lexer

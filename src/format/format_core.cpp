//! # Formatter Core
//!
//! | Method           | Description                         |
//! |------------------|-------------------------------------|
//! | `format()`       | Format a whole profile to a string  |
//! | `emit()`         | Write text to the output buffer     |
//! | `emit_line()`    | Write text followed by a newline    |
//! | `quote_string()` | Render a value as a string literal  |
//! | `format_source()`| Parse, check comments, then format  |

#include "format/formatter.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <cstdio>
#include <unordered_set>

namespace pdl::format {

Formatter::Formatter(FormatOptions options) : options_(options) {}

void Formatter::emit(std::string_view text) {
    output_ << text;
}

void Formatter::emit_line(std::string_view text) {
    output_ << text << "\n";
}

void Formatter::emit_newline() {
    output_ << "\n";
}

auto Formatter::format(const parser::Ast& ast) -> std::string {
    output_.str("");
    output_.clear();

    for (size_t i = 0; i < ast.items.size(); ++i) {
        if (i > 0 && options_.blank_line_between) {
            emit_newline();
        }
        format_item(ast.items[i]);
    }

    PDL_LOG_TRACE("format", "formatted " << ast.items.size() << " declaration(s)");
    return output_.str();
}

auto quote_string(std::string_view value) -> std::string {
    std::string out = "\"";
    out.reserve(value.size() + 2);

    for (char c : value) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                char buf[16];
                std::snprintf(buf, sizeof(buf), "\\u{%x}", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }

    out += '"';
    return out;
}

auto format_profile(const parser::Ast& ast) -> std::string {
    Formatter formatter;
    return formatter.format(ast);
}

/// Finds the first comment in `tokens` that is not one of the attached docs.
static auto find_unattached_comment(std::string_view input,
                                    const std::vector<lexer::Token>& tokens,
                                    const parser::Ast& ast) -> std::optional<ParseError> {
    std::unordered_set<size_t> attached;
    for (const auto& item : ast.items) {
        for (auto doc : item.docs().docs) {
            attached.insert(static_cast<size_t>(doc.data() - input.data()));
        }
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.kind != lexer::TokenKind::Comment || attached.contains(token.span.start)) {
            continue;
        }

        std::string_view found = "end of input";
        for (size_t j = i + 1; j < tokens.size(); ++j) {
            if (!lexer::is_trivia(tokens[j].kind)) {
                found = lexer::describe(tokens[j].kind);
                break;
            }
        }
        return lexer::expected_error("`provide`, `require`, or `implement` after this comment",
                                     found, token.span, error_codes::FORMAT_DROPPED_COMMENT);
    }
    return std::nullopt;
}

auto format_source(std::string_view input, FormatOptions options)
    -> Result<std::string, ParseError> {
    auto parsed = parser::parse_profile(input);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }

    auto tokens = lexer::Tokenizer(input).tokenize();
    if (is_err(tokens)) {
        return unwrap_err(tokens);
    }

    const auto& ast = unwrap(parsed);
    if (auto dropped = find_unattached_comment(input, unwrap(tokens), ast)) {
        PDL_LOG_DEBUG("format", "comment at " << dropped->span.start << " has no declaration");
        return *dropped;
    }

    Formatter formatter(options);
    return formatter.format(ast);
}

} // namespace pdl::format

//! # Token Utilities
//!
//! | Function                | Purpose                                 |
//! |-------------------------|-----------------------------------------|
//! | `token_kind_to_string`  | Short name, used by `pdl lex`           |
//! | `describe`              | Phrase used in "expected/found" errors  |
//! | `keyword_or_id`         | Keyword table lookup                    |

#include "lexer/token.hpp"

#include <unordered_map>

namespace pdl::lexer {

namespace {

const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"extend", TokenKind::KwExtend},       {"provide", TokenKind::KwProvide},
    {"require", TokenKind::KwRequire},     {"implement", TokenKind::KwImplement},
    {"with", TokenKind::KwWith},
};

} // anonymous namespace

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Whitespace:
        return "whitespace";
    case TokenKind::Comment:
        return "comment";
    case TokenKind::Id:
        return "identifier";
    case TokenKind::StrLit:
        return "string";
    case TokenKind::KwExtend:
        return "extend";
    case TokenKind::KwProvide:
        return "provide";
    case TokenKind::KwRequire:
        return "require";
    case TokenKind::KwImplement:
        return "implement";
    case TokenKind::KwWith:
        return "with";
    }
    return "unknown";
}

auto describe(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Whitespace:
        return "whitespace";
    case TokenKind::Comment:
        return "a comment";
    case TokenKind::Id:
        return "an identifier";
    case TokenKind::StrLit:
        return "a string literal";
    case TokenKind::KwExtend:
        return "keyword `extend`";
    case TokenKind::KwProvide:
        return "keyword `provide`";
    case TokenKind::KwRequire:
        return "keyword `require`";
    case TokenKind::KwImplement:
        return "keyword `implement`";
    case TokenKind::KwWith:
        return "keyword `with`";
    }
    return "an unknown token";
}

auto is_keyword(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::KwExtend:
    case TokenKind::KwProvide:
    case TokenKind::KwRequire:
    case TokenKind::KwImplement:
    case TokenKind::KwWith:
        return true;
    default:
        return false;
    }
}

auto is_trivia(TokenKind kind) -> bool {
    return kind == TokenKind::Whitespace || kind == TokenKind::Comment;
}

auto keyword_or_id(std::string_view ident) -> TokenKind {
    auto it = KEYWORDS.find(ident);
    if (it != KEYWORDS.end()) {
        return it->second;
    }
    return TokenKind::Id;
}

} // namespace pdl::lexer

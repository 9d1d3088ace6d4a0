//! # Parser - Declarations
//!
//! | Keyword     | Parser              | Operands                  |
//! |-------------|---------------------|---------------------------|
//! | `extend`    | `parse_extend()`    | ident                     |
//! | `provide`   | `parse_provide()`   | ident                     |
//! | `require`   | `parse_require()`   | ident                     |
//! | `implement` | `parse_implement()` | STRLIT `with` STRLIT      |
//!
//! Each declaration's span starts at its keyword and ends at the last token
//! it consumed.

#include "log/log.hpp"
#include "parser/parser.hpp"

namespace pdl::parser {

using lexer::TokenKind;

auto Parser::parse_item(Docs docs) -> Result<Item, ParseError> {
    auto ahead = tokens_.peek();
    if (is_err(ahead)) {
        return unwrap_err(ahead);
    }

    const auto& token = unwrap(ahead);
    if (token) {
        switch (token->kind) {
        case TokenKind::KwExtend:
            if (!docs.empty()) {
                PDL_LOG_DEBUG("parser", "dropping " << docs.docs.size()
                                                    << " doc comment(s) before `extend`");
            }
            return parse_extend();
        case TokenKind::KwProvide:
            return parse_provide(std::move(docs));
        case TokenKind::KwRequire:
            return parse_require(std::move(docs));
        case TokenKind::KwImplement:
            return parse_implement(std::move(docs));
        default:
            break;
        }
    }

    return tokens_.format_expected_error("`extend`, `provide`, `require`, or `implement`", token);
}

auto Parser::parse_extend() -> Result<Item, ParseError> {
    auto keyword = tokens_.expect(TokenKind::KwExtend);
    if (is_err(keyword)) {
        return unwrap_err(keyword);
    }

    auto profile = parse_id();
    if (is_err(profile)) {
        return unwrap_err(profile);
    }

    auto& id = unwrap(profile);
    Span span = Span::merge(unwrap(keyword), id.span);
    PDL_LOG_DEBUG("parser", "extend " << id.name.view() << " at " << span.start << ".."
                                      << span.end);
    return Item{.kind = Extend{.span = span, .profile = std::move(id)}};
}

auto Parser::parse_provide(Docs docs) -> Result<Item, ParseError> {
    auto keyword = tokens_.expect(TokenKind::KwProvide);
    if (is_err(keyword)) {
        return unwrap_err(keyword);
    }

    auto interface = parse_id();
    if (is_err(interface)) {
        return unwrap_err(interface);
    }

    auto& id = unwrap(interface);
    Span span = Span::merge(unwrap(keyword), id.span);
    PDL_LOG_DEBUG("parser", "provide " << id.name.view() << " at " << span.start << ".."
                                       << span.end);
    return Item{.kind = Provide{.docs = std::move(docs), .span = span, .interface = std::move(id)}};
}

auto Parser::parse_require(Docs docs) -> Result<Item, ParseError> {
    auto keyword = tokens_.expect(TokenKind::KwRequire);
    if (is_err(keyword)) {
        return unwrap_err(keyword);
    }

    auto interface = parse_id();
    if (is_err(interface)) {
        return unwrap_err(interface);
    }

    auto& id = unwrap(interface);
    Span span = Span::merge(unwrap(keyword), id.span);
    PDL_LOG_DEBUG("parser", "require " << id.name.view() << " at " << span.start << ".."
                                       << span.end);
    return Item{.kind = Require{.docs = std::move(docs), .span = span, .interface = std::move(id)}};
}

auto Parser::parse_implement(Docs docs) -> Result<Item, ParseError> {
    auto keyword = tokens_.expect(TokenKind::KwImplement);
    if (is_err(keyword)) {
        return unwrap_err(keyword);
    }

    // Both operands must be quoted; a bare identifier is rejected here
    auto interface = parse_string();
    if (is_err(interface)) {
        return unwrap_err(interface);
    }

    auto with = tokens_.expect(TokenKind::KwWith);
    if (is_err(with)) {
        return unwrap_err(with);
    }

    auto component = parse_string();
    if (is_err(component)) {
        return unwrap_err(component);
    }

    auto& iface_name = unwrap(interface).first;
    auto& comp_name = unwrap(component).first;
    Span span = Span::merge(unwrap(keyword), unwrap(component).second);
    PDL_LOG_DEBUG("parser", "implement \"" << iface_name << "\" with \"" << comp_name << "\" at "
                                           << span.start << ".." << span.end);

    return Item{.kind = Implement{.docs = std::move(docs),
                                  .span = span,
                                  .interface = std::move(iface_name),
                                  .component = std::move(comp_name)}};
}

} // namespace pdl::parser

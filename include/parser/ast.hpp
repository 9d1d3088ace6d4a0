//! # Profile AST
//!
//! This module defines the syntax tree produced by the profile parser.
//!
//! ## Declarations
//!
//! | Kind        | Syntax                             | Docs |
//! |-------------|------------------------------------|------|
//! | `Extend`    | `extend <ident>`                   | no   |
//! | `Provide`   | `provide <ident>`                  | yes  |
//! | `Require`   | `require <ident>`                  | yes  |
//! | `Implement` | `implement "<iface>" with "<comp>"`| yes  |
//!
//! `<ident>` is a bare identifier or a string literal.
//!
//! ## Ownership
//!
//! The `Ast` owns its items. A bare identifier's `Name` and every doc comment
//! are views into the parsed buffer, so the buffer must outlive the tree.
//! Names decoded from string literals own their storage.

#ifndef PDL_PARSER_AST_HPP
#define PDL_PARSER_AST_HPP

#include "common.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace pdl::parser {

// ============================================================================
// Names and Identifiers
// ============================================================================

/// A name that is either borrowed from the source buffer or owned.
///
/// Bare identifiers borrow; string literals are decoded into owned storage.
struct Name {
    std::variant<std::string_view, std::string> value;

    /// Returns the name's text regardless of where it is stored.
    [[nodiscard]] auto view() const -> std::string_view {
        if (const auto* borrowed = std::get_if<std::string_view>(&value)) {
            return *borrowed;
        }
        return std::get<std::string>(value);
    }

    [[nodiscard]] auto is_borrowed() const -> bool {
        return std::holds_alternative<std::string_view>(value);
    }

    [[nodiscard]] static auto borrowed(std::string_view text) -> Name {
        return Name{.value = text};
    }

    [[nodiscard]] static auto owned(std::string text) -> Name {
        return Name{.value = std::move(text)};
    }

    auto operator==(std::string_view other) const -> bool {
        return view() == other;
    }

    auto operator==(const Name& other) const -> bool {
        return view() == other.view();
    }
};

/// An identifier: its name plus the span of the token it came from.
struct Id {
    Name name;
    Span span; ///< Covers the whole token, quotes included for string literals.
};

/// Doc comments preceding a declaration, verbatim and in source order.
struct Docs {
    std::vector<std::string_view> docs;

    [[nodiscard]] auto empty() const -> bool {
        return docs.empty();
    }
};

// ============================================================================
// Declarations
// ============================================================================

/// `extend <ident>`
struct Extend {
    static constexpr std::string_view KEYWORD = "extend";

    Span span;
    Id profile;
};

/// `provide <ident>`
struct Provide {
    static constexpr std::string_view KEYWORD = "provide";

    Docs docs;
    Span span;
    Id interface;
};

/// `require <ident>`
struct Require {
    static constexpr std::string_view KEYWORD = "require";

    Docs docs;
    Span span;
    Id interface;
};

/// `implement "<interface>" with "<component>"`
///
/// Both operands are string literals and are always decoded.
struct Implement {
    static constexpr std::string_view KEYWORD = "implement";

    Docs docs;
    Span span;
    std::string interface;
    std::string component;
};

/// A top-level declaration.
struct Item {
    std::variant<Extend, Provide, Require, Implement> kind;

    /// Checks if this item is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this item as kind `T`. Throws if not that kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// Gets this item as kind `T` (const). Throws if not that kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// Span of the whole declaration, from its keyword to its last token.
    [[nodiscard]] auto span() const -> Span;

    /// Attached doc comments; always empty for `extend`.
    [[nodiscard]] auto docs() const -> const Docs&;
};

/// A parsed profile: its declarations in source order.
struct Ast {
    std::vector<Item> items;
};

/// Returns "extend", "provide", "require" or "implement".
[[nodiscard]] auto item_kind_name(const Item& item) -> std::string_view;

} // namespace pdl::parser

#endif // PDL_PARSER_AST_HPP

#include "parser/ast.hpp"

namespace pdl::parser {

static const Docs NO_DOCS{};

auto Item::span() const -> Span {
    return std::visit([](const auto& decl) { return decl.span; }, kind);
}

auto Item::docs() const -> const Docs& {
    return std::visit(
        [](const auto& decl) -> const Docs& {
            using Decl = std::decay_t<decltype(decl)>;
            if constexpr (std::is_same_v<Decl, Extend>) {
                // extend statements are never documented
                return NO_DOCS;
            } else {
                return decl.docs;
            }
        },
        kind);
}

auto item_kind_name(const Item& item) -> std::string_view {
    return std::visit([](const auto& decl) { return std::decay_t<decltype(decl)>::KEYWORD; },
                      item.kind);
}

} // namespace pdl::parser

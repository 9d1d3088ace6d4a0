//! # Declaration Formatting
//!
//! | Declaration | Output                              |
//! |-------------|-------------------------------------|
//! | Extend      | `extend base`                       |
//! | Provide     | `provide wasi-http`                 |
//! | Require     | `require "needs quoting"`           |
//! | Implement   | `implement "iface" with "comp"`     |
//!
//! Doc comments are written verbatim, one per line, before the declaration.

#include "format/formatter.hpp"
#include "lexer/lexer.hpp"

namespace pdl::format {

void Formatter::format_item(const parser::Item& item) {
    // Every declaration kind needs a format_decl overload
    std::visit([this](const auto& decl) { format_decl(decl); }, item.kind);
}

void Formatter::format_docs(const parser::Docs& docs) {
    for (auto doc : docs.docs) {
        emit_line(doc);
    }
}

auto Formatter::format_id(const parser::Id& id) const -> std::string {
    auto name = id.name.view();
    if (!options_.quote_all && lexer::Tokenizer::is_identifier(name)) {
        return std::string(name);
    }
    return quote_string(name);
}

void Formatter::format_decl(const parser::Extend& extend) {
    emit("extend ");
    emit_line(format_id(extend.profile));
}

void Formatter::format_decl(const parser::Provide& provide) {
    format_docs(provide.docs);
    emit("provide ");
    emit_line(format_id(provide.interface));
}

void Formatter::format_decl(const parser::Require& require) {
    format_docs(require.docs);
    emit("require ");
    emit_line(format_id(require.interface));
}

void Formatter::format_decl(const parser::Implement& implement) {
    format_docs(implement.docs);
    emit("implement ");
    emit(quote_string(implement.interface));
    emit(" with ");
    emit_line(quote_string(implement.component));
}

} // namespace pdl::format

//! # Debug Commands
//!
//! This file implements `pdl lex` and `pdl parse`, which show what the
//! tokenizer and the parser make of a profile file.
//!
//! ## Usage
//!
//! ```bash
//! pdl lex component.profile      # Tokens and comments (whitespace with --verbose)
//! pdl parse component.profile    # Declarations with their spans
//! ```

#include "cmd_debug.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <iostream>
#include <sstream>

namespace pdl::cli {

/// Renders a token's text for display, with newlines and tabs made visible.
static auto display_text(std::string_view text) -> std::string {
    std::string out;
    for (char c : text) {
        switch (c) {
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
            out += c;
        }
    }
    return out;
}

int run_lex(const std::string& path, bool verbose) {
    log::SourceScope scope(path);
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    lexer::Tokenizer tokens(source->content());
    auto result = tokens.tokenize();
    if (is_err(result)) {
        get_diagnostic_emitter().emit(*source, unwrap_err(result));
        return 1;
    }

    const auto& list = unwrap(result);
    for (const auto& token : list) {
        if (!verbose && token.is(lexer::TokenKind::Whitespace)) {
            continue;
        }
        auto loc = source->location(token.span.start);
        std::cout << loc.line << ":" << loc.column << " "
                  << lexer::token_kind_to_string(token.kind) << " `"
                  << display_text(source->slice(token.span)) << "`\n";
    }

    PDL_LOG_INFO("cli", path << ": " << list.size() << " token(s)");
    return 0;
}

int run_parse(const std::string& path, bool verbose) {
    log::SourceScope scope(path);
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    auto result = parser::parse_profile(*source);
    if (is_err(result)) {
        get_diagnostic_emitter().emit(*source, unwrap_err(result));
        return 1;
    }

    const auto& ast = unwrap(result);
    for (const auto& item : ast.items) {
        auto span = item.span();
        auto loc = source->location(span.start);

        std::ostringstream line;
        line << loc.line << ":" << loc.column << " " << item_kind_name(item);
        if (item.is<parser::Extend>()) {
            line << " " << item.as<parser::Extend>().profile.name.view();
        } else if (item.is<parser::Provide>()) {
            line << " " << item.as<parser::Provide>().interface.name.view();
        } else if (item.is<parser::Require>()) {
            line << " " << item.as<parser::Require>().interface.name.view();
        } else if (item.is<parser::Implement>()) {
            const auto& implement = item.as<parser::Implement>();
            line << " " << implement.interface << " with " << implement.component;
        }
        line << " [" << span.start << ".." << span.end << "]";

        const auto& docs = item.docs();
        if (!docs.empty()) {
            line << " (" << docs.docs.size() << " doc comment(s))";
        }
        std::cout << line.str() << "\n";

        if (verbose) {
            for (auto doc : docs.docs) {
                std::cout << "    " << display_text(doc) << "\n";
            }
        }
    }

    PDL_LOG_INFO("cli", path << ": " << ast.items.size() << " declaration(s)");
    return 0;
}

} // namespace pdl::cli

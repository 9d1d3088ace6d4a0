//! # CLI Utilities
//!
//! Shared helpers for the `pdl` commands.

#include "utils.hpp"

#include "common.hpp"
#include "log/log.hpp"

#include <iostream>

namespace pdl::cli {

std::optional<lexer::Source> load_source(const std::string& path) {
    auto result = lexer::Source::from_file(path);
    if (is_err(result)) {
        PDL_LOG_ERROR("cli", unwrap_err(result));
        return std::nullopt;
    }
    return std::move(unwrap(result));
}

void print_usage() {
    std::cout << "Usage: pdl <command> [options] <file>\n\n"
              << "Commands:\n"
              << "  lex <file>            Print the token stream\n"
              << "  parse <file>          Print one line per declaration\n"
              << "  fmt <file> [--check]  Print canonical text, or check it is canonical\n\n"
              << "Options:\n"
              << "  --error-format=<fmt>  Diagnostic format: text (default) or json\n"
              << "  --no-color            Disable colored diagnostics\n"
              << "  --verbose             Show trivia tokens and doc comments\n"
              << "  --log-level=<level>   trace, debug, info, warn, error, off\n"
              << "  --log-filter=<spec>   Per-module levels, e.g. parser=debug,*=warn\n"
              << "  --log-file=<path>     Also write logs to a file\n"
              << "  --log-format=<fmt>    Log format: text or json\n"
              << "  -v, -vv, -vvv         Log at info, debug or trace\n"
              << "  -q, --quiet           Only log errors\n"
              << "  -h, --help            Show this help\n"
              << "  -V, --version         Show version\n\n"
              << "Environment:\n"
              << "  PDL_LOG               Log level or filter when no log flag is given\n";
}

void print_version() {
    std::cout << "pdl " << VERSION << "\n";
}

} // namespace pdl::cli

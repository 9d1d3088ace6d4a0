//! # CLI Command Dispatcher
//!
//! Parses command-line arguments and routes to the command handlers.
//!
//! ## Architecture
//!
//! ```text
//! pdl_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ lex            → run_lex()
//!   ├─ parse          → run_parse()
//!   └─ fmt            → run_fmt()
//! ```
//!
//! ## Global Flags
//!
//! Accepted anywhere after the command:
//! - `--error-format=text|json`: Diagnostic format
//! - `--no-color`: Plain diagnostics
//! - `--verbose`: More output from the command itself
//! - Logging flags (see `log/log.hpp`)

#include "cli/diagnostic.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "commands/cmd_debug.hpp"
#include "commands/cmd_format.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace pdl::cli {

/// Consumes the global flags, leaving positional arguments and
/// command-specific flags in the returned list. Returns false on a
/// malformed global flag.
static bool parse_global_flags(int argc, char* argv[], std::vector<std::string>& rest) {
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--error-format=")) {
            auto fmt = arg.substr(15);
            if (fmt == "json") {
                ToolOptions::diagnostic_format = DiagnosticFormat::JSON;
            } else if (fmt == "text") {
                ToolOptions::diagnostic_format = DiagnosticFormat::Text;
            } else {
                std::cerr << "error: unknown error format '" << fmt << "' (expected text or json)\n";
                return false;
            }
        } else if (arg == "--no-color") {
            ToolOptions::color = false;
        } else if (arg == "--verbose") {
            ToolOptions::verbose = true;
        } else if (!log::is_log_option(arg)) {
            rest.emplace_back(arg);
        }
    }
    return true;
}

} // namespace pdl::cli

using namespace pdl;
using namespace pdl::cli;

/// Main entry point for the `pdl` tool.
///
/// ## Return Codes
///
/// | Code | Meaning                                        |
/// |------|------------------------------------------------|
/// | 0    | Success                                        |
/// | 1    | Parse error, I/O error, or file not canonical  |
int pdl_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    std::vector<std::string> args;
    if (!parse_global_flags(argc, argv, args)) {
        return 1;
    }

    if (!ToolOptions::color) {
        get_diagnostic_emitter().set_color_enabled(false);
    }
    bool verbose = ToolOptions::verbose;

    PDL_LOG_DEBUG("cli", "command '" << command << "' with " << args.size() << " argument(s)");

    if (command == "lex") {
        if (args.size() != 1) {
            std::cerr << "Usage: pdl lex <file> [--verbose]\n";
            return 1;
        }
        return run_lex(args[0], verbose);
    }

    if (command == "parse") {
        if (args.size() != 1) {
            std::cerr << "Usage: pdl parse <file> [--verbose]\n";
            return 1;
        }
        return run_parse(args[0], verbose);
    }

    if (command == "fmt") {
        bool check_only = false;
        std::string path;
        for (const auto& arg : args) {
            if (arg == "--check") {
                check_only = true;
            } else if (path.empty()) {
                path = arg;
            } else {
                path.clear();
                break;
            }
        }
        if (path.empty()) {
            std::cerr << "Usage: pdl fmt <file> [--check]\n";
            return 1;
        }
        return run_fmt(path, check_only, verbose);
    }

    std::cerr << "error: unknown command '" << command << "'\n\n";
    print_usage();
    return 1;
}

//! # Log Initialization from CLI
//!
//! Turns logging flags and the PDL_LOG environment variable into a LogConfig.
//!
//! | Flag                  | Effect                          |
//! |-----------------------|---------------------------------|
//! | `--log-level=<lvl>`   | Global minimum level            |
//! | `--log-filter=<spec>` | Per-module levels               |
//! | `--log-file=<path>`   | Also write to a file            |
//! | `--log-format=json`   | JSON lines instead of text      |
//! | `-v` / `-vv` / `-vvv` | Info / Debug / Trace            |
//! | `-q`, `--quiet`       | Errors only                     |

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace pdl::log {

static auto is_verbosity_flag(std::string_view arg) -> bool {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v') {
            return false;
        }
    }
    return true;
}

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || is_verbosity_flag(arg);
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (is_verbosity_flag(arg)) {
            v_count = std::max(v_count, static_cast<int>(arg.size() - 1));
        }
    }

    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("PDL_LOG");
        std::string_view env = env_log ? env_log : "";
        if (!env.empty()) {
            // "parser=debug" or "lexer,parser" is a filter; anything else a level
            if (env.find('=') != std::string_view::npos ||
                env.find(',') != std::string_view::npos) {
                config.filter_spec = std::string(env);
            } else {
                config.level = parse_level(env);
            }
        }
    }

    return config;
}

} // namespace pdl::log

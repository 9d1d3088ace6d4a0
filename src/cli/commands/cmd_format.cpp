//! # Format Command
//!
//! This file implements `pdl fmt`.
//!
//! ## Usage
//!
//! ```bash
//! pdl fmt component.profile           # Print the canonical form to stdout
//! pdl fmt component.profile --check   # Exit 1 if the file is not canonical
//! ```
//!
//! ## Process
//!
//! 1. Read the file
//! 2. Parse it; a parse error is reported and nothing is printed
//! 3. Refuse (F001) if a comment would not survive formatting
//! 4. Format the tree and print it, or compare it with the file under `--check`

#include "cmd_format.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "format/formatter.hpp"
#include "log/log.hpp"

#include <iostream>

namespace pdl::cli {

int run_fmt(const std::string& path, bool check_only, bool verbose) {
    log::SourceScope scope(path);
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    auto result = format::format_source(source->content());
    if (is_err(result)) {
        get_diagnostic_emitter().emit(*source, unwrap_err(result));
        return 1;
    }
    const std::string& formatted = unwrap(result);

    if (check_only) {
        if (formatted != source->content()) {
            std::cerr << "would reformat: " << path << "\n";
            return 1;
        }
        if (verbose) {
            std::cerr << "already formatted: " << path << "\n";
        }
        return 0;
    }

    std::cout << formatted;
    PDL_LOG_INFO("cli", "formatted " << path);
    return 0;
}

} // namespace pdl::cli

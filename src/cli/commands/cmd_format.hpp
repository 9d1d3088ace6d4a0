//! # Format Command Interface
//!
//! | Function    | Command   | Description                            |
//! |-------------|-----------|----------------------------------------|
//! | `run_fmt()` | `pdl fmt` | Print canonical text or check a file   |

#pragma once
#include <string>

namespace pdl::cli {

int run_fmt(const std::string& path, bool check_only, bool verbose);

} // namespace pdl::cli

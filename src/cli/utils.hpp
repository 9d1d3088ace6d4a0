//! # CLI Utilities Interface
//!
//! | Function          | Description                              |
//! |-------------------|------------------------------------------|
//! | `load_source()`   | Read a profile file, logging on failure  |
//! | `print_usage()`   | Print CLI help text                      |
//! | `print_version()` | Print tool version                       |

#pragma once
#include "lexer/source.hpp"

#include <optional>
#include <string>

namespace pdl::cli {

// File I/O
std::optional<lexer::Source> load_source(const std::string& path);

// Help text
void print_usage();
void print_version();

} // namespace pdl::cli

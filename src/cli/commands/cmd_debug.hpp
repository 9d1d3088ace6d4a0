//! # Debug Commands Interface
//!
//! | Function      | Command     | Output                         |
//! |---------------|-------------|--------------------------------|
//! | `run_lex()`   | `pdl lex`   | Raw token stream               |
//! | `run_parse()` | `pdl parse` | One line per declaration       |

#pragma once
#include <string>

namespace pdl::cli {

int run_lex(const std::string& path, bool verbose);
int run_parse(const std::string& path, bool verbose);

} // namespace pdl::cli

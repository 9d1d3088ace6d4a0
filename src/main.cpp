//! # PDL Entry Point
//!
//! The `pdl` binary inspects and formats profile files.
//!
//! ```bash
//! pdl lex component.profile
//! pdl parse component.profile
//! pdl fmt component.profile --check
//! ```
//!
//! All work happens in `pdl_main()` (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return pdl_main(argc, argv);
}

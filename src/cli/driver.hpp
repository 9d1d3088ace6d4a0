//! # Driver Interface
//!
//! `pdl_main()` dispatches to the command handler named by argv[1].

#pragma once

int pdl_main(int argc, char* argv[]);

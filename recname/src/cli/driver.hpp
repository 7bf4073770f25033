//! # Command-Line Driver Interface
//!
//! `recname_main()` dispatches to the appropriate command handler based on argv[1].

#pragma once

namespace recname::cli {

// Main driver entry point
int recname_main(int argc, char* argv[]);

} // namespace recname::cli

//! # CLI Driver Interface
//!
//! `jsonfmt_main()` is the whole program: it configures logging, parses the
//! arguments and runs the format command.

#pragma once

namespace jsonfmt::cli {

/// Runs the `jsonfmt` command line and returns the process exit code.
int jsonfmt_main(int argc, char* argv[]);

} // namespace jsonfmt::cli

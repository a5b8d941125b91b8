//! # CLI Options
//!
//! | Option | Effect |
//! |--------|--------|
//! | `<file>` | JSON file to format (required) |
//! | `--check` | Only report whether the file is already formatted |
//! | `--indent=<n>` | Spaces per nesting level (default 2) |
//! | `--help`, `-h` | Print usage |
//! | `--version`, `-V` | Print version |
//!
//! Logging options (`--log-level=`, `-v`, ...) are accepted here and
//! interpreted by `log::parse_log_options`.

#pragma once

#include "common.hpp"
#include "json/json_formatter.hpp"

#include <string>
#include <vector>

namespace jsonfmt::cli {

/// Parsed command line.
struct CliOptions {
    std::string file;
    bool check = false;
    bool help = false;
    bool version = false;
    json::FormatOptions format;
};

/// Parses the arguments after the program name.
///
/// # Returns
///
/// The options, or the message to print before exiting with status 1.
/// `--help` and `--version` succeed without a file argument.
[[nodiscard]] auto parse_cli_args(const std::vector<std::string>& args)
    -> Result<CliOptions, std::string>;

} // namespace jsonfmt::cli

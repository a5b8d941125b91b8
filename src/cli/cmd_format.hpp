//! # Format Command Interface

#pragma once

#include "cli/options.hpp"

#include <iosfwd>
#include <string_view>

namespace jsonfmt::cli {

/// Formats `options.file` and writes the result to `out`.
///
/// With `options.check` nothing is written to `out`; the exit code tells
/// whether the file already matches its formatted form.
///
/// # Returns
///
/// 0 on success, 1 on any read, format or check failure (reported on `err`).
int run_format(const CliOptions& options, std::ostream& out, std::ostream& err);

/// True if `content` equals `formatted`, optionally followed by one newline.
[[nodiscard]] auto is_formatted(std::string_view content, std::string_view formatted) -> bool;

} // namespace jsonfmt::cli

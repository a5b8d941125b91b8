//! # CLI Utilities Interface
//!
//! | Function | Description |
//! |----------|-------------|
//! | `read_file()` | Read entire file to string |
//! | `print_usage()` | Print CLI help text |
//! | `print_version()` | Print version |

#pragma once

#include "common.hpp"

#include <iosfwd>
#include <string>

namespace jsonfmt::cli {

enum class ReadErrorKind {
    NotFound,
    PermissionDenied,
    Other
};

/// Why a file could not be read.
struct ReadError {
    ReadErrorKind kind = ReadErrorKind::Other;
    std::string path;
    std::string reason; ///< OS description, used for `Other`

    /// User-facing message, e.g. `No such file or directory: 'a.json'`.
    [[nodiscard]] auto to_string() const -> std::string;
};

// File I/O
[[nodiscard]] auto read_file(const std::string& path) -> Result<std::string, ReadError>;

// Help text
void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace jsonfmt::cli

//! # Format Command
//!
//! ## Usage
//!
//! ```bash
//! jsonfmt data.json              # Print the formatted document
//! jsonfmt --indent=4 data.json   # Four spaces per level
//! jsonfmt --check data.json      # Exit 1 if data.json would change
//! ```
//!
//! ## Process
//!
//! 1. Read the file
//! 2. tokenize → parse → format
//! 3. Print, or compare against the file contents in check mode

#include "cli/cmd_format.hpp"

#include "cli/utils.hpp"
#include "json/json.hpp"
#include "log/log.hpp"

#include <ostream>

namespace jsonfmt::cli {

auto is_formatted(std::string_view content, std::string_view formatted) -> bool {
    if (content.ends_with('\n')) {
        content.remove_suffix(1);
    }
    return content == formatted;
}

int run_format(const CliOptions& options, std::ostream& out, std::ostream& err) {
    auto content = read_file(options.file);
    if (is_err(content)) {
        const auto& error = unwrap_err(content);
        JSONFMT_LOG_ERROR("cli", "Cannot read " << error.path << ": " << error.reason);
        err << error.to_string() << "\n";
        return 1;
    }

    const auto& text = unwrap(content);
    auto formatted = json::format_json(text, options.format);
    if (is_err(formatted)) {
        const auto& error = unwrap_err(formatted);
        JSONFMT_LOG_DEBUG("cli", options.file << ":" << error.line() << ":" << error.column()
                                              << ": " << error.to_string());
        err << "error: " << error.to_string() << "\n";
        return 1;
    }

    if (options.check) {
        if (is_formatted(text, unwrap(formatted))) {
            JSONFMT_LOG_INFO("cli", "'" << options.file << "' is already formatted");
            return 0;
        }
        err << "'" << options.file << "' would be reformatted\n";
        return 1;
    }

    out << unwrap(formatted) << "\n";
    return 0;
}

} // namespace jsonfmt::cli

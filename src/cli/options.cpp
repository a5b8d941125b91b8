//! # CLI Option Parsing

#include "cli/options.hpp"

#include "log/log.hpp"

#include <charconv>

namespace jsonfmt::cli {

namespace {

constexpr size_t MAX_INDENT = 16;

auto parse_indent(std::string_view text) -> Result<size_t, std::string> {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
        value > MAX_INDENT) {
        return std::string("Invalid indent: '") + std::string(text) + "'";
    }
    return value;
}

} // anonymous namespace

auto parse_cli_args(const std::vector<std::string>& args) -> Result<CliOptions, std::string> {
    CliOptions options;

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.version = true;
        } else if (arg == "--check") {
            options.check = true;
        } else if (arg.starts_with("--indent=")) {
            auto indent = parse_indent(std::string_view(arg).substr(9));
            if (is_err(indent)) {
                return unwrap_err(indent);
            }
            options.format.indent = unwrap(indent);
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "Unknown option: '" + arg + "'";
        } else if (options.file.empty()) {
            options.file = arg;
        } else {
            return "Unexpected argument: '" + arg + "'";
        }
    }

    if (options.help || options.version) {
        return options;
    }
    if (options.file.empty()) {
        return std::string("No filename provided");
    }
    return options;
}

} // namespace jsonfmt::cli

//! # CLI Utilities

#include "cli/utils.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace jsonfmt::cli {

auto ReadError::to_string() const -> std::string {
    switch (kind) {
    case ReadErrorKind::NotFound:
        return "No such file or directory: '" + path + "'";
    case ReadErrorKind::PermissionDenied:
        return "Permission denied: '" + path + "'";
    case ReadErrorKind::Other:
        return "Error reading file '" + path + "': " + reason;
    }
    return "Error reading file '" + path + "'";
}

static auto make_read_error(const std::string& path, std::error_code ec) -> ReadError {
    ReadError error;
    error.path = path;
    error.reason = ec.message();
    if (ec == std::errc::no_such_file_or_directory) {
        error.kind = ReadErrorKind::NotFound;
    } else if (ec == std::errc::permission_denied) {
        error.kind = ReadErrorKind::PermissionDenied;
    } else {
        error.kind = ReadErrorKind::Other;
    }
    return error;
}

auto read_file(const std::string& path) -> Result<std::string, ReadError> {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return make_read_error(path, std::make_error_code(std::errc::is_a_directory));
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        int err = errno != 0 ? errno : ENOENT;
        return make_read_error(path, std::error_code(err, std::generic_category()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return make_read_error(path, std::make_error_code(std::errc::io_error));
    }
    return buffer.str();
}

void print_usage(std::ostream& out) {
    out << "jsonfmt " << VERSION << "\n\n";
    out << "Usage: jsonfmt [options] <file>\n\n";
    out << "Reformats a JSON file and prints it to stdout.\n\n";
    out << "Options:\n";
    out << "  --check             Exit with 1 if the file is not already formatted\n";
    out << "  --indent=<n>        Spaces per nesting level (default: 2)\n";
    out << "  -h, --help          Show this help\n";
    out << "  -V, --version       Show version\n\n";
    out << "Logging:\n";
    out << "  -q, --quiet         Only log errors\n";
    out << "  -v, -vv, -vvv       Log info, debug or trace messages\n";
    out << "  --log-level=<lvl>   trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec> Per-module levels, e.g. parser=trace,*=warn\n";
    out << "  --log-file=<path>   Also write log messages to a file\n";
    out << "  --log-format=<fmt>  text or json\n\n";
    out << "Environment:\n";
    out << "  JSONFMT_LOG         Level name or filter spec when no log option is given\n";
}

void print_version(std::ostream& out) {
    out << "jsonfmt " << VERSION << "\n";
}

} // namespace jsonfmt::cli

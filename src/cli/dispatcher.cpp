//! # CLI Dispatcher
//!
//! ```text
//! jsonfmt_main()
//!   ├─ logging options → log::Logger::init()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   └─ <file>          → run_format()
//! ```

#include "cli/cmd_format.hpp"
#include "cli/driver.hpp"
#include "cli/options.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace jsonfmt::cli {

/// ## Return Codes
///
/// | Code | Meaning |
/// |------|---------|
/// | 0 | Success, or the file is already formatted (`--check`) |
/// | 1 | Bad arguments, unreadable file, invalid JSON, or `--check` mismatch |
int jsonfmt_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    auto parsed = parse_cli_args(args);
    if (is_err(parsed)) {
        std::cerr << unwrap_err(parsed) << "\n";
        return 1;
    }

    const auto& options = unwrap(parsed);
    if (options.help) {
        print_usage(std::cout);
        return 0;
    }
    if (options.version) {
        print_version(std::cout);
        return 0;
    }

    int rc = run_format(options, std::cout, std::cerr);
    log::Logger::instance().flush();
    return rc;
}

} // namespace jsonfmt::cli

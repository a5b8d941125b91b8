//! # jsonfmt Entry Point
//!
//! Delegates to the CLI driver (`cli/driver.hpp`).
//!
//! ```bash
//! jsonfmt data.json
//! jsonfmt --check --indent=4 data.json
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return jsonfmt::cli::jsonfmt_main(argc, argv);
}

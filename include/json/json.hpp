//! # jsonfmt JSON Library
//!
//! Main public header: the three pipeline stages and the `format_json`
//! entry point that composes them.
//!
//! ```text
//! text --tokenize--> tokens --parse--> JsonValue --format--> text
//! ```
//!
//! ## Quick Start
//!
//! ```cpp
//! #include "json/json.hpp"
//! using namespace jsonfmt;       // Result helpers: is_ok, unwrap, ...
//! using namespace jsonfmt::json;
//!
//! auto result = format_json(R"({"a":[1,2],"b":{}})");
//! if (is_ok(result)) {
//!     std::cout << unwrap(result) << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result) << std::endl;
//! }
//! ```
//!
//! ## Modules
//!
//! | Header | Description |
//! |--------|-------------|
//! | `json_token.hpp` | Token type |
//! | `json_error.hpp` | Tokenizer, parser and pipeline errors |
//! | `json_value.hpp` | Value tree (`JsonValue`, `JsonArray`, `JsonObject`) |
//! | `json_tokenizer.hpp` | Text to tokens |
//! | `json_parser.hpp` | Tokens to value tree |
//! | `json_formatter.hpp` | Value tree to canonical text |

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_formatter.hpp"
#include "json/json_parser.hpp"
#include "json/json_token.hpp"
#include "json/json_tokenizer.hpp"
#include "json/json_value.hpp"

#include <string>
#include <string_view>

namespace jsonfmt::json {

/// Tokenizes and parses `content`.
///
/// # Returns
///
/// The value tree, or the first tokenize or parse error.
[[nodiscard]] auto parse_json(std::string_view content) -> Result<JsonValue, Error>;

/// Reformats JSON text into its canonical indented form.
///
/// # Arguments
///
/// * `content` - The JSON text
/// * `options` - Formatter settings
///
/// # Returns
///
/// The formatted text (no trailing newline), or the first error. Tokenize
/// errors take precedence since parsing never starts on bad input.
[[nodiscard]] auto format_json(std::string_view content, const FormatOptions& options = {})
    -> Result<std::string, Error>;

} // namespace jsonfmt::json

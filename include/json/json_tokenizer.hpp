//! # JSON Tokenizer
//!
//! Turns JSON text into a flat sequence of `JsonToken`s in a single
//! left-to-right pass with one character of lookahead.
//!
//! ## Scanning Rules
//!
//! | First character | Branch | Result |
//! |-----------------|--------|--------|
//! | space, `\t`, `\n`, `\r` | skipped | - |
//! | `[` `]` `{` `}` `:` `,` | punctuation | single-character token |
//! | `"` | string | `String` with escapes decoded |
//! | `-`, `0`-`9` | number | `Number` |
//! | anything else | bareword | `True`, `False`, `Null` or `UnexpectedLiteral` |
//!
//! The first error aborts the scan; no partial token list is produced.
//!
//! ## Example
//!
//! ```cpp
//! using namespace jsonfmt;       // Result helpers: is_ok, unwrap, ...
//! using namespace jsonfmt::json;
//!
//! auto result = tokenize(R"({"a": [1, true]})");
//! if (is_ok(result)) {
//!     for (const auto& tok : unwrap(result)) {
//!         std::cout << tok << std::endl;
//!     }
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_token.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jsonfmt::json {

/// Single-use scanner over one input buffer.
///
/// The tokenizer does not copy the input; the viewed text must outlive the
/// `tokenize()` call.
class JsonTokenizer {
public:
    /// Creates a tokenizer for the given input.
    ///
    /// # Arguments
    ///
    /// * `input` - The JSON text to tokenize
    explicit JsonTokenizer(std::string_view input);

    /// Scans the whole input.
    ///
    /// # Returns
    ///
    /// All tokens in input order, or the first error encountered.
    [[nodiscard]] auto tokenize() -> Result<std::vector<JsonToken>, TokenizeError>;

private:
    /// Where a token or escape began.
    struct Mark {
        size_t offset;
        size_t line;
        size_t column;
    };

    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }

    /// Current character, or `'\0'` at end of input.
    [[nodiscard]] auto peek() const -> char;

    /// Consumes and returns the current character, tracking line and column.
    auto advance() -> char;

    [[nodiscard]] auto mark() const -> Mark {
        return Mark{pos_, line_, column_};
    }

    [[nodiscard]] auto make_token(JsonToken tok, const Mark& start) const -> JsonToken;

    [[nodiscard]] auto make_error(TokenizeErrorKind kind, std::string text,
                                  const Mark& at) const -> TokenizeError;

    auto scan_string() -> Result<JsonToken, TokenizeError>;
    auto scan_number() -> Result<JsonToken, TokenizeError>;
    auto scan_literal() -> Result<JsonToken, TokenizeError>;

    /// Decodes the body of a `\u` escape (the `\u` is already consumed),
    /// combining a surrogate pair into one scalar value.
    auto scan_unicode_escape(const Mark& escape_start) -> Result<uint32_t, TokenizeError>;

    /// Reads up to four characters, stopping early at `"`, at a non-ASCII
    /// byte, or at end of input.
    auto read_hex4() -> std::string;
};

/// Tokenizes `input` with a fresh `JsonTokenizer`.
[[nodiscard]] auto tokenize(std::string_view input) -> Result<std::vector<JsonToken>, TokenizeError>;

/// True for the characters that end a bareword: punctuation and whitespace.
[[nodiscard]] auto is_delimiter(char c) -> bool;

/// Appends `codepoint` to `out` as UTF-8 (1 to 4 bytes).
void append_utf8(std::string& out, uint32_t codepoint);

} // namespace jsonfmt::json

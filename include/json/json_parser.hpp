//! # JSON Parser
//!
//! Recursive descent parser that builds a `JsonValue` tree from the token
//! sequence produced by `JsonTokenizer`.
//!
//! ## Grammar
//!
//! ```text
//! value  := Null | True | False | Number | String | array | object
//! array  := '[' (value (',' value)*)? ']'
//! object := '{' (member (',' member)*)? '}'
//! member := String ':' value
//! ```
//!
//! One function per nonterminal, one token of lookahead. The token
//! sequence must begin with one complete value; the first violation aborts
//! the parse. Tokens after that value are ignored, so `[1] 2` parses as
//! `[1]`.
//!
//! ## Example
//!
//! ```cpp
//! using namespace jsonfmt;       // Result helpers: is_ok, unwrap, ...
//! using namespace jsonfmt::json;
//!
//! auto tokens = tokenize(R"({"name": "Alice", "tags": []})");
//! auto result = parse(std::move(unwrap(tokens)));
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("name")->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_token.hpp"
#include "json/json_value.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace jsonfmt::json {

/// Recursive descent JSON parser over an owned token sequence.
///
/// String payloads are moved out of the tokens into the tree, so a parser
/// can run `parse()` only once.
class JsonParser {
public:
    /// Maximum number of nested containers.
    static constexpr size_t MAX_DEPTH = 1000;

    /// Creates a parser for the given tokens.
    ///
    /// # Arguments
    ///
    /// * `tokens` - Tokens in input order, as returned by `tokenize`
    explicit JsonParser(std::vector<JsonToken> tokens);

    /// Parses the tokens into a single value.
    ///
    /// # Returns
    ///
    /// The value tree, or the first `ParserError`. Tokens left over after
    /// the root value are reported as `UnexpectedToken`.
    [[nodiscard]] auto parse() -> Result<JsonValue, ParserError>;

private:
    std::vector<JsonToken> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;

    /// Current token, or `nullptr` when all tokens are consumed.
    [[nodiscard]] auto peek() const -> const JsonToken*;

    /// Consumes the current token.
    auto advance() -> JsonToken&;

    auto parse_value() -> Result<JsonValue, ParserError>;
    auto parse_array() -> Result<JsonValue, ParserError>;
    auto parse_object() -> Result<JsonValue, ParserError>;

    /// Parses `String ':' value` and appends it to `object`.
    auto parse_member(JsonObject& object) -> std::optional<ParserError>;
};

/// Parses `tokens` with a fresh `JsonParser`.
[[nodiscard]] auto parse(std::vector<JsonToken> tokens) -> Result<JsonValue, ParserError>;

} // namespace jsonfmt::json

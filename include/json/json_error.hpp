//! # JSON Error Types
//!
//! Error types for the two fallible pipeline stages. Every error carries the
//! context needed to render a diagnostic (the offending character, literal
//! or token) plus the source location where it was detected.
//!
//! ## Diagnostics
//!
//! | Error | `to_string()` |
//! |-------|---------------|
//! | `InvalidEscapeCharacter` | `Invalid escape character: '<text>'` |
//! | `InvalidNumberLiteral` | `Invalid number literal: '<text>'` |
//! | `UnexpectedCharacter` | `Unexpected character: '<char>'` |
//! | `UnexpectedEndOfInput` | `Unexpected end of input` |
//! | `UnexpectedLiteral` | `Unexpected literal: '<text>'` |
//! | `UnexpectedToken` | `Unexpected token: '<rendered token>'` |
//! | `MaxDepthExceeded` | `Maximum nesting depth exceeded` |
//!
//! ## Example
//!
//! ```cpp
//! using namespace jsonfmt;       // Result helpers: is_ok, unwrap, ...
//! using namespace jsonfmt::json;
//!
//! auto result = format_json("[1, 2");
//! if (is_err(result)) {
//!     const auto& error = unwrap_err(result);
//!     std::cerr << error.to_string() << std::endl;
//!     // Output: "Unexpected end of input"
//! }
//! ```

#pragma once

#include "json/json_token.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace jsonfmt::json {

// ============================================================================
// Tokenizer Errors
// ============================================================================

/// Lexical error categories.
enum class TokenizeErrorKind : uint8_t {
    UnexpectedLiteral,      ///< Bareword other than `true`, `false`, `null`
    UnexpectedCharacter,    ///< Character no scanner branch accepts
    UnexpectedEndOfInput,   ///< Input ended inside a string or escape
    InvalidEscapeCharacter, ///< Unknown escape or malformed `\uXXXX`
    InvalidNumberLiteral    ///< Numeric text that does not convert to a double
};

/// An error raised while tokenizing.
///
/// `text` holds the offending literal, character or escape digits; it is
/// empty for `UnexpectedEndOfInput`. Equality ignores the location fields.
struct TokenizeError {
    TokenizeErrorKind kind = TokenizeErrorKind::UnexpectedEndOfInput;
    std::string text;

    /// Line number where the error was detected (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error was detected (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset where the error was detected.
    size_t offset = 0;

    [[nodiscard]] static auto make(TokenizeErrorKind kind, std::string text = {}) -> TokenizeError {
        TokenizeError error;
        error.kind = kind;
        error.text = std::move(text);
        return error;
    }

    /// Formats the diagnostic message (without location).
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const TokenizeError& other) const -> bool {
        return kind == other.kind && text == other.text;
    }
};

// ============================================================================
// Parser Errors
// ============================================================================

/// Syntactic error categories.
enum class ParserErrorKind : uint8_t {
    UnexpectedToken,      ///< Token not allowed at this grammar position
    UnexpectedEndOfInput, ///< Token sequence ended before the value was complete
    MaxDepthExceeded      ///< Containers nested deeper than the parser allows
};

/// An error raised while parsing.
///
/// `token` is set for `UnexpectedToken` and holds a copy of the offending
/// token, including its location.
struct ParserError {
    ParserErrorKind kind = ParserErrorKind::UnexpectedEndOfInput;
    std::optional<JsonToken> token;

    [[nodiscard]] static auto unexpected_token(JsonToken token) -> ParserError {
        return ParserError{ParserErrorKind::UnexpectedToken, std::move(token)};
    }

    [[nodiscard]] static auto unexpected_end_of_input() -> ParserError {
        return ParserError{ParserErrorKind::UnexpectedEndOfInput, std::nullopt};
    }

    [[nodiscard]] static auto max_depth_exceeded() -> ParserError {
        return ParserError{ParserErrorKind::MaxDepthExceeded, std::nullopt};
    }

    /// Formats the diagnostic message.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const ParserError& other) const -> bool {
        return kind == other.kind && token == other.token;
    }
};

// ============================================================================
// Pipeline Error
// ============================================================================

/// Error returned by `format_json`: either a tokenize or a parse failure.
struct Error {
    std::variant<TokenizeError, ParserError> data;

    Error(TokenizeError error) : data(std::move(error)) {}
    Error(ParserError error) : data(std::move(error)) {}

    [[nodiscard]] auto is_tokenize_error() const -> bool {
        return std::holds_alternative<TokenizeError>(data);
    }

    [[nodiscard]] auto is_parser_error() const -> bool {
        return std::holds_alternative<ParserError>(data);
    }

    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is a parser error.
    [[nodiscard]] auto as_tokenize_error() const -> const TokenizeError& {
        return std::get<TokenizeError>(data);
    }

    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is a tokenize error.
    [[nodiscard]] auto as_parser_error() const -> const ParserError& {
        return std::get<ParserError>(data);
    }

    /// The wrapped error's diagnostic message.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Line of the error, or 0 when it has no location.
    ///
    /// Tokenizer errors always have one, including `UnexpectedEndOfInput`
    /// (the position where the input ran out). Parser errors have one only
    /// when they carry a token, so parser `UnexpectedEndOfInput` and
    /// `MaxDepthExceeded` report 0.
    [[nodiscard]] auto line() const -> size_t;

    /// Column of the error, or 0 when it has no location (see `line()`).
    [[nodiscard]] auto column() const -> size_t;

    [[nodiscard]] auto operator==(const Error& other) const -> bool {
        return data == other.data;
    }
};

auto operator<<(std::ostream& os, const TokenizeError& error) -> std::ostream&;
auto operator<<(std::ostream& os, const ParserError& error) -> std::ostream&;
auto operator<<(std::ostream& os, const Error& error) -> std::ostream&;

} // namespace jsonfmt::json

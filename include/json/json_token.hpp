//! # JSON Tokens
//!
//! The lexical units produced by `JsonTokenizer` and consumed by
//! `JsonParser`.
//!
//! ## Token Types
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `LBracket` | Left bracket | `[` |
//! | `RBracket` | Right bracket | `]` |
//! | `LBrace` | Left brace | `{` |
//! | `RBrace` | Right brace | `}` |
//! | `Colon` | Colon | `:` |
//! | `Comma` | Comma | `,` |
//! | `True` | Boolean true | `true` |
//! | `False` | Boolean false | `false` |
//! | `Null` | Null value | `null` |
//! | `String` | Decoded string payload | `"hello"` |
//! | `Number` | Decoded 64-bit float | `3.14`, `-1e10` |
//!
//! A token renders back to its textual form with `to_string()`; parser
//! diagnostics use this to show the offending token.

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

namespace jsonfmt::json {

/// Token types for the JSON tokenizer.
enum class JsonTokenKind : uint8_t {
    // Structural tokens
    LBracket, ///< `[` - Start of array
    RBracket, ///< `]` - End of array
    LBrace,   ///< `{` - Start of object
    RBrace,   ///< `}` - End of object
    Colon,    ///< `:` - Key-value separator
    Comma,    ///< `,` - Element separator

    // Literals
    True,  ///< `true`
    False, ///< `false`
    Null,  ///< `null`

    // Payload tokens
    String, ///< Quoted string, unescaped into `string_value`
    Number  ///< Numeric literal, decoded into `number_value`
};

/// Returns the name of a token kind (e.g. `"LBracket"`), for logs and test output.
[[nodiscard]] auto token_kind_name(JsonTokenKind kind) -> const char*;

/// A single lexical unit.
///
/// Only `String` tokens use `string_value` and only `Number` tokens use
/// `number_value`. The location fields record where the token began in the
/// input; they are diagnostic metadata and do not take part in equality.
struct JsonToken {
    /// The type of this token.
    JsonTokenKind kind = JsonTokenKind::Null;

    /// For `String` tokens: the unescaped string content.
    std::string string_value;

    /// For `Number` tokens: the decoded value.
    double number_value = 0.0;

    /// Line number where this token starts (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where this token starts (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset where this token starts.
    size_t offset = 0;

    /// Creates a token without payload (punctuation or literal).
    [[nodiscard]] static auto make(JsonTokenKind kind) -> JsonToken {
        JsonToken tok;
        tok.kind = kind;
        return tok;
    }

    /// Creates a `String` token holding already-unescaped text.
    [[nodiscard]] static auto make_string(std::string value) -> JsonToken {
        JsonToken tok;
        tok.kind = JsonTokenKind::String;
        tok.string_value = std::move(value);
        return tok;
    }

    /// Creates a `Number` token.
    [[nodiscard]] static auto make_number(double value) -> JsonToken {
        JsonToken tok;
        tok.kind = JsonTokenKind::Number;
        tok.number_value = value;
        return tok;
    }

    /// Renders the token in its textual form.
    ///
    /// Punctuation and literals render as themselves, strings are re-quoted
    /// around their payload, and numbers use the formatter's number text:
    ///
    /// | Token | Rendering |
    /// |-------|-----------|
    /// | `RBracket` | `]` |
    /// | `True` | `true` |
    /// | `String("a b")` | `"a b"` |
    /// | `Number(42.0)` | `42` |
    [[nodiscard]] auto to_string() const -> std::string;

    /// Compares kind and payload; location is ignored.
    [[nodiscard]] auto operator==(const JsonToken& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonToken& other) const -> bool {
        return !(*this == other);
    }
};

auto operator<<(std::ostream& os, const JsonToken& token) -> std::ostream&;

} // namespace jsonfmt::json

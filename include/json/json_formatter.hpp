//! # JSON Formatter
//!
//! Renders a `JsonValue` tree as canonical, indented JSON text.
//!
//! ## Layout Rules
//!
//! - Empty containers render inline as `[]` and `{}`
//! - Non-empty containers put one child per line, indented by
//!   `options.indent` spaces per nesting level, separated by `,\n`
//! - Object members render as `"key": value`
//! - Numbers use the shortest text that round-trips, without exponent
//! - Strings and keys are escaped (see `escape_string`)
//!
//! ## Example
//!
//! ```cpp
//! JsonObject obj;
//! obj.emplace_back("a", JsonValue(1.0));
//! std::cout << format(JsonValue(std::move(obj))) << std::endl;
//! // {
//! //   "a": 1
//! // }
//! ```

#pragma once

#include "json/json_value.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace jsonfmt::json {

/// Formatter configuration.
struct FormatOptions {
    /// Spaces per nesting level.
    size_t indent = 2;
};

/// Walks a value tree and produces its canonical text.
///
/// A `JsonFormatter` can be reused; every `format()` call starts from an
/// empty buffer.
class JsonFormatter {
public:
    explicit JsonFormatter(FormatOptions options = {});

    /// Formats a value. Never fails.
    [[nodiscard]] auto format(const JsonValue& value) -> std::string;

private:
    FormatOptions options_;
    std::string out_;

    /// `level` is the indent level of the value's children.
    void emit_value(const JsonValue& value, size_t level);
    void emit_array(const JsonArray& arr, size_t level);
    void emit_object(const JsonObject& obj, size_t level);
    void emit_string(std::string_view s);
    void emit_indent(size_t level);
};

/// Formats `value` with the given options.
[[nodiscard]] auto format(const JsonValue& value, const FormatOptions& options = {})
    -> std::string;

/// Shortest round-trip decimal text for a double, in plain notation.
///
/// | Value | Text |
/// |-------|------|
/// | `1.0` | `1` |
/// | `-0.0` | `-0` |
/// | `0.1` | `0.1` |
/// | `1e21` | `1000000000000000000000` |
/// | infinity | `inf` / `-inf` |
/// | NaN | `NaN` |
[[nodiscard]] auto format_number(double value) -> std::string;

/// Escapes string content for output (without surrounding quotes).
///
/// | Character | Escape Sequence |
/// |-----------|-----------------|
/// | `"` | `\"` |
/// | `\` | `\\` |
/// | Backspace | `\b` |
/// | Form feed | `\f` |
/// | Line feed | `\n` |
/// | Carriage return | `\r` |
/// | Tab | `\t` |
/// | Other control (0x00-0x1F) | `\u00XX` |
///
/// Bytes >= 0x20, including UTF-8 sequences, are copied unchanged.
[[nodiscard]] auto escape_string(std::string_view s) -> std::string;

/// Writes `format(value)`; lets test frameworks print values.
auto operator<<(std::ostream& os, const JsonValue& value) -> std::ostream&;

} // namespace jsonfmt::json

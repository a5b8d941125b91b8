//! # JSON Formatter Implementation
//!
//! Depth-first rendering of a value tree. The indent level passed down the
//! recursion is the level of the current container's children, so the root
//! starts at 1 and a container's closing bracket sits at `level - 1`.

#include "json/json_formatter.hpp"

#include "log/log.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <type_traits>

namespace jsonfmt::json {

namespace {

constexpr const char* HEX_DIGITS = "0123456789abcdef";

} // anonymous namespace

// ============================================================================
// Scalar Helpers
// ============================================================================

auto format_number(double value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    // Fixed notation of the smallest subnormal needs ~330 characters.
    std::array<char, 512> buf{};
    auto [ptr, ec] =
        std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::fixed);
    if (ec == std::errc{}) {
        return std::string(buf.data(), ptr);
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(17) << value;
    return oss.str();
}

auto escape_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default: {
            auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20) {
                result += "\\u00";
                result += HEX_DIGITS[byte >> 4];
                result += HEX_DIGITS[byte & 0x0F];
            } else {
                result += c;
            }
            break;
        }
        }
    }

    return result;
}

// ============================================================================
// JsonFormatter
// ============================================================================

JsonFormatter::JsonFormatter(FormatOptions options) : options_(options) {}

auto JsonFormatter::format(const JsonValue& value) -> std::string {
    out_.clear();
    emit_value(value, 1);
    JSONFMT_LOG_TRACE("formatter", "Formatted value into " << out_.size() << " bytes");
    return std::move(out_);
}

void JsonFormatter::emit_value(const JsonValue& value, size_t level) {
    std::visit(
        [this, level](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, JsonValue::Null>) {
                out_ += "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out_ += v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                out_ += format_number(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                emit_string(v);
            } else if constexpr (std::is_same_v<T, Box<JsonArray>>) {
                emit_array(*v, level);
            } else if constexpr (std::is_same_v<T, Box<JsonObject>>) {
                emit_object(*v, level);
            } else {
                static_assert(!std::is_same_v<T, T>, "unhandled JsonValue alternative");
            }
        },
        value.data);
}

void JsonFormatter::emit_array(const JsonArray& arr, size_t level) {
    if (arr.empty()) {
        out_ += "[]";
        return;
    }

    out_ += "[\n";
    for (size_t i = 0; i < arr.size(); ++i) {
        if (i > 0) {
            out_ += ",\n";
        }
        emit_indent(level);
        emit_value(arr[i], level + 1);
    }
    out_ += '\n';
    emit_indent(level - 1);
    out_ += ']';
}

void JsonFormatter::emit_object(const JsonObject& obj, size_t level) {
    if (obj.empty()) {
        out_ += "{}";
        return;
    }

    out_ += "{\n";
    for (size_t i = 0; i < obj.size(); ++i) {
        if (i > 0) {
            out_ += ",\n";
        }
        emit_indent(level);
        emit_string(obj[i].first);
        out_ += ": ";
        emit_value(obj[i].second, level + 1);
    }
    out_ += '\n';
    emit_indent(level - 1);
    out_ += '}';
}

void JsonFormatter::emit_string(std::string_view s) {
    out_ += '"';
    out_ += escape_string(s);
    out_ += '"';
}

void JsonFormatter::emit_indent(size_t level) {
    out_.append(level * options_.indent, ' ');
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto format(const JsonValue& value, const FormatOptions& options) -> std::string {
    JsonFormatter formatter(options);
    return formatter.format(value);
}

auto operator<<(std::ostream& os, const JsonValue& value) -> std::ostream& {
    return os << format(value);
}

} // namespace jsonfmt::json

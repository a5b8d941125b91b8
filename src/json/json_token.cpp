//! # JSON Token Implementation
//!
//! Token rendering and comparison.

#include "json/json_token.hpp"

#include "json/json_formatter.hpp"

#include <ostream>

namespace jsonfmt::json {

auto token_kind_name(JsonTokenKind kind) -> const char* {
    switch (kind) {
    case JsonTokenKind::LBracket:
        return "LBracket";
    case JsonTokenKind::RBracket:
        return "RBracket";
    case JsonTokenKind::LBrace:
        return "LBrace";
    case JsonTokenKind::RBrace:
        return "RBrace";
    case JsonTokenKind::Colon:
        return "Colon";
    case JsonTokenKind::Comma:
        return "Comma";
    case JsonTokenKind::True:
        return "True";
    case JsonTokenKind::False:
        return "False";
    case JsonTokenKind::Null:
        return "Null";
    case JsonTokenKind::String:
        return "String";
    case JsonTokenKind::Number:
        return "Number";
    }
    return "???";
}

auto JsonToken::to_string() const -> std::string {
    switch (kind) {
    case JsonTokenKind::LBracket:
        return "[";
    case JsonTokenKind::RBracket:
        return "]";
    case JsonTokenKind::LBrace:
        return "{";
    case JsonTokenKind::RBrace:
        return "}";
    case JsonTokenKind::Colon:
        return ":";
    case JsonTokenKind::Comma:
        return ",";
    case JsonTokenKind::True:
        return "true";
    case JsonTokenKind::False:
        return "false";
    case JsonTokenKind::Null:
        return "null";
    case JsonTokenKind::String:
        // Payload is shown verbatim so the diagnostic matches what was decoded.
        return "\"" + string_value + "\"";
    case JsonTokenKind::Number:
        return format_number(number_value);
    }
    return "";
}

auto JsonToken::operator==(const JsonToken& other) const -> bool {
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
    case JsonTokenKind::String:
        return string_value == other.string_value;
    case JsonTokenKind::Number:
        return number_value == other.number_value;
    default:
        return true;
    }
}

auto operator<<(std::ostream& os, const JsonToken& token) -> std::ostream& {
    return os << token_kind_name(token.kind) << "(" << token.to_string() << ")";
}

} // namespace jsonfmt::json

//! # JSON Value Implementation
//!
//! Out-of-line `JsonValue` members: lookup, deep copy and equality.
//!
//! ## Equality Semantics
//!
//! | Type | Comparison Rule |
//! |------|-----------------|
//! | `null` | All nulls are equal |
//! | `bool` | Standard boolean comparison |
//! | `number` | `double` comparison (`NaN != NaN`) |
//! | `string` | Byte-by-byte |
//! | `array` | Element-by-element in order |
//! | `object` | Member-by-member in order, keys and values |

#include "json/json_value.hpp"

#include <type_traits>

namespace jsonfmt::json {

auto JsonValue::get(std::string_view key) const -> const JsonValue* {
    const auto* obj = std::get_if<Box<JsonObject>>(&data);
    if (!obj) {
        return nullptr;
    }
    for (const auto& [member_key, member_value] : **obj) {
        if (member_key == key) {
            return &member_value;
        }
    }
    return nullptr;
}

auto JsonValue::size() const -> size_t {
    if (const auto* arr = std::get_if<Box<JsonArray>>(&data)) {
        return (*arr)->size();
    }
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

auto JsonValue::clone() const -> JsonValue {
    return std::visit(
        [](const auto& v) -> JsonValue {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return JsonValue();
            } else if constexpr (std::is_same_v<T, Box<JsonArray>>) {
                JsonArray copy;
                copy.reserve(v->size());
                for (const auto& elem : *v) {
                    copy.push_back(elem.clone());
                }
                return JsonValue(std::move(copy));
            } else if constexpr (std::is_same_v<T, Box<JsonObject>>) {
                JsonObject copy;
                copy.reserve(v->size());
                for (const auto& [key, val] : *v) {
                    copy.emplace_back(key, val.clone());
                }
                return JsonValue(std::move(copy));
            } else {
                return JsonValue(v);
            }
        },
        data);
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    // Different variant types are not equal
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }

    if (is_bool()) {
        return as_bool() == other.as_bool();
    }

    if (is_number()) {
        return as_number() == other.as_number();
    }

    if (is_string()) {
        return as_string() == other.as_string();
    }

    if (is_array()) {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }

    const auto& lhs = as_object();
    const auto& rhs = other.as_object();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i].first != rhs[i].first || lhs[i].second != rhs[i].second) {
            return false;
        }
    }
    return true;
}

} // namespace jsonfmt::json

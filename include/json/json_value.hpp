//! # JSON Value Types
//!
//! The value tree produced by `JsonParser` and consumed by `JsonFormatter`.
//!
//! ## Features
//!
//! - **Closed variant**: null, bool, number, string, array, object
//! - **Exclusive ownership**: every node is owned by its parent container;
//!   values are move-only and copied only through `clone()`
//! - **Ordered objects**: members keep input order and duplicate keys are
//!   preserved rather than merged
//!
//! ## Example
//!
//! ```cpp
//! JsonObject obj;
//! obj.emplace_back("a", JsonValue(1.0));
//! obj.emplace_back("a", JsonValue(2.0)); // duplicate kept
//! JsonValue value(std::move(obj));
//!
//! if (auto* first = value.get("a")) {
//!     std::cout << first->as_number() << std::endl; // 1
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonfmt::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// One `"key": value` entry of an object.
using JsonMember = std::pair<std::string, JsonValue>;

/// A JSON object: members in input order, keys not required to be unique.
using JsonObject = std::vector<JsonMember>;

// ============================================================================
// JsonValue
// ============================================================================

/// JSON value variant type.
///
/// | JSON Type | C++ Storage | Query Method | Accessor |
/// |-----------|-------------|--------------|----------|
/// | `null` | `std::monostate` | `is_null()` | - |
/// | `true/false` | `bool` | `is_bool()` | `as_bool()` |
/// | number | `double` | `is_number()` | `as_number()` |
/// | string | `std::string` | `is_string()` | `as_string()` |
/// | array | `Box<JsonArray>` | `is_array()` | `as_array()` |
/// | object | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
///
/// Arrays and objects are boxed so the variant has a finite size.
struct JsonValue {
    /// The null type (empty state).
    using Null = std::monostate;

    /// The variant type holding all possible JSON values.
    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      double,           // number
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    /// The underlying variant storage.
    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Default constructor creates a `null` value.
    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}

    explicit JsonValue(bool value) : data(value) {}

    explicit JsonValue(double value) : data(value) {}

    /// Integers are stored as doubles; JSON numbers have a single type here.
    explicit JsonValue(int value) : data(static_cast<double>(value)) {}

    explicit JsonValue(const char* value) : data(std::string(value)) {}

    explicit JsonValue(std::string value) : data(std::move(value)) {}

    explicit JsonValue(std::string_view value) : data(std::string(value)) {}

    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}

    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<double>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Type Accessors
    // ========================================================================
    //
    // All accessors throw `std::bad_variant_access` on a type mismatch.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> double {
        return std::get<double>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Container Helpers
    // ========================================================================

    /// Returns the first member named `key`, or `nullptr` if absent or if
    /// this is not an object.
    ///
    /// With duplicate keys only the first occurrence is returned; iterate
    /// `as_object()` to see every member.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue*;

    /// Number of elements (array) or members (object); 0 for scalars.
    [[nodiscard]] auto size() const -> size_t;

    /// Appends to an array.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an array.
    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    /// Appends a member to an object without checking for an existing key.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    void add(std::string key, JsonValue value) {
        as_object_mut().emplace_back(std::move(key), std::move(value));
    }

    /// Deep copy. `JsonValue` itself is move-only.
    [[nodiscard]] auto clone() const -> JsonValue;

    /// Structural equality; object members are compared pairwise in order.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

} // namespace jsonfmt::json

//! # Common Definitions
//!
//! Types and helpers shared by every jsonfmt component: version constants,
//! the `Result` alias used for all fallible operations, and ownership
//! aliases.
//!
//! ## Design
//!
//! - **No exceptions across the library API**: errors are values returned
//!   through `Result<T, E>`
//! - **Explicit ownership**: `Box<T>` for uniquely owned heap data

#ifndef JSONFMT_COMMON_HPP
#define JSONFMT_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace jsonfmt {

// ============================================================================
// Version Information
// ============================================================================

/// The jsonfmt version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// `Result<T, E>` is a `std::variant<T, E>`; the success alternative comes
/// first. Query it with `is_ok` / `is_err` and extract with `unwrap` /
/// `unwrap_err`.
///
/// # Example
///
/// ```cpp
/// using namespace jsonfmt;
///
/// auto result = json::format_json(R"({"a": 1})");
/// if (is_ok(result)) {
///     std::cout << unwrap(result) << "\n";
/// } else {
///     std::cerr << unwrap_err(result).to_string() << "\n";
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace jsonfmt

#endif // JSONFMT_COMMON_HPP

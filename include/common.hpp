//! # Common Definitions
//!
//! This module provides common types and utilities used throughout the
//! unijson library. It establishes the foundational abstractions that the
//! JSON layer, the runtime type model and the codec depend on.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Library version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef UNIJSON_COMMON_HPP
#define UNIJSON_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace unijson {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 1;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions. Operations with nothing to return on
/// success use `Result<bool, E>` and return `true`.
///
/// # Example
///
/// ```cpp
/// Result<int, std::string> parse_port(std::string_view s) {
///     // ... parsing logic ...
///     if (error) return std::string("invalid port");
///     return value;
/// }
///
/// auto result = parse_port("8080");
/// if (is_ok(result)) {
///     int port = unwrap(result);
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

/// Extracts the success value from a const Result.
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

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
///
/// `Box<T>` represents unique ownership of a heap-allocated value.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
///
/// `Rc<T>` allows multiple owners of the same heap-allocated value.
/// Runtime objects and class descriptors are shared this way.
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Creates a new Rc containing the given value.
///
/// # Example
///
/// ```cpp
/// auto obj = make_rc<DynamicObject>(cls, Map{});
/// ```
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace unijson

#endif // UNIJSON_COMMON_HPP

//! # JSON Value Types
//!
//! Core JSON value types for the unijson wire layer. `JsonNumber` keeps the
//! integer/float distinction of the input text, and `JsonValue` is a variant
//! over the six JSON types.
//!
//! ## Features
//!
//! - **Integer precision**: Numbers without decimals are stored as `int64_t` or `uint64_t`
//! - **Ordered objects**: Object keys iterate in insertion order
//! - **Configurable output**: Compact or indented, optional key sorting and ASCII escaping
//!
//! ## Number Handling
//!
//! | JSON Input | Storage Type | Reason |
//! |------------|--------------|--------|
//! | `42` | `Int64` | No decimal point |
//! | `18446744073709551615` | `Uint64` | Too large for int64 |
//! | `3.14` | `Double` | Has decimal point |
//! | `1e10` | `Double` | Has exponent |
//!
//! ## Example
//!
//! ```cpp
//! JsonObject fields;
//! fields.insert_or_assign("name", JsonValue("Alice"));
//! fields.insert_or_assign("age", JsonValue(30));
//! JsonValue obj(std::move(fields));
//!
//! obj.to_string();                                   // {"name":"Alice","age":30}
//! obj.to_string(WriteOptions{.sort_keys = true});    // {"age":30,"name":"Alice"}
//! ```

#pragma once

#include "common.hpp"
#include "common/ordered_map.hpp"

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace unijson::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object; keys iterate in insertion order.
using JsonObject = OrderedMap<JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// Discriminated union for JSON numbers preserving integer precision.
///
/// The parser determines the storage type based on the number's format:
/// 1. No decimal point and no exponent → try integer
/// 2. Value fits in `int64_t` → `Int64`
/// 3. Value positive and fits in `uint64_t` → `Uint64`
/// 4. Otherwise → `Double`
struct JsonNumber {
    enum class Kind : uint8_t {
        Int64,  ///< Signed 64-bit integer (`i64` field)
        Uint64, ///< Unsigned 64-bit integer (`u64` field)
        Double  ///< IEEE 754 double precision float (`f64` field)
    };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    /// Default constructor creates zero as `Int64`.
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    /// Returns `true` if this is a floating-point number (`Double`).
    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Double;
    }

    /// Attempts to get the value as `int64_t`.
    ///
    /// Returns `std::nullopt` for doubles and for unsigned values above `INT64_MAX`.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        switch (kind) {
        case Kind::Int64:
            return i64;
        case Kind::Uint64:
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u64);
            }
            return std::nullopt;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// Gets the value as `double`.
    ///
    /// Integers larger than 2^53 may lose precision.
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }

    /// Numbers of different kinds are compared as doubles.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        switch (kind) {
        case Kind::Int64:
            return i64 == other.i64;
        case Kind::Uint64:
            return u64 == other.u64;
        case Kind::Double:
            return f64 == other.f64;
        }
        return false;
    }

    [[nodiscard]] auto operator!=(const JsonNumber& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Output Options
// ============================================================================

/// Controls how a `JsonValue` is written.
struct WriteOptions {
    /// Spaces per nesting level. `std::nullopt` writes compact output;
    /// `0` still breaks lines but does not indent.
    std::optional<int> indent;

    /// Write object keys in lexicographic order instead of insertion order.
    bool sort_keys = false;

    /// Escape every non-ASCII code point as `\uXXXX` (surrogate pairs above U+FFFF).
    bool ensure_ascii = false;
};

// ============================================================================
// JsonValue
// ============================================================================

/// JSON value variant type representing any JSON value.
///
/// | JSON Type | C++ Storage | Query Method | Accessor |
/// |-----------|-------------|--------------|----------|
/// | `null` | `std::monostate` | `is_null()` | - |
/// | `true/false` | `bool` | `is_bool()` | `as_bool()` |
/// | number | `JsonNumber` | `is_number()` | `as_number()`, `as_i64()`, `as_f64()` |
/// | string | `std::string` | `is_string()` | `as_string()` |
/// | array | `Box<JsonArray>` | `is_array()` | `as_array()` |
/// | object | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
///
/// Arrays and objects are boxed, so values are move-only.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      JsonNumber,       // number
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(uint64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}
    explicit JsonValue(JsonNumber value) : data(value) {}

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
        return std::holds_alternative<JsonNumber>(data);
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

    [[nodiscard]] auto is_float() const -> bool {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->is_float();
        }
        return false;
    }

    // ========================================================================
    // Type Accessors
    // ========================================================================

    /// # Panics
    ///
    /// The `as_*` accessors throw `std::bad_variant_access` on a type mismatch.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
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

    /// Gets the number as `int64_t`.
    ///
    /// # Panics
    ///
    /// Throws `std::runtime_error` if this is not an integer or would overflow.
    [[nodiscard]] auto as_i64() const -> int64_t {
        auto opt = as_number().try_as_i64();
        if (!opt) {
            throw std::runtime_error("JSON number cannot be converted to int64_t");
        }
        return *opt;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    // ========================================================================
    // Object and Array Access
    // ========================================================================

    /// Gets a value from an object by key.
    ///
    /// # Returns
    ///
    /// Pointer to the value, or `nullptr` if this is not an object or the key is absent.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Gets the size of an array or object, `0` for other types.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Serializes this value to a compact JSON string.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Serializes this value according to `options`.
    [[nodiscard]] auto to_string(const WriteOptions& options) const -> std::string;

    /// Writes this value to an output stream.
    ///
    /// # Returns
    ///
    /// The number of bytes written.
    auto write_to(std::ostream& os, const WriteOptions& options = {}) const -> size_t;

    // ========================================================================
    // Comparison
    // ========================================================================

    /// Values of different types are never equal. Objects compare by content,
    /// independent of key order.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

} // namespace unijson::json

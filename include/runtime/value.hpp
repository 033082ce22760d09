//! # Runtime Values
//!
//! `Value` is the dynamic value the codec encodes from and decodes into.
//! It covers the JSON-native shapes plus `ObjectRef`, a shared reference to
//! a class-tagged runtime object.
//!
//! | Kind | C++ Storage | Query | Accessor |
//! |------|-------------|-------|----------|
//! | null | `std::monostate` | `is_null()` | - |
//! | bool | `bool` | `is_bool()` | `as_bool()` |
//! | int | `int64_t` | `is_int()` | `as_int()` |
//! | float | `double` | `is_float()` | `as_float()` |
//! | string | `std::string` | `is_string()` | `as_string()` |
//! | array | `Box<Array>` | `is_array()` | `as_array()` |
//! | map | `Box<Map>` | `is_map()` | `as_map()`, `get()` |
//! | object | `ObjectRef` | `is_object()` | `as_object()`, `as<T>()` |
//!
//! Copying a `Value` deep-copies arrays and maps. Objects are shared.
//!
//! ## Example
//!
//! ```cpp
//! Map point{{"x", Value(1)}, {"y", Value(2.5)}};
//! Value v(std::move(point));
//! v.get("x")->as_int();   // 1
//! v.repr();               // {'x': 1, 'y': 2.5}
//! ```

#pragma once

#include "common.hpp"
#include "common/ordered_map.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace unijson {

class Object;
class Class;

/// Shared handle to a class descriptor.
using ClassRef = Rc<const Class>;

/// Shared handle to a runtime object.
using ObjectRef = Rc<Object>;

class Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A string-keyed mapping iterating in insertion order.
using Map = OrderedMap<Value>;

class Value {
public:
    using Null = std::monostate;

    using Data = std::variant<Null,        // null
                              bool,        // boolean
                              int64_t,     // integer
                              double,      // float
                              std::string, // string
                              Box<Array>,  // array (boxed)
                              Box<Map>,    // map (boxed)
                              ObjectRef>;  // class-tagged object

    Value() : data_(Null{}) {}
    explicit Value(std::nullptr_t) : data_(Null{}) {}
    explicit Value(bool value) : data_(value) {}
    explicit Value(int value) : data_(static_cast<int64_t>(value)) {}
    explicit Value(int64_t value) : data_(value) {}
    explicit Value(double value) : data_(value) {}
    explicit Value(const char* value) : data_(std::string(value)) {}
    explicit Value(std::string value) : data_(std::move(value)) {}
    explicit Value(std::string_view value) : data_(std::string(value)) {}
    explicit Value(Array value) : data_(make_box<Array>(std::move(value))) {}
    explicit Value(Map value) : data_(make_box<Map>(std::move(value))) {}

    /// Wraps any runtime object. A null pointer becomes a null value.
    template <typename T, typename = std::enable_if_t<std::is_convertible_v<T*, Object*>>>
    explicit Value(Rc<T> object) {
        if (object) {
            data_ = ObjectRef(std::move(object));
        } else {
            data_ = Null{};
        }
    }

    Value(const Value& other);
    Value(Value&& other) noexcept = default;
    auto operator=(const Value& other) -> Value&;
    auto operator=(Value&& other) noexcept -> Value& = default;
    ~Value() = default;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data_);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data_);
    }
    [[nodiscard]] auto is_int() const -> bool {
        return std::holds_alternative<int64_t>(data_);
    }
    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<double>(data_);
    }
    /// `true` for integers and floats. Booleans are not numbers.
    [[nodiscard]] auto is_number() const -> bool {
        return is_int() || is_float();
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data_);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<Array>>(data_);
    }
    [[nodiscard]] auto is_map() const -> bool {
        return std::holds_alternative<Box<Map>>(data_);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<ObjectRef>(data_);
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    /// # Panics
    ///
    /// The `as_*` accessors throw `std::bad_variant_access` on a kind mismatch.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data_);
    }
    [[nodiscard]] auto as_int() const -> int64_t {
        return std::get<int64_t>(data_);
    }
    /// Integers are widened to `double`.
    [[nodiscard]] auto as_float() const -> double {
        if (is_int()) {
            return static_cast<double>(std::get<int64_t>(data_));
        }
        return std::get<double>(data_);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data_);
    }
    [[nodiscard]] auto as_array() const -> const Array& {
        return *std::get<Box<Array>>(data_);
    }
    [[nodiscard]] auto as_map() const -> const Map& {
        return *std::get<Box<Map>>(data_);
    }
    [[nodiscard]] auto as_array_mut() -> Array& {
        return *std::get<Box<Array>>(data_);
    }
    [[nodiscard]] auto as_map_mut() -> Map& {
        return *std::get<Box<Map>>(data_);
    }
    [[nodiscard]] auto as_object() const -> const ObjectRef& {
        return std::get<ObjectRef>(data_);
    }

    /// Returns the object as `T`, or `nullptr` if this is not an object of
    /// that dynamic type.
    template <typename T> [[nodiscard]] auto as() const -> Rc<T> {
        if (auto* obj = std::get_if<ObjectRef>(&data_)) {
            return std::dynamic_pointer_cast<T>(*obj);
        }
        return nullptr;
    }

    /// Looks up `key` in a map value. `nullptr` if absent or not a map.
    [[nodiscard]] auto get(std::string_view key) const -> const Value* {
        if (auto* map = std::get_if<Box<Map>>(&data_)) {
            auto it = (*map)->find(key);
            if (it != (*map)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return get(key) != nullptr;
    }

    /// Number of elements of an array or map, `0` otherwise.
    [[nodiscard]] auto size() const -> size_t;

    /// Short kind name used in diagnostics: `None`, `bool`, `int`, `float`,
    /// `str`, `list`, `dict`, or the class name of an object.
    [[nodiscard]] auto type_name() const -> std::string;

    /// Debug rendering, e.g. `{'name': 'Alice', 'scores': [1, 2.0], 'x': None}`.
    [[nodiscard]] auto repr() const -> std::string;

    /// Deep equality. Objects compare through `Object::equals`.
    [[nodiscard]] auto operator==(const Value& other) const -> bool;

    [[nodiscard]] auto operator!=(const Value& other) const -> bool {
        return !(*this == other);
    }

    [[nodiscard]] auto data() const -> const Data& {
        return data_;
    }

private:
    Data data_;
};

} // namespace unijson

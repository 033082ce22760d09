//! # Model Schema
//!
//! Field descriptions for structured record classes. A `ModelSchema` is the
//! ordered list of a model's fields; each `FieldSpec` carries a `FieldType`,
//! an optional default and `FieldConstraints`.
//!
//! ## Example
//!
//! ```cpp
//! FieldConstraints positive;
//! positive.gt = 0;
//!
//! auto product = ClassBuilder("Product", "shop")
//!                    .kind(ClassKind::Model)
//!                    .field("name", FieldType::string())
//!                    .field("price", FieldType::number(), positive)
//!                    .field_with_default("tags", FieldType::list_of(FieldType::string()),
//!                                        Value(Array{}))
//!                    .build();
//! ```

#pragma once

#include "common.hpp"
#include "runtime/value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace unijson {

/// The declared type of a model field.
class FieldType {
public:
    enum class Kind : uint8_t {
        Any,        ///< Accepts every value
        Boolean,    ///< `bool`
        Integer,    ///< `int`
        Number,     ///< `float`; integers are widened
        String,     ///< `str`
        InstanceOf, ///< Instance of a class or one of its subclasses
        ListOf,     ///< Array of `item()`
        MapOf,      ///< String-keyed map of `item()`
        Optional,   ///< `null` or `item()`
        EnumOf      ///< Member of an enum class
    };

    FieldType() = default;

    static auto any() -> FieldType {
        return FieldType(Kind::Any);
    }
    static auto boolean() -> FieldType {
        return FieldType(Kind::Boolean);
    }
    static auto integer() -> FieldType {
        return FieldType(Kind::Integer);
    }
    static auto number() -> FieldType {
        return FieldType(Kind::Number);
    }
    static auto string() -> FieldType {
        return FieldType(Kind::String);
    }
    static auto instance_of(ClassRef cls) -> FieldType;
    static auto enum_of(ClassRef cls) -> FieldType;
    static auto list_of(FieldType item) -> FieldType;
    static auto map_of(FieldType item) -> FieldType;
    static auto optional(FieldType item) -> FieldType;

    [[nodiscard]] auto kind() const -> Kind {
        return kind_;
    }

    /// Class of `InstanceOf` and `EnumOf` fields.
    [[nodiscard]] auto cls() const -> const ClassRef& {
        return cls_;
    }

    /// Element type of `ListOf`, `MapOf` and `Optional` fields.
    [[nodiscard]] auto item() const -> const FieldType& {
        return *item_;
    }

    /// Annotation-style name, e.g. `list[Pet]` or `Optional[int]`.
    [[nodiscard]] auto name() const -> std::string;

private:
    explicit FieldType(Kind kind) : kind_(kind) {}

    Kind kind_ = Kind::Any;
    ClassRef cls_;
    Rc<const FieldType> item_;
};

/// Validation rules applied after a field's type check.
///
/// Bounds apply to numbers, length limits to strings, arrays and maps.
/// `check` returns an error message for values it rejects.
struct FieldConstraints {
    std::optional<double> gt;
    std::optional<double> ge;
    std::optional<double> lt;
    std::optional<double> le;
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::function<std::optional<std::string>(const Value&)> check;
};

struct FieldSpec {
    std::string name;
    FieldType type;
    std::optional<Value> default_value;
    FieldConstraints constraints;

    [[nodiscard]] auto required() const -> bool {
        return !default_value.has_value();
    }
};

/// Fields of a model in declaration order, inherited fields first.
using ModelSchema = std::vector<FieldSpec>;

} // namespace unijson

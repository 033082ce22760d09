//! # Enum Members
//!
//! An `EnumValue` is one member of an `Enum` class. Members are created on
//! demand from the class' member table and compare equal by class and name.
//! Their attribute mapping is `{"_value_": value, "_name_": name}`.

#pragma once

#include "common.hpp"
#include "runtime/class.hpp"
#include "runtime/object.hpp"

#include <string>
#include <string_view>

namespace unijson {

class EnumValue : public Object, public AttributeHolder {
public:
    EnumValue(ClassRef cls, std::string name, Value value);

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return cls_;
    }

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto value() const -> const Value& {
        return value_;
    }

    [[nodiscard]] auto attributes() const -> Map override;

    /// Members are immutable; always fails.
    auto replace_attributes(Map attributes) -> Result<bool, std::string> override;

    [[nodiscard]] auto equals(const Object& other) const -> bool override;

    /// `<Color.RED: 1>`
    [[nodiscard]] auto repr() const -> std::string override;

    /// The member of `cls` called `name`.
    static auto member(const ClassRef& cls, std::string_view name)
        -> Result<Rc<EnumValue>, std::string>;

    /// The first member of `cls` whose value equals `value`.
    static auto from_value(const ClassRef& cls, const Value& value)
        -> Result<Rc<EnumValue>, std::string>;

private:
    ClassRef cls_;
    std::string name_;
    Value value_;
};

} // namespace unijson

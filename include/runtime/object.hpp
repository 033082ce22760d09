//! # Runtime Objects
//!
//! `Object` is the base of every class-tagged instance the codec handles.
//! Behavior the encoder and decoder look for is opt-in through capability
//! interfaces, checked with `dynamic_cast`:
//!
//! | Capability | Used by | Meaning |
//! |------------|---------|---------|
//! | `JsonEncodable` | Encoder | Object produces its own content mapping |
//! | `AttributeHolder` | Encoder, Decoder | Object exposes a replaceable attribute mapping |
//!
//! `DynamicObject` is the generic attribute holder: a class reference plus
//! an ordered attribute map.

#pragma once

#include "common.hpp"
#include "runtime/value.hpp"

#include <string>

namespace unijson {

/// Base of all class-tagged runtime objects.
class Object {
public:
    virtual ~Object() = default;

    /// The class this object is an instance of.
    [[nodiscard]] virtual auto klass() const -> const ClassRef& = 0;

    /// Value equality. The default is identity.
    [[nodiscard]] virtual auto equals(const Object& other) const -> bool {
        return this == &other;
    }

    /// Debug rendering, `<module.Name object>` unless overridden.
    [[nodiscard]] virtual auto repr() const -> std::string;
};

/// An object that produces its own encoded content.
class JsonEncodable {
public:
    virtual ~JsonEncodable() = default;

    /// Returns the content mapping for this object. The mapping may carry
    /// its own `__class__`/`__module__` pair.
    [[nodiscard]] virtual auto json_encode() const -> Result<Map, std::string> = 0;
};

/// An object whose state is a string-keyed attribute mapping.
class AttributeHolder {
public:
    virtual ~AttributeHolder() = default;

    /// A copy of the current attributes, in declaration order.
    [[nodiscard]] virtual auto attributes() const -> Map = 0;

    /// Replaces every attribute at once.
    virtual auto replace_attributes(Map attributes) -> Result<bool, std::string> = 0;
};

/// Generic attribute-bag instance of any class.
class DynamicObject : public Object, public AttributeHolder {
public:
    explicit DynamicObject(ClassRef cls, Map attributes = {});

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return cls_;
    }

    [[nodiscard]] auto attributes() const -> Map override {
        return attrs_;
    }

    auto replace_attributes(Map attributes) -> Result<bool, std::string> override {
        attrs_ = std::move(attributes);
        return true;
    }

    [[nodiscard]] auto get(std::string_view name) const -> const Value*;

    void set(const std::string& name, Value value) {
        attrs_.insert_or_assign(name, std::move(value));
    }

    /// Same class and equal attributes.
    [[nodiscard]] auto equals(const Object& other) const -> bool override;

    [[nodiscard]] auto repr() const -> std::string override;

private:
    ClassRef cls_;
    Map attrs_;
};

} // namespace unijson

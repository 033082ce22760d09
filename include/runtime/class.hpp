//! # Class Descriptors
//!
//! A `Class` is the runtime type object behind every tagged node: it
//! carries the declared name and module written as `__class__` and
//! `__module__`, a single base class, and the factories the decoder uses to
//! rebuild instances.
//!
//! ## Kinds
//!
//! | Kind | Instances | Decoded through |
//! |------|-----------|-----------------|
//! | `Plain` | Any `Object` | Registered decoder, hook, constructor or default construction |
//! | `Model` | `Model` | Schema validation |
//! | `RootModel` | `Model` with a single `root` field | Keyword construction, then validation |
//! | `Enum` | `EnumValue` | Member lookup by `_name_` |
//!
//! Factories, schema fields and enum members are inherited: lookups walk
//! the base chain.
//!
//! ## Example
//!
//! ```cpp
//! auto pet = ClassBuilder("Pet", "zoo").kind(ClassKind::Model)
//!                .field("name", FieldType::string()).build();
//! auto dog = ClassBuilder("Dog", "zoo").base(pet)
//!                .field("breed", FieldType::string()).build();
//! dog->is_subclass_of(*pet);   // true
//! dog->schema().size();        // 2
//! ```

#pragma once

#include "common.hpp"
#include "runtime/schema.hpp"
#include "runtime/value.hpp"

#include <functional>
#include <string>
#include <vector>

namespace unijson {

enum class ClassKind : uint8_t {
    Plain,     ///< Ordinary class
    Model,     ///< Structured record with a schema
    RootModel, ///< Structured record wrapping a single `root` value
    Enum       ///< Closed set of named members
};

/// Keyword constructor: builds an instance from a content mapping.
using ConstructFn = std::function<Result<ObjectRef, std::string>(const ClassRef&, const Map&)>;

/// Zero-argument constructor producing an empty instance.
using DefaultConstructFn = std::function<Result<ObjectRef, std::string>(const ClassRef&)>;

/// Class-level decode hook: rebuilds a value from a content mapping.
using DecodeHookFn = std::function<Result<Value, std::string>(const ClassRef&, const Map&)>;

struct EnumMember {
    std::string name;
    Value value;
};

class Class {
public:
    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto module() const -> const std::string& {
        return module_;
    }

    /// `module.Name`, or just the name when the module is empty.
    [[nodiscard]] auto qualified_name() const -> std::string;

    [[nodiscard]] auto base() const -> const ClassRef& {
        return base_;
    }

    [[nodiscard]] auto kind() const -> ClassKind {
        return kind_;
    }

    /// `true` for `Model` and `RootModel` classes.
    [[nodiscard]] auto is_model() const -> bool {
        return kind_ == ClassKind::Model || kind_ == ClassKind::RootModel;
    }

    [[nodiscard]] auto is_root_model() const -> bool {
        return kind_ == ClassKind::RootModel;
    }

    [[nodiscard]] auto is_enum() const -> bool {
        return kind_ == ClassKind::Enum;
    }

    /// `true` if `other` is this class or one of its ancestors.
    [[nodiscard]] auto is_subclass_of(const Class& other) const -> bool;

    /// Nearest keyword constructor along the base chain, or `nullptr`.
    [[nodiscard]] auto constructor() const -> const ConstructFn*;

    /// Nearest default constructor along the base chain, or `nullptr`.
    [[nodiscard]] auto default_constructor() const -> const DefaultConstructFn*;

    /// Nearest decode hook along the base chain, or `nullptr`.
    [[nodiscard]] auto decode_hook() const -> const DecodeHookFn*;

    /// Full schema: base fields first, then own fields. An own field with
    /// an inherited name replaces the inherited one in place.
    [[nodiscard]] auto schema() const -> ModelSchema;

    [[nodiscard]] auto enum_members() const -> const std::vector<EnumMember>& {
        return members_;
    }

    [[nodiscard]] auto find_member(std::string_view name) const -> const EnumMember*;

private:
    friend class ClassBuilder;

    Class() = default;

    std::string name_;
    std::string module_;
    ClassRef base_;
    ClassKind kind_ = ClassKind::Plain;
    ConstructFn constructor_;
    DefaultConstructFn default_constructor_;
    DecodeHookFn decode_hook_;
    ModelSchema fields_;
    std::vector<EnumMember> members_;
};

/// Fluent builder for `Class` descriptors.
///
/// A class inherits its base's kind unless `kind()` is called.
class ClassBuilder {
public:
    ClassBuilder(std::string name, std::string module);

    auto base(ClassRef base) -> ClassBuilder&;
    auto kind(ClassKind kind) -> ClassBuilder&;

    auto field(std::string name, FieldType type, FieldConstraints constraints = {})
        -> ClassBuilder&;
    auto field_with_default(std::string name, FieldType type, Value default_value,
                            FieldConstraints constraints = {}) -> ClassBuilder&;

    auto constructor(ConstructFn fn) -> ClassBuilder&;
    auto default_constructor(DefaultConstructFn fn) -> ClassBuilder&;
    auto decode_hook(DecodeHookFn fn) -> ClassBuilder&;

    /// Instances are `DynamicObject`s: default-constructed empty and
    /// keyword-constructed from the content mapping.
    auto dynamic_attributes() -> ClassBuilder&;

    auto enum_member(std::string name, Value value) -> ClassBuilder&;

    [[nodiscard]] auto build() -> ClassRef;

private:
    Rc<Class> cls_;
    bool kind_set_ = false;
};

} // namespace unijson

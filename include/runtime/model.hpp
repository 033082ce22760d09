//! # Structured Records
//!
//! `Model` is the instance type of `Model` and `RootModel` classes: an
//! ordered field map checked against the class schema.
//!
//! ## Construction Modes
//!
//! | Function | Mode | Behavior |
//! |----------|------|----------|
//! | `Model::validate` | Strict | Type and constraint checks, nested mappings become models |
//! | `Model::construct` | Lax | Coerces numeric strings, integral floats and boolean spellings; no checks |
//! | `Model::validate_instance` | Strict | Re-checks an existing instance in place |
//!
//! Failures report a `ValidationError`:
//!
//! ```text
//! 1 validation error for Product
//! price
//!   Input should be greater than 0 [type=greater_than, input_value=-10.0]
//! ```

#pragma once

#include "common.hpp"
#include "runtime/class.hpp"
#include "runtime/object.hpp"
#include "runtime/value.hpp"

#include <string>
#include <vector>

namespace unijson {

/// One failed check.
struct ValidationIssue {
    std::vector<std::string> loc; ///< Path to the offending field, outermost first
    std::string msg;
    std::string type;  ///< Machine-readable kind, e.g. `missing`, `int_type`
    std::string input; ///< `Value::repr()` of the rejected input
};

/// All issues found while validating one model.
struct ValidationError {
    std::string title; ///< Class name of the model being validated
    std::vector<ValidationIssue> issues;

    [[nodiscard]] auto to_string() const -> std::string;
};

class Model : public Object, public AttributeHolder {
public:
    Model(ClassRef cls, Map fields);

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return cls_;
    }

    [[nodiscard]] auto fields() const -> const Map& {
        return fields_;
    }

    [[nodiscard]] auto get(std::string_view name) const -> const Value*;

    void set(const std::string& name, Value value) {
        fields_.insert_or_assign(name, std::move(value));
    }

    /// The wrapped value of a root model.
    ///
    /// # Panics
    ///
    /// Throws `std::out_of_range` if there is no `root` field.
    [[nodiscard]] auto root() const -> const Value& {
        return fields_.at("root");
    }

    [[nodiscard]] auto attributes() const -> Map override {
        return fields_;
    }

    auto replace_attributes(Map attributes) -> Result<bool, std::string> override {
        fields_ = std::move(attributes);
        return true;
    }

    /// Same class and equal fields.
    [[nodiscard]] auto equals(const Object& other) const -> bool override;

    /// `Name(field=value, ...)`
    [[nodiscard]] auto repr() const -> std::string override;

    /// Validating constructor.
    ///
    /// A map input supplies the fields; keys outside the schema are
    /// ignored. An existing instance of `cls` or a subclass is returned
    /// unchanged. For root models the whole input is the root value.
    static auto validate(const ClassRef& cls, const Value& input)
        -> Result<Rc<Model>, ValidationError>;

    /// Keyword constructor without validation. Missing fields take their
    /// defaults when they have one.
    static auto construct(const ClassRef& cls, const Map& kwargs)
        -> Result<Rc<Model>, ValidationError>;

    /// Checks an already-built instance against its class schema.
    static auto validate_instance(const Model& instance) -> Result<bool, ValidationError>;

private:
    ClassRef cls_;
    Map fields_;
};

} // namespace unijson

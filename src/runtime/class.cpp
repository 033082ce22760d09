//! # Class Descriptor Implementation
//!
//! Base-chain lookups, schema merging, `FieldType` names and `ClassBuilder`.

#include "runtime/class.hpp"

#include "runtime/object.hpp"

#include <algorithm>

namespace unijson {

// ============================================================================
// FieldType
// ============================================================================

auto FieldType::instance_of(ClassRef cls) -> FieldType {
    FieldType t(Kind::InstanceOf);
    t.cls_ = std::move(cls);
    return t;
}

auto FieldType::enum_of(ClassRef cls) -> FieldType {
    FieldType t(Kind::EnumOf);
    t.cls_ = std::move(cls);
    return t;
}

auto FieldType::list_of(FieldType item) -> FieldType {
    FieldType t(Kind::ListOf);
    t.item_ = make_rc<const FieldType>(std::move(item));
    return t;
}

auto FieldType::map_of(FieldType item) -> FieldType {
    FieldType t(Kind::MapOf);
    t.item_ = make_rc<const FieldType>(std::move(item));
    return t;
}

auto FieldType::optional(FieldType item) -> FieldType {
    FieldType t(Kind::Optional);
    t.item_ = make_rc<const FieldType>(std::move(item));
    return t;
}

auto FieldType::name() const -> std::string {
    switch (kind_) {
    case Kind::Any:
        return "Any";
    case Kind::Boolean:
        return "bool";
    case Kind::Integer:
        return "int";
    case Kind::Number:
        return "float";
    case Kind::String:
        return "str";
    case Kind::InstanceOf:
    case Kind::EnumOf:
        return cls_ ? cls_->name() : "?";
    case Kind::ListOf:
        return "list[" + item_->name() + "]";
    case Kind::MapOf:
        return "dict[str, " + item_->name() + "]";
    case Kind::Optional:
        return "Optional[" + item_->name() + "]";
    }
    return "?";
}

// ============================================================================
// Class
// ============================================================================

auto Class::qualified_name() const -> std::string {
    return module_.empty() ? name_ : module_ + "." + name_;
}

auto Class::is_subclass_of(const Class& other) const -> bool {
    for (const Class* c = this; c; c = c->base_.get()) {
        if (c == &other) {
            return true;
        }
    }
    return false;
}

auto Class::constructor() const -> const ConstructFn* {
    for (const Class* c = this; c; c = c->base_.get()) {
        if (c->constructor_) {
            return &c->constructor_;
        }
    }
    return nullptr;
}

auto Class::default_constructor() const -> const DefaultConstructFn* {
    for (const Class* c = this; c; c = c->base_.get()) {
        if (c->default_constructor_) {
            return &c->default_constructor_;
        }
    }
    return nullptr;
}

auto Class::decode_hook() const -> const DecodeHookFn* {
    for (const Class* c = this; c; c = c->base_.get()) {
        if (c->decode_hook_) {
            return &c->decode_hook_;
        }
    }
    return nullptr;
}

auto Class::schema() const -> ModelSchema {
    ModelSchema out = base_ ? base_->schema() : ModelSchema{};
    for (const auto& spec : fields_) {
        auto it = std::find_if(out.begin(), out.end(),
                               [&](const FieldSpec& f) { return f.name == spec.name; });
        if (it != out.end()) {
            *it = spec;
        } else {
            out.push_back(spec);
        }
    }
    return out;
}

auto Class::find_member(std::string_view name) const -> const EnumMember* {
    for (const Class* c = this; c; c = c->base_.get()) {
        for (const auto& member : c->members_) {
            if (member.name == name) {
                return &member;
            }
        }
    }
    return nullptr;
}

// ============================================================================
// ClassBuilder
// ============================================================================

ClassBuilder::ClassBuilder(std::string name, std::string module) : cls_(new Class()) {
    cls_->name_ = std::move(name);
    cls_->module_ = std::move(module);
}

auto ClassBuilder::base(ClassRef base) -> ClassBuilder& {
    if (!kind_set_ && base) {
        cls_->kind_ = base->kind();
    }
    cls_->base_ = std::move(base);
    return *this;
}

auto ClassBuilder::kind(ClassKind kind) -> ClassBuilder& {
    cls_->kind_ = kind;
    kind_set_ = true;
    return *this;
}

auto ClassBuilder::field(std::string name, FieldType type, FieldConstraints constraints)
    -> ClassBuilder& {
    cls_->fields_.push_back(
        FieldSpec{std::move(name), std::move(type), std::nullopt, std::move(constraints)});
    return *this;
}

auto ClassBuilder::field_with_default(std::string name, FieldType type, Value default_value,
                                      FieldConstraints constraints) -> ClassBuilder& {
    cls_->fields_.push_back(FieldSpec{std::move(name), std::move(type), std::move(default_value),
                                      std::move(constraints)});
    return *this;
}

auto ClassBuilder::constructor(ConstructFn fn) -> ClassBuilder& {
    cls_->constructor_ = std::move(fn);
    return *this;
}

auto ClassBuilder::default_constructor(DefaultConstructFn fn) -> ClassBuilder& {
    cls_->default_constructor_ = std::move(fn);
    return *this;
}

auto ClassBuilder::decode_hook(DecodeHookFn fn) -> ClassBuilder& {
    cls_->decode_hook_ = std::move(fn);
    return *this;
}

auto ClassBuilder::dynamic_attributes() -> ClassBuilder& {
    cls_->default_constructor_ = [](const ClassRef& cls) -> Result<ObjectRef, std::string> {
        return ObjectRef(make_rc<DynamicObject>(cls));
    };
    cls_->constructor_ = [](const ClassRef& cls,
                            const Map& kwargs) -> Result<ObjectRef, std::string> {
        return ObjectRef(make_rc<DynamicObject>(cls, kwargs));
    };
    return *this;
}

auto ClassBuilder::enum_member(std::string name, Value value) -> ClassBuilder& {
    cls_->members_.push_back(EnumMember{std::move(name), std::move(value)});
    return *this;
}

auto ClassBuilder::build() -> ClassRef {
    return cls_;
}

} // namespace unijson

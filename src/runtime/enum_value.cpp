#include "runtime/enum_value.hpp"

namespace unijson {

EnumValue::EnumValue(ClassRef cls, std::string name, Value value)
    : cls_(std::move(cls)), name_(std::move(name)), value_(std::move(value)) {}

auto EnumValue::attributes() const -> Map {
    return Map{{"_value_", value_}, {"_name_", Value(name_)}};
}

auto EnumValue::replace_attributes(Map /*attributes*/) -> Result<bool, std::string> {
    return std::string("cannot reassign members of enum '" + cls_->name() + "'");
}

auto EnumValue::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const EnumValue*>(&other);
    return rhs && rhs->cls_ == cls_ && rhs->name_ == name_;
}

auto EnumValue::repr() const -> std::string {
    return "<" + cls_->name() + "." + name_ + ": " + value_.repr() + ">";
}

auto EnumValue::member(const ClassRef& cls, std::string_view name)
    -> Result<Rc<EnumValue>, std::string> {
    if (!cls->is_enum()) {
        return std::string("'" + cls->name() + "' is not an enum");
    }
    const EnumMember* m = cls->find_member(name);
    if (!m) {
        return std::string("'" + std::string(name) + "' is not a valid " + cls->name() + " member");
    }
    return make_rc<EnumValue>(cls, m->name, m->value);
}

auto EnumValue::from_value(const ClassRef& cls, const Value& value)
    -> Result<Rc<EnumValue>, std::string> {
    if (!cls->is_enum()) {
        return std::string("'" + cls->name() + "' is not an enum");
    }
    for (const Class* c = cls.get(); c; c = c->base().get()) {
        for (const auto& m : c->enum_members()) {
            if (m.value == value) {
                return make_rc<EnumValue>(cls, m.name, m.value);
            }
        }
    }
    return std::string(value.repr() + " is not a valid " + cls->name());
}

} // namespace unijson

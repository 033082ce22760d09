#include "runtime/object.hpp"

#include "runtime/class.hpp"

namespace unijson {

auto Object::repr() const -> std::string {
    return "<" + klass()->qualified_name() + " object>";
}

DynamicObject::DynamicObject(ClassRef cls, Map attributes)
    : cls_(std::move(cls)), attrs_(std::move(attributes)) {}

auto DynamicObject::get(std::string_view name) const -> const Value* {
    auto it = attrs_.find(name);
    return it == attrs_.end() ? nullptr : &it->second;
}

auto DynamicObject::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const DynamicObject*>(&other);
    return rhs && rhs->cls_ == cls_ && rhs->attrs_ == attrs_;
}

auto DynamicObject::repr() const -> std::string {
    std::string out = cls_->name() + "(";
    bool first = true;
    for (const auto& [key, value] : attrs_) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += key + "=" + value.repr();
    }
    return out + ")";
}

} // namespace unijson

#include "registry/class_registry.hpp"

#include "log/log.hpp"

namespace unijson {

auto RegistryError::not_found(std::string_view name) -> RegistryError {
    return RegistryError{Kind::NotFound, "Class '" + std::string(name) + "' not found in registry",
                         std::string(name)};
}

auto RegistryError::inheritance_mismatch(std::string_view name, std::string message)
    -> RegistryError {
    return RegistryError{Kind::InheritanceMismatch, std::move(message), std::string(name)};
}

void DefaultClassRegistry::teardown() {
    classes_.clear();
}

void DefaultClassRegistry::register_class(const ClassRef& cls,
                                          const std::optional<std::string>& name,
                                          bool should_warn_if_already_registered) {
    std::string key = name.value_or(cls->name());
    auto it = classes_.find(key);
    if (it != classes_.end()) {
        if (should_warn_if_already_registered) {
            UNIJSON_LOG_DEBUG("registry", "Class '" << key << "' already exists in registry, skipping");
            return;
        }
        it->second = cls;
    } else {
        classes_.emplace(key, cls);
    }
    UNIJSON_LOG_DEBUG("registry", "Registered new single class '" << key << "' in registry");
}

void DefaultClassRegistry::register_classes(const std::vector<ClassRef>& classes) {
    if (classes.empty()) {
        UNIJSON_LOG_DEBUG("registry", "register_classes called with empty list of classes to register");
        return;
    }
    for (const auto& cls : classes) {
        classes_.insert_or_assign(cls->name(), cls);
    }
    if (classes.size() == 1) {
        UNIJSON_LOG_DEBUG("registry",
                          "Registered single class '" << classes.front()->name() << "' in registry");
    } else {
        UNIJSON_LOG_DEBUG("registry", "Registered " << classes.size() << " classes in registry");
    }
}

void DefaultClassRegistry::register_classes(const std::map<std::string, ClassRef>& classes) {
    if (classes.empty()) {
        UNIJSON_LOG_DEBUG("registry", "register_classes called with empty dict of classes to register");
        return;
    }
    for (const auto& [name, cls] : classes) {
        classes_.insert_or_assign(name, cls);
    }
    if (classes.size() == 1) {
        UNIJSON_LOG_DEBUG("registry", "Registered single class '" << classes.begin()->second->name()
                                                                  << "' in registry");
    } else {
        UNIJSON_LOG_DEBUG("registry", "Registered " << classes.size() << " classes in registry");
    }
}

auto DefaultClassRegistry::unregister_class(const ClassRef& cls) -> Result<bool, RegistryError> {
    return unregister_class_by_name(cls->name());
}

auto DefaultClassRegistry::unregister_class_by_name(std::string_view name)
    -> Result<bool, RegistryError> {
    auto it = classes_.find(name);
    if (it == classes_.end()) {
        return RegistryError::not_found(name);
    }
    classes_.erase(it);
    UNIJSON_LOG_DEBUG("registry", "Unregistered class '" << name << "' from registry");
    return true;
}

auto DefaultClassRegistry::get_class(std::string_view name) const -> ClassRef {
    auto it = classes_.find(name);
    return it == classes_.end() ? nullptr : it->second;
}

auto DefaultClassRegistry::get_required_class(std::string_view name) const
    -> Result<ClassRef, RegistryError> {
    auto cls = get_class(name);
    if (!cls) {
        return RegistryError::not_found(name);
    }
    return cls;
}

auto DefaultClassRegistry::get_required_subclass(std::string_view name, const ClassRef& base) const
    -> Result<ClassRef, RegistryError> {
    auto found = get_required_class(name);
    if (is_err(found)) {
        return found;
    }
    const ClassRef& cls = unwrap(found);
    if (!cls->is_subclass_of(*base)) {
        return RegistryError::inheritance_mismatch(
            name, "Class '" + std::string(name) + "' (" + cls->qualified_name() +
                      ") is not a subclass of '" + base->name() + "' (" + base->qualified_name() +
                      ")");
    }
    return cls;
}

auto DefaultClassRegistry::get_required_base_model(std::string_view name) const
    -> Result<ClassRef, RegistryError> {
    auto found = get_required_class(name);
    if (is_err(found)) {
        return found;
    }
    const ClassRef& cls = unwrap(found);
    if (!cls->is_model()) {
        return RegistryError::inheritance_mismatch(
            name, "Class '" + std::string(name) + "' (" + cls->qualified_name() +
                      ") is not a subclass of 'BaseModel'");
    }
    return cls;
}

auto DefaultClassRegistry::has_class(std::string_view name) const -> bool {
    return classes_.find(name) != classes_.end();
}

auto DefaultClassRegistry::has_subclass(std::string_view name, const ClassRef& base) const
    -> bool {
    auto cls = get_class(name);
    return cls && cls->is_subclass_of(*base);
}

} // namespace unijson

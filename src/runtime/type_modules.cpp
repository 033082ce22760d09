#include "runtime/type_modules.hpp"

namespace unijson {

void TypeModules::add(const ClassRef& cls) {
    add(cls->module(), cls->name(), cls);
}

void TypeModules::add(const std::string& module, const std::string& name, const ClassRef& cls) {
    modules_[module].insert_or_assign(name, cls);
}

auto TypeModules::has_module(std::string_view module) const -> bool {
    return modules_.find(module) != modules_.end();
}

auto TypeModules::find(std::string_view module, std::string_view name) const -> ClassRef {
    auto mod = modules_.find(module);
    if (mod == modules_.end()) {
        return nullptr;
    }
    auto it = mod->second.find(name);
    return it == mod->second.end() ? nullptr : it->second;
}

auto TypeModules::classes(std::string_view module) const -> std::vector<ClassRef> {
    std::vector<ClassRef> out;
    auto mod = modules_.find(module);
    if (mod != modules_.end()) {
        for (const auto& [_, cls] : mod->second) {
            out.push_back(cls);
        }
    }
    return out;
}

auto TypeModules::module_names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& [name, _] : modules_) {
        out.push_back(name);
    }
    return out;
}

auto TypeModules::remove_module(std::string_view module) -> bool {
    auto it = modules_.find(module);
    if (it == modules_.end()) {
        return false;
    }
    modules_.erase(it);
    return true;
}

} // namespace unijson

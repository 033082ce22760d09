//! # Type Modules
//!
//! The table of loaded type modules: module name to class name to class.
//! It is the first place the decoder looks when resolving a tagged node.
//! Classes are added by the program itself or by loadable modules through
//! `unijson_module_init`.

#pragma once

#include "common.hpp"
#include "runtime/class.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace unijson {

class TypeModules {
public:
    /// Adds `cls` under its own module and name, replacing an existing entry.
    void add(const ClassRef& cls);

    /// Adds `cls` under an explicit module and name.
    void add(const std::string& module, const std::string& name, const ClassRef& cls);

    [[nodiscard]] auto has_module(std::string_view module) const -> bool;

    /// The class `name` in `module`, or `nullptr`.
    [[nodiscard]] auto find(std::string_view module, std::string_view name) const -> ClassRef;

    /// Every class of `module`, ordered by name.
    [[nodiscard]] auto classes(std::string_view module) const -> std::vector<ClassRef>;

    [[nodiscard]] auto module_names() const -> std::vector<std::string>;

    auto remove_module(std::string_view module) -> bool;

    void clear() {
        modules_.clear();
    }

private:
    std::map<std::string, std::map<std::string, ClassRef, std::less<>>, std::less<>> modules_;
};

} // namespace unijson

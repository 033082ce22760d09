//! # Class Registry
//!
//! A name-keyed table of classes consulted by the decoder when a tagged
//! node names a module that is not loaded, or a class that module does not
//! define. Runtime-generated classes (generic model instantiations such as
//! `Box[int]`) are only reachable this way.
//!
//! ## Lookup Contract
//!
//! | Operation | Missing name | Wrong kind |
//! |-----------|--------------|------------|
//! | `get_class` | `nullptr` | - |
//! | `get_required_class` | `NotFound` | - |
//! | `get_required_subclass` | `NotFound` | `InheritanceMismatch` |
//! | `get_required_base_model` | `NotFound` | `InheritanceMismatch` |
//! | `has_class` / `has_subclass` | `false` | `false` |
//!
//! Registry operations log on the `registry` channel.

#pragma once

#include "common.hpp"
#include "runtime/class.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unijson {

/// Error reported by registry lookups and removals.
struct RegistryError {
    enum class Kind : uint8_t {
        NotFound,           ///< No class under the requested name
        InheritanceMismatch ///< The class is not of the requested kind
    };

    Kind kind;
    std::string message;
    std::string class_name;

    static auto not_found(std::string_view name) -> RegistryError;
    static auto inheritance_mismatch(std::string_view name, std::string message) -> RegistryError;

    [[nodiscard]] auto to_string() const -> const std::string& {
        return message;
    }
};

/// Abstract class registry.
///
/// `DefaultClassRegistry` is the in-memory implementation. The registry
/// manager hands out one instance per process; tests and embedders may
/// inject their own.
class ClassRegistry {
public:
    virtual ~ClassRegistry() = default;

    virtual void setup() = 0;

    /// Removes every entry.
    virtual void teardown() = 0;

    /// Stores `cls` under `name`, or under its declared name.
    ///
    /// # Arguments
    ///
    /// * `cls` - The class to register
    /// * `name` - Registry key; defaults to `cls->name()`
    /// * `should_warn_if_already_registered` - On a name collision, log and
    ///   keep the existing entry when `true`, overwrite when `false`
    virtual void register_class(const ClassRef& cls,
                                const std::optional<std::string>& name = std::nullopt,
                                bool should_warn_if_already_registered = true) = 0;

    /// Registers each class under its declared name.
    virtual void register_classes(const std::vector<ClassRef>& classes) = 0;

    /// Registers each class under its map key.
    virtual void register_classes(const std::map<std::string, ClassRef>& classes) = 0;

    /// Removes the entry under `cls`'s declared name.
    virtual auto unregister_class(const ClassRef& cls) -> Result<bool, RegistryError> = 0;

    virtual auto unregister_class_by_name(std::string_view name)
        -> Result<bool, RegistryError> = 0;

    /// The class registered under `name`, or `nullptr`.
    [[nodiscard]] virtual auto get_class(std::string_view name) const -> ClassRef = 0;

    [[nodiscard]] virtual auto get_required_class(std::string_view name) const
        -> Result<ClassRef, RegistryError> = 0;

    /// Like `get_required_class`, but the class must be `base` or derive from it.
    [[nodiscard]] virtual auto get_required_subclass(std::string_view name,
                                                     const ClassRef& base) const
        -> Result<ClassRef, RegistryError> = 0;

    /// Like `get_required_class`, but the class must be a model class.
    [[nodiscard]] virtual auto get_required_base_model(std::string_view name) const
        -> Result<ClassRef, RegistryError> = 0;

    [[nodiscard]] virtual auto has_class(std::string_view name) const -> bool = 0;

    [[nodiscard]] virtual auto has_subclass(std::string_view name, const ClassRef& base) const
        -> bool = 0;

    [[nodiscard]] virtual auto size() const -> size_t = 0;
};

/// In-memory registry keyed by name.
class DefaultClassRegistry : public ClassRegistry {
public:
    void setup() override {}
    void teardown() override;

    void register_class(const ClassRef& cls, const std::optional<std::string>& name = std::nullopt,
                        bool should_warn_if_already_registered = true) override;
    void register_classes(const std::vector<ClassRef>& classes) override;
    void register_classes(const std::map<std::string, ClassRef>& classes) override;

    auto unregister_class(const ClassRef& cls) -> Result<bool, RegistryError> override;
    auto unregister_class_by_name(std::string_view name) -> Result<bool, RegistryError> override;

    [[nodiscard]] auto get_class(std::string_view name) const -> ClassRef override;
    [[nodiscard]] auto get_required_class(std::string_view name) const
        -> Result<ClassRef, RegistryError> override;
    [[nodiscard]] auto get_required_subclass(std::string_view name, const ClassRef& base) const
        -> Result<ClassRef, RegistryError> override;
    [[nodiscard]] auto get_required_base_model(std::string_view name) const
        -> Result<ClassRef, RegistryError> override;

    [[nodiscard]] auto has_class(std::string_view name) const -> bool override;
    [[nodiscard]] auto has_subclass(std::string_view name, const ClassRef& base) const
        -> bool override;

    [[nodiscard]] auto size() const -> size_t override {
        return classes_.size();
    }

private:
    std::map<std::string, ClassRef, std::less<>> classes_;
};

} // namespace unijson

//! # Registry Manager
//!
//! Holds the process' active class registry. The decoder asks the manager
//! when its codec context has no registry of its own.
//!
//! ## Lifecycle
//!
//! | Call | Effect |
//! |------|--------|
//! | `init(registry)` | Replaces the live manager; a null registry means a fresh default one |
//! | `get_instance()` | The live manager, created with a default registry on first use |
//! | `get_class_registry()` | Registry of the live manager |
//! | `teardown()` | Drops the live manager and its registry |
//!
//! Creation is last-wins: a later `init` replaces an earlier manager.

#pragma once

#include "common.hpp"
#include "registry/class_registry.hpp"

#include <mutex>

namespace unijson {

class RegistryManager {
public:
    explicit RegistryManager(Rc<ClassRegistry> registry);

    // Non-copyable
    RegistryManager(const RegistryManager&) = delete;
    RegistryManager& operator=(const RegistryManager&) = delete;

    /// Installs a new live manager around `registry`.
    static auto init(Rc<ClassRegistry> registry = nullptr) -> Rc<RegistryManager>;

    static auto get_instance() -> Rc<RegistryManager>;

    static auto get_class_registry() -> Rc<ClassRegistry>;

    [[nodiscard]] static auto has_instance() -> bool;

    static void teardown();

    [[nodiscard]] auto class_registry() const -> const Rc<ClassRegistry>& {
        return registry_;
    }

private:
    Rc<ClassRegistry> registry_;

    static std::mutex mutex_;
    static Rc<RegistryManager> instance_;
};

} // namespace unijson

//! # Class Discovery
//!
//! Harvests the classes a type-module library defines and registers them.
//!
//! ```text
//! 1. Load the library into a scratch TypeModules table
//! 2. Keep classes of the library's own module (unless include_imported)
//! 3. Keep subclasses of `base` (when set)
//! 4. Register each under its declared name
//! ```
//!
//! A library that adds classes of other modules to the table (for example
//! a shared base class) is "importing" them; those are skipped by default.

#pragma once

#include "common.hpp"
#include "registry/class_registry.hpp"
#include "runtime/module_loader.hpp"

#include <string>
#include <vector>

namespace unijson {

struct DiscoveryOptions {
    /// Only keep classes deriving from this one. `nullptr` keeps every class.
    ClassRef base;

    /// Also keep classes the library adds under other module names.
    bool include_imported = false;

    /// Descend into subdirectories when scanning a directory.
    bool recursive = true;
};

/// The classes defined by the type module at `path`, ordered by module
/// then name.
[[nodiscard]] auto find_classes_in_library(SharedLibraryLoader& loader, const fs::path& path,
                                           const DiscoveryOptions& options = {})
    -> Result<std::vector<ClassRef>, std::string>;

/// Registers the classes found in the library at `path`.
///
/// # Returns
///
/// The number of classes registered.
auto register_classes_in_library(ClassRegistry& registry, SharedLibraryLoader& loader,
                                 const fs::path& path, const DiscoveryOptions& options = {})
    -> Result<size_t, std::string>;

/// Registers the classes of every `*.so` under `dir`. The first library
/// that fails to load aborts the scan.
auto register_classes_in_directory(ClassRegistry& registry, SharedLibraryLoader& loader,
                                   const fs::path& dir, const DiscoveryOptions& options = {})
    -> Result<size_t, std::string>;

} // namespace unijson

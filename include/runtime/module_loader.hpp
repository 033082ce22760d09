//! # Module Loader
//!
//! Imports type modules by name. The decoder calls `import_module` when a
//! tagged node names a module that is not in its `TypeModules` table.
//!
//! `SharedLibraryLoader` maps module names to shared libraries:
//!
//! ```text
//! 0. Reject names that are not dotted identifiers
//! 1. For each search directory, try <dir>/<a>/<b>.so for module "a.b"
//! 2. Then <dir>/lib<a_b>.so
//! 3. dlopen the first hit, check unijson_module_query() ABI version
//! 4. Check the declared name matches before any init
//! 5. Call unijson_module_init() with the target table
//! ```
//!
//! ## Search Order
//!
//! 1. Directories passed to the constructor (the codec context passes
//!    `UNIJSON_MODULE_PATH` entries here)
//! 2. Directories added with `add_search_path()`

#pragma once

#include "common.hpp"
#include "runtime/module_abi.h"
#include "runtime/type_modules.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace unijson {

namespace fs = std::filesystem;

/// Imports type modules into a `TypeModules` table.
class ModuleLoader {
public:
    virtual ~ModuleLoader() = default;

    /// Makes the classes of `module` available in `into`.
    virtual auto import_module(const std::string& module, TypeModules& into)
        -> Result<bool, std::string> = 0;
};

/// A shared library opened by the loader.
struct LoadedModule {
    void* handle = nullptr;
    const UnijsonModuleInfo* info = nullptr;
    UnijsonModuleInitFn init = nullptr;
    fs::path path;
};

/// Loads type modules from shared libraries.
///
/// Libraries stay mapped for the life of the process: classes created by a
/// module outlive the loader through shared references, so their code must
/// too.
class SharedLibraryLoader : public ModuleLoader {
public:
    explicit SharedLibraryLoader(std::vector<fs::path> search_paths = {});

    // Non-copyable
    SharedLibraryLoader(const SharedLibraryLoader&) = delete;
    SharedLibraryLoader& operator=(const SharedLibraryLoader&) = delete;

    void add_search_path(fs::path dir);

    [[nodiscard]] auto search_paths() const -> const std::vector<fs::path>& {
        return search_paths_;
    }

    auto import_module(const std::string& module, TypeModules& into)
        -> Result<bool, std::string> override;

    /// Loads the library at `path` and initializes it into `into`.
    ///
    /// # Returns
    ///
    /// The loaded library; its `info->name` is the module it declares.
    auto load_library(const fs::path& path, TypeModules& into)
        -> Result<const LoadedModule*, std::string>;

    [[nodiscard]] auto is_loaded(const std::string& module) const -> bool;

    /// Forgets every loaded library. Handles are not closed.
    void unload_all();

private:
    std::vector<fs::path> search_paths_;
    std::unordered_map<std::string, LoadedModule> loaded_;

    [[nodiscard]] auto candidates(const std::string& module) const -> std::vector<fs::path>;
    auto open(const fs::path& path) -> Result<LoadedModule, std::string>;
    static auto initialize(const LoadedModule& module, TypeModules& into)
        -> Result<bool, std::string>;
    auto adopt(LoadedModule module, TypeModules& into) -> Result<const LoadedModule*, std::string>;
};

/// True when every dot-separated part of `module` is a non-empty run of
/// `[A-Za-z0-9_]`. Names failing this never reach the filesystem.
[[nodiscard]] auto is_valid_module_name(std::string_view module) -> bool;

} // namespace unijson

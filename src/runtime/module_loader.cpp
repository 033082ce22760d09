//! # Module Loader Implementation
//!
//! `dlopen`-based loading of type modules.

#include "runtime/module_loader.hpp"

#include "log/log.hpp"

#include <algorithm>

#include <dlfcn.h>

namespace unijson {

namespace {

auto dl_error() -> std::string {
    const char* err = dlerror();
    return err ? err : "unknown error";
}

} // anonymous namespace

// ============================================================================
// Loader lifecycle
// ============================================================================

SharedLibraryLoader::SharedLibraryLoader(std::vector<fs::path> search_paths)
    : search_paths_(std::move(search_paths)) {}

void SharedLibraryLoader::add_search_path(fs::path dir) {
    search_paths_.push_back(std::move(dir));
}

void SharedLibraryLoader::unload_all() {
    loaded_.clear();
}

auto SharedLibraryLoader::is_loaded(const std::string& module) const -> bool {
    return loaded_.count(module) > 0;
}

// ============================================================================
// Loading
// ============================================================================

auto SharedLibraryLoader::candidates(const std::string& module) const -> std::vector<fs::path> {
    fs::path nested;
    std::string flat = module;
    size_t start = 0;
    while (true) {
        size_t dot = module.find('.', start);
        auto part = module.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (dot == std::string::npos) {
            nested /= part + ".so";
            break;
        }
        nested /= part;
        start = dot + 1;
    }
    std::replace(flat.begin(), flat.end(), '.', '_');

    std::vector<fs::path> out;
    for (const auto& dir : search_paths_) {
        out.push_back(dir / nested);
        out.push_back(dir / ("lib" + flat + ".so"));
    }
    return out;
}

auto SharedLibraryLoader::open(const fs::path& path) -> Result<LoadedModule, std::string> {
    LoadedModule module;
    module.path = path;
    module.handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!module.handle) {
        return "failed to load " + path.string() + ": " + dl_error();
    }

    auto query_fn =
        reinterpret_cast<UnijsonModuleQueryFn>(dlsym(module.handle, "unijson_module_query"));
    if (!query_fn) {
        dlclose(module.handle);
        return path.string() + " does not export unijson_module_query()";
    }
    module.info = query_fn();
    if (!module.info || !module.info->name) {
        dlclose(module.handle);
        return path.string() + " returned no module metadata";
    }
    if (module.info->abi_version != UNIJSON_MODULE_ABI_VERSION) {
        uint32_t found = module.info->abi_version;
        dlclose(module.handle);
        return "ABI version mismatch for " + path.string() + ": expected " +
               std::to_string(UNIJSON_MODULE_ABI_VERSION) + ", found " + std::to_string(found);
    }

    module.init = reinterpret_cast<UnijsonModuleInitFn>(dlsym(module.handle, "unijson_module_init"));
    if (!module.init) {
        dlclose(module.handle);
        return path.string() + " does not export unijson_module_init()";
    }
    return module;
}

auto SharedLibraryLoader::initialize(const LoadedModule& module, TypeModules& into)
    -> Result<bool, std::string> {
    if (module.init(static_cast<void*>(&into)) != 0) {
        return "init failed for module '" + std::string(module.info->name) + "'";
    }
    return true;
}

auto SharedLibraryLoader::adopt(LoadedModule module, TypeModules& into)
    -> Result<const LoadedModule*, std::string> {
    auto init = initialize(module, into);
    if (is_err(init)) {
        UNIJSON_LOG_ERROR("loader", unwrap_err(init));
        return unwrap_err(init);
    }

    std::string name = module.info->name;
    UNIJSON_LOG_DEBUG("loader", "Loaded type module '" << name << "' from " << module.path.string());
    auto [it, _] = loaded_.insert_or_assign(name, std::move(module));
    return &it->second;
}

auto SharedLibraryLoader::load_library(const fs::path& path, TypeModules& into)
    -> Result<const LoadedModule*, std::string> {
    auto opened = open(path);
    if (is_err(opened)) {
        UNIJSON_LOG_ERROR("loader", unwrap_err(opened));
        return unwrap_err(opened);
    }
    return adopt(std::move(unwrap(opened)), into);
}

auto SharedLibraryLoader::import_module(const std::string& module, TypeModules& into)
    -> Result<bool, std::string> {
    if (!is_valid_module_name(module)) {
        UNIJSON_LOG_WARN("loader", "Refusing to import invalid module name '" << module << "'");
        return "Invalid module name '" + module + "'";
    }

    // Already mapped: the table may still be a fresh one
    if (auto it = loaded_.find(module); it != loaded_.end()) {
        return initialize(it->second, into);
    }

    for (const auto& path : candidates(module)) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            continue;
        }
        auto opened = open(path);
        if (is_err(opened)) {
            UNIJSON_LOG_ERROR("loader", unwrap_err(opened));
            return unwrap_err(opened);
        }
        auto& candidate = unwrap(opened);
        std::string declared = candidate.info->name;
        if (declared != module) {
            // Not initialized yet, nothing references it
            dlclose(candidate.handle);
            return "library " + path.string() + " declares module '" + declared +
                   "', expected '" + module + "'";
        }
        auto adopted = adopt(std::move(candidate), into);
        if (is_err(adopted)) {
            return unwrap_err(adopted);
        }
        return true;
    }

    UNIJSON_LOG_DEBUG("loader", "No library found for module '" << module << "'");
    return "No module named '" + module + "'";
}

auto is_valid_module_name(std::string_view module) -> bool {
    if (module.empty()) {
        return false;
    }
    size_t part_length = 0;
    for (char c : module) {
        if (c == '.') {
            if (part_length == 0) {
                return false;
            }
            part_length = 0;
            continue;
        }
        bool word = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_';
        if (!word) {
            return false;
        }
        ++part_length;
    }
    return part_length > 0;
}

} // namespace unijson

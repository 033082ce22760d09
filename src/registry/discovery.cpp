#include "registry/discovery.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace unijson {

auto find_classes_in_library(SharedLibraryLoader& loader, const fs::path& path,
                             const DiscoveryOptions& options)
    -> Result<std::vector<ClassRef>, std::string> {
    TypeModules scratch;
    auto loaded = loader.load_library(path, scratch);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    std::string own_module = unwrap(loaded)->info->name;

    std::vector<ClassRef> found;
    for (const auto& module : scratch.module_names()) {
        if (!options.include_imported && module != own_module) {
            continue;
        }
        for (auto& cls : scratch.classes(module)) {
            if (options.base && !cls->is_subclass_of(*options.base)) {
                continue;
            }
            found.push_back(std::move(cls));
        }
    }
    return found;
}

auto register_classes_in_library(ClassRegistry& registry, SharedLibraryLoader& loader,
                                 const fs::path& path, const DiscoveryOptions& options)
    -> Result<size_t, std::string> {
    auto found = find_classes_in_library(loader, path, options);
    if (is_err(found)) {
        return unwrap_err(found);
    }
    auto& classes = unwrap(found);
    registry.register_classes(classes);
    return classes.size();
}

auto register_classes_in_directory(ClassRegistry& registry, SharedLibraryLoader& loader,
                                   const fs::path& dir, const DiscoveryOptions& options)
    -> Result<size_t, std::string> {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return "Not a directory: " + dir.string();
    }

    std::vector<fs::path> libraries;
    auto collect = [&](const fs::directory_entry& entry) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".so") {
            libraries.push_back(entry.path());
        }
    };
    if (options.recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(dir, ec)) {
            collect(entry);
        }
    } else {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            collect(entry);
        }
    }
    if (ec) {
        return "Failed to scan " + dir.string() + ": " + ec.message();
    }
    std::sort(libraries.begin(), libraries.end());

    size_t total = 0;
    for (const auto& path : libraries) {
        auto count = register_classes_in_library(registry, loader, path, options);
        if (is_err(count)) {
            return unwrap_err(count);
        }
        total += unwrap(count);
    }
    UNIJSON_LOG_DEBUG("registry", "Discovered " << total << " classes in " << libraries.size()
                                                << " libraries under " << dir.string());
    return total;
}

} // namespace unijson

//! # Type Module Loading Tests
//!
//! Loads the `sample_gadgets` test module from the build tree, discovers its
//! classes into a registry, and decodes documents whose `__module__` is only
//! reachable through the module search path.

#include "codec/api.hpp"
#include "registry/class_registry.hpp"
#include "registry/discovery.hpp"
#include "runtime/model.hpp"
#include "runtime/module_loader.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace unijson;

namespace {

const fs::path module_dir = UNIJSON_TEST_MODULE_DIR;

auto names_of(const std::vector<ClassRef>& classes) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& cls : classes) {
        names.push_back(cls->name());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

class LoaderTest : public ::testing::Test {
protected:
    SharedLibraryLoader loader{std::vector<fs::path>{module_dir}};
    TypeModules table;
};

// ============================================================================
// Import
// ============================================================================

TEST_F(LoaderTest, ImportsModuleFromSearchPath) {
    auto imported = loader.import_module("sample_gadgets", table);
    ASSERT_TRUE(is_ok(imported)) << unwrap_err(imported);

    EXPECT_TRUE(loader.is_loaded("sample_gadgets"));
    EXPECT_NE(table.find("sample_gadgets", "Gadget"), nullptr);
    EXPECT_NE(table.find("sample_gadgets", "Widget"), nullptr);
    EXPECT_TRUE(table.has_module("sample_shared"));
}

TEST_F(LoaderTest, ReimportFillsFreshTable) {
    ASSERT_TRUE(is_ok(loader.import_module("sample_gadgets", table)));

    TypeModules other;
    ASSERT_TRUE(is_ok(loader.import_module("sample_gadgets", other)));
    EXPECT_EQ(other.find("sample_gadgets", "Gadget"), table.find("sample_gadgets", "Gadget"));
}

TEST_F(LoaderTest, MissingModuleIsReported) {
    auto imported = loader.import_module("nowhere", table);
    ASSERT_TRUE(is_err(imported));
    EXPECT_EQ(unwrap_err(imported), "No module named 'nowhere'");
    EXPECT_FALSE(loader.is_loaded("nowhere"));
}

TEST_F(LoaderTest, ModuleNamesMustBeDottedIdentifiers) {
    EXPECT_TRUE(is_valid_module_name("sample_gadgets"));
    EXPECT_TRUE(is_valid_module_name("pkg.sub_1"));
    EXPECT_TRUE(is_valid_module_name("__main__"));

    for (const std::string name :
         {"", ".", "a..b", ".a", "a.", "..", "a/b", "/tmp/evil", "a.b-c", "a b"}) {
        EXPECT_FALSE(is_valid_module_name(name)) << name;
    }
}

TEST_F(LoaderTest, PathLikeModuleNameIsRejectedBeforeLoading) {
    auto outside = (module_dir / "sample_gadgets").string();
    auto imported = loader.import_module(outside, table);
    ASSERT_TRUE(is_err(imported));
    EXPECT_EQ(unwrap_err(imported), "Invalid module name '" + outside + "'");
    EXPECT_FALSE(loader.is_loaded("sample_gadgets"));
    EXPECT_TRUE(table.module_names().empty());
}

TEST_F(LoaderTest, MismatchedDeclaredNameIsNotInitialized) {
    auto dir = fs::temp_directory_path() / "unijson_loader_test";
    fs::create_directories(dir);
    fs::copy_file(module_dir / "sample_gadgets.so", dir / "impostor.so",
                  fs::copy_options::overwrite_existing);

    SharedLibraryLoader impostor_loader{std::vector<fs::path>{dir}};
    auto imported = impostor_loader.import_module("impostor", table);
    ASSERT_TRUE(is_err(imported));
    EXPECT_NE(unwrap_err(imported).find("declares module 'sample_gadgets', expected 'impostor'"),
              std::string::npos);
    EXPECT_FALSE(impostor_loader.is_loaded("sample_gadgets"));
    EXPECT_FALSE(impostor_loader.is_loaded("impostor"));
    EXPECT_TRUE(table.module_names().empty());

    fs::remove_all(dir);
}

TEST_F(LoaderTest, LoadLibraryExposesMetadata) {
    auto loaded = loader.load_library(module_dir / "sample_gadgets.so", table);
    ASSERT_TRUE(is_ok(loaded)) << unwrap_err(loaded);
    EXPECT_STREQ(unwrap(loaded)->info->name, "sample_gadgets");
    EXPECT_STREQ(unwrap(loaded)->info->version, "0.1.0");
}

TEST_F(LoaderTest, UnreadableLibraryIsRejected) {
    auto loaded = loader.load_library(module_dir / "missing.so", table);
    ASSERT_TRUE(is_err(loaded));
    EXPECT_NE(unwrap_err(loaded).find("failed to load"), std::string::npos);
}

// ============================================================================
// Discovery
// ============================================================================

TEST_F(LoaderTest, DiscoversOwnClassesOnly) {
    auto found = find_classes_in_library(loader, module_dir / "sample_gadgets.so", {});
    ASSERT_TRUE(is_ok(found)) << unwrap_err(found);
    EXPECT_EQ(names_of(unwrap(found)), (std::vector<std::string>{"Gadget", "Widget"}));
}

TEST_F(LoaderTest, DiscoveryCanIncludeImportedClasses) {
    DiscoveryOptions options;
    options.include_imported = true;

    auto found = find_classes_in_library(loader, module_dir / "sample_gadgets.so", options);
    ASSERT_TRUE(is_ok(found)) << unwrap_err(found);
    EXPECT_EQ(names_of(unwrap(found)), (std::vector<std::string>{"Gadget", "Part", "Widget"}));
}

TEST_F(LoaderTest, DiscoveryFiltersByBase) {
    ASSERT_TRUE(is_ok(loader.import_module("sample_gadgets", table)));

    DiscoveryOptions options;
    options.base = table.find("sample_gadgets", "Gadget");

    auto found = find_classes_in_library(loader, module_dir / "sample_gadgets.so", options);
    ASSERT_TRUE(is_ok(found)) << unwrap_err(found);
    EXPECT_EQ(names_of(unwrap(found)), (std::vector<std::string>{"Gadget"}));
}

TEST_F(LoaderTest, RegistersClassesFromDirectory) {
    DefaultClassRegistry registry;
    auto count = register_classes_in_directory(registry, loader, module_dir, {});
    ASSERT_TRUE(is_ok(count)) << unwrap_err(count);

    EXPECT_EQ(unwrap(count), 2u);
    EXPECT_TRUE(registry.has_class("Gadget"));
    EXPECT_TRUE(registry.has_class("Widget"));
    EXPECT_FALSE(registry.has_class("Part"));
}

TEST_F(LoaderTest, DirectoryMustExist) {
    DefaultClassRegistry registry;
    auto count = register_classes_in_directory(registry, loader, module_dir / "nope", {});
    ASSERT_TRUE(is_err(count));
    EXPECT_EQ(unwrap_err(count), "Not a directory: " + (module_dir / "nope").string());
}

// ============================================================================
// Decoding Through the Search Path
// ============================================================================

class LoaderDecodeTest : public ::testing::Test {
protected:
    CodecContext context{[] {
        CodecConfig config;
        config.module_search_paths.push_back(module_dir);
        return config;
    }()};

    void SetUp() override {
        context.set_registry(make_rc<DefaultClassRegistry>());
    }
};

TEST_F(LoaderDecodeTest, ImportsModuleOnFirstUse) {
    auto value = loads(std::string_view(R"({"name": "lamp", "weight": 2.5,)"
                                        R"( "__class__": "Gadget", "__module__": "sample_gadgets"})"),
                       {}, context);
    ASSERT_TRUE(is_ok(value)) << unwrap_err(value).to_string();

    auto gadget = unwrap(value).as<Model>();
    ASSERT_NE(gadget, nullptr);
    EXPECT_EQ(gadget->klass()->qualified_name(), "sample_gadgets.Gadget");
    EXPECT_EQ(*gadget->get("weight"), Value(2.5));
    EXPECT_TRUE(context.type_modules().has_module("sample_gadgets"));
}

TEST_F(LoaderDecodeTest, LoadedModelIsValidated) {
    auto value = loads(std::string_view(R"({"name": "lamp", "weight": -1,)"
                                        R"( "__class__": "Gadget", "__module__": "sample_gadgets"})"),
                       {}, context);
    ASSERT_TRUE(is_err(value));
    EXPECT_EQ(unwrap_err(value).kind, CodecErrorKind::ValidationFailed);
}

TEST_F(LoaderDecodeTest, ModuleTagCannotNameAPath) {
    auto module = (module_dir / "sample_gadgets").string();
    auto text = R"({"__class__": "Gadget", "__module__": ")" + module + R"("})";

    auto value = loads(std::string_view(text), {}, context);
    ASSERT_TRUE(is_err(value));
    EXPECT_EQ(unwrap_err(value).kind, CodecErrorKind::DecodeImportFailed);
    EXPECT_NE(unwrap_err(value).message.find("Invalid module name"), std::string::npos);
    EXPECT_FALSE(context.type_modules().has_module("sample_gadgets"));
}

TEST_F(LoaderDecodeTest, LoadedClassRoundTrips) {
    auto value = loads(std::string_view(R"({"color": "red",)"
                                        R"( "__class__": "Widget", "__module__": "sample_gadgets"})"),
                       {}, context);
    ASSERT_TRUE(is_ok(value)) << unwrap_err(value).to_string();

    auto text = dumps(unwrap(value), {}, context);
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), R"({"color":"red","__class__":"Widget","__module__":"sample_gadgets"})");
}

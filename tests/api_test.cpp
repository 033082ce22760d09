//! # Public API Tests
//!
//! Tests for `dumps`/`loads`/`dump`/`load`, output options, byte input,
//! stream errors, class lookup through the registry, environment
//! configuration and error rendering.

#include "codec/api.hpp"
#include "codec/builtin_codecs.hpp"
#include "codec/config.hpp"
#include "registry/manager.hpp"
#include "runtime/calendar.hpp"
#include "runtime/object.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace unijson;

class ApiTest : public ::testing::Test {
protected:
    CodecContext context;
    Rc<DefaultClassRegistry> registry = make_rc<DefaultClassRegistry>();
    ClassRef note = ClassBuilder("Note", "memo").dynamic_attributes().build();

    void SetUp() override {
        context.set_registry(registry);
        context.add_class(note);
    }

    auto sample() -> Value {
        auto n = make_rc<DynamicObject>(note, Map{{"text", Value("caf\xC3\xA9")}, {"pinned", Value(true)}});
        return Value(Map{{"b", Value(n)}, {"a", Value(1)}});
    }
};

// ============================================================================
// Text Round Trip
// ============================================================================

TEST_F(ApiTest, DumpsThenLoads) {
    auto text = dumps(sample(), {}, context);
    ASSERT_TRUE(is_ok(text));

    auto value = loads(unwrap(text), {}, context);
    ASSERT_TRUE(is_ok(value)) << unwrap_err(value).to_string();
    EXPECT_EQ(unwrap(value), sample());
}

TEST_F(ApiTest, EnsureAsciiByDefault) {
    auto text = dumps(Value("caf\xC3\xA9"), {}, context);
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), R"("caf\u00e9")");

    DumpOptions raw;
    raw.ensure_ascii = false;
    EXPECT_EQ(unwrap(dumps(Value("caf\xC3\xA9"), raw, context)), "\"caf\xC3\xA9\"");
}

TEST_F(ApiTest, IndentAndSortKeys) {
    DumpOptions options;
    options.indent = 2;
    options.sort_keys = true;

    auto text = dumps(Value(Map{{"b", Value(1)}, {"a", Value(Array{Value(2)})}}), options, context);
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "{\n  \"a\": [\n    2\n  ],\n  \"b\": 1\n}");
}

TEST_F(ApiTest, EncodingErrorsPropagate) {
    struct Mute : Object {
        [[nodiscard]] auto klass() const -> const ClassRef& override {
            static const ClassRef cls = ClassBuilder("Mute", "quiet").build();
            return cls;
        }
    };
    auto text = dumps(Value(make_rc<Mute>()), {}, context);
    ASSERT_TRUE(is_err(text));
    EXPECT_EQ(unwrap_err(text).kind, CodecErrorKind::NotSerializable);
}

// ============================================================================
// Input Forms
// ============================================================================

TEST_F(ApiTest, LoadsBytesSkipsBom) {
    std::string text = "\xEF\xBB\xBF{\"k\": [1, 2]}";
    std::vector<uint8_t> bytes(text.begin(), text.end());

    auto value = loads(std::span<const uint8_t>(bytes), {}, context);
    ASSERT_TRUE(is_ok(value)) << unwrap_err(value).to_string();
    EXPECT_EQ(unwrap(value).get("k")->size(), 2u);
}

TEST_F(ApiTest, SyntaxErrorsAreReported) {
    auto value = loads(std::string_view("{\"a\": [1, 2"), {}, context);
    ASSERT_TRUE(is_err(value));
    EXPECT_EQ(unwrap_err(value).kind, CodecErrorKind::Syntax);
}

TEST_F(ApiTest, MaxDepthIsEnforced) {
    LoadOptions options;
    options.max_depth = 2;
    EXPECT_TRUE(is_ok(loads(std::string_view("[[1]]"), options, context)));
    EXPECT_TRUE(is_err(loads(std::string_view("[[[1]]]"), options, context)));
}

// ============================================================================
// Streams
// ============================================================================

TEST_F(ApiTest, DumpAndLoadStreams) {
    std::stringstream stream;
    auto written = dump(sample(), stream, {}, context);
    ASSERT_TRUE(is_ok(written));
    EXPECT_EQ(unwrap(written), stream.str().size());

    auto value = load(stream, {}, context);
    ASSERT_TRUE(is_ok(value)) << unwrap_err(value).to_string();
    EXPECT_EQ(unwrap(value), sample());
}

TEST_F(ApiTest, BadStreamsReportIo) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    auto written = dump(Value(1), out, {}, context);
    ASSERT_TRUE(is_err(written));
    EXPECT_EQ(unwrap_err(written).kind, CodecErrorKind::Io);

    std::istringstream in("1");
    in.setstate(std::ios::badbit);
    auto value = load(in, {}, context);
    ASSERT_TRUE(is_err(value));
    EXPECT_EQ(unwrap_err(value).kind, CodecErrorKind::Io);
}

// ============================================================================
// Registration Surface
// ============================================================================

TEST_F(ApiTest, FreeFunctionsRegisterOnContext) {
    CodecRegisterOptions options;
    options.name = "note_encoder";
    auto r = register_encoder(
        note,
        [](const Object&) -> Result<Map, std::string> { return Map{{"short", Value(true)}}; },
        options, context);
    ASSERT_TRUE(is_ok(r));
    EXPECT_TRUE(context.has_encoder(note));

    auto d = register_decoder(
        note, [](const Map&) -> Result<Value, std::string> { return Value("a note"); }, {},
        context);
    ASSERT_TRUE(is_ok(d));

    auto text = unwrap(dumps(Value(make_rc<DynamicObject>(note)), {}, context));
    EXPECT_EQ(text, R"({"short":true,"__class__":"Note","__module__":"memo"})");
    EXPECT_EQ(unwrap(loads(text, {}, context)), Value("a note"));
}

TEST_F(ApiTest, RequireClassUsesRegistry) {
    registry->register_class(note);
    auto found = require_class("Note", context);
    ASSERT_TRUE(is_ok(found));
    EXPECT_EQ(unwrap(found), note);

    auto missing = require_class("Missing", context);
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, CodecErrorKind::RegistryNotFound);
    EXPECT_EQ(unwrap_err(missing).to_string(),
              "RegistryNotFound: Class 'Missing' not found in registry");
}

TEST(ApiDefaultContextTest, CarriesCalendarCodecs) {
    auto text = dumps(Value(make_rc<Date>(2020, 2, 29)));
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), R"({"date":"2020-02-29","__class__":"date","__module__":"datetime"})");

    auto value = loads(std::string_view(unwrap(text)));
    ASSERT_TRUE(is_ok(value));
    ASSERT_NE(unwrap(value).as<Date>(), nullptr);
    EXPECT_EQ(unwrap(value).as<Date>()->iso(), "2020-02-29");
}

TEST(ApiDefaultContextTest, FallsBackToManagerRegistry) {
    RegistryManager::teardown();
    auto cls = ClassBuilder("Orphan", "unloaded_module").dynamic_attributes().build();
    RegistryManager::get_class_registry()->register_class(cls);

    auto value = loads(std::string_view(R"({"__class__": "Orphan", "__module__": "unloaded_module"})"));
    ASSERT_TRUE(is_ok(value)) << unwrap_err(value).to_string();
    EXPECT_EQ(unwrap(value).as<Object>()->klass(), cls);

    RegistryManager::teardown();
}

// ============================================================================
// Configuration
// ============================================================================

TEST(CodecConfigTest, ParsesFlags) {
    EXPECT_TRUE(parse_flag("1"));
    EXPECT_TRUE(parse_flag("TRUE"));
    EXPECT_TRUE(parse_flag("on"));
    EXPECT_FALSE(parse_flag("0"));
    EXPECT_FALSE(parse_flag("yes please"));
}

TEST(CodecConfigTest, ReadsEnvironment) {
    setenv("UNIJSON_ENCODER_FALLBACK", "true", 1);
    setenv("UNIJSON_DECODER_FALLBACK", "0", 1);
    setenv("UNIJSON_MODULE_PATH", "/opt/a::/opt/b", 1);

    auto config = CodecConfig::from_env();
    EXPECT_TRUE(config.encoder_fallback_enabled);
    EXPECT_FALSE(config.decoder_fallback_enabled);
    ASSERT_EQ(config.module_search_paths.size(), 2u);
    EXPECT_EQ(config.module_search_paths[1], fs::path("/opt/b"));

    unsetenv("UNIJSON_ENCODER_FALLBACK");
    unsetenv("UNIJSON_DECODER_FALLBACK");
    unsetenv("UNIJSON_MODULE_PATH");

    auto defaults = CodecConfig::from_env();
    EXPECT_FALSE(defaults.encoder_fallback_enabled);
    EXPECT_TRUE(defaults.module_search_paths.empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST(CodecErrorTest, RendersCauses) {
    auto error = CodecError::make(CodecErrorKind::NotSerializable, "Type 'a.B' is not JSON serializable");
    error.causes.push_back("first");
    error.causes.push_back("second");
    EXPECT_EQ(error.to_string(),
              "NotSerializable: Type 'a.B' is not JSON serializable\n"
              "  caused by: first\n"
              "  caused by: second");
}

TEST(CodecErrorTest, MapsRegistryErrors) {
    auto mismatch = CodecError::from(RegistryError::inheritance_mismatch("X", "bad kind"));
    EXPECT_EQ(mismatch.kind, CodecErrorKind::RegistryInheritanceMismatch);
    EXPECT_EQ(mismatch.message, "bad kind");
}

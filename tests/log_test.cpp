//! # Logger Unit Tests
//!
//! Tests for the logging layer: LogFilter parsing, sink output, JSON
//! records, in-memory capture, CLI option parsing and thread safety.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace unijson::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = epoch_ms();
    return record;
}

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, DefaultIsWarn) {
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "decoder"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "decoder"));
}

TEST_F(LogFilterTest, ParseChannelAndDefault) {
    filter.parse("decoder=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "decoder"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "decoder"));

    // Unmatched channels use the wildcard level
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "registry"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "registry"));
}

TEST_F(LogFilterTest, BareChannelNameEnablesEverything) {
    filter.parse("loader");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "loader"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "encoder"));
}

TEST_F(LogFilterTest, ChannelOff) {
    filter.parse("encoder=off,*=trace");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "encoder"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "decoder"));
}

TEST_F(LogFilterTest, MinLevelAcrossChannels) {
    filter.parse("registry=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("WARNING"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Sinks
// ============================================================================

TEST(ConsoleSinkTest, WritesWithoutColors) {
    ConsoleSink sink(false);
    sink.write(make_record(LogLevel::Info, "test", "hello"));
    sink.set_format(LogFormat::JSON);
    sink.write(make_record(LogLevel::Warn, "test", "json record"));
    sink.flush();
}

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "unijson_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    std::string read_file() {
        std::ifstream f(temp_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesTextRecords) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "registry", "file sink test"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[registry]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonRecordsAreEscaped) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        auto record = make_record(LogLevel::Error, "decoder", "line1\nline2\t\"quote\"\\");
        record.timestamp_ms = 12345;
        sink.write(record);
    }

    std::string content = read_file();
    EXPECT_NE(content.find("{\"ts\":12345"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"decoder\""), std::string::npos);
    EXPECT_NE(content.find("\\n"), std::string::npos);
    EXPECT_NE(content.find("\\t"), std::string::npos);
    EXPECT_NE(content.find("\\\""), std::string::npos);
    EXPECT_NE(content.find("\\\\"), std::string::npos);
}

TEST(MemorySinkTest, CapturesAndMatches) {
    MemorySink sink;
    sink.write(make_record(LogLevel::Debug, "registry", "Registered 3 classes in registry"));
    sink.write(make_record(LogLevel::Warn, "decoder", "fallback taken"));

    ASSERT_EQ(sink.records().size(), 2u);
    EXPECT_EQ(sink.records()[0].module, "registry");
    EXPECT_TRUE(sink.contains(LogLevel::Debug, "registry", "3 classes"));
    EXPECT_FALSE(sink.contains(LogLevel::Warn, "registry", "3 classes"));
    EXPECT_TRUE(sink.contains(LogLevel::Warn, "decoder", "fallback"));

    sink.clear();
    EXPECT_TRUE(sink.records().empty());
}

TEST(MultiSinkTest, FansOut) {
    auto first = std::make_shared<MemorySink>();
    auto second = std::make_shared<MemorySink>();

    MultiSink multi;
    multi.add(std::make_unique<SharedSink>(first));
    multi.add(std::make_unique<SharedSink>(second));
    EXPECT_EQ(multi.size(), 2u);

    multi.write(make_record(LogLevel::Info, "encoder", "x"));
    EXPECT_EQ(first->records().size(), 1u);
    EXPECT_EQ(second->records().size(), 1u);
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.add_sink(std::make_unique<SharedSink>(sink));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    Logger::instance().set_level(LogLevel::Info);

    UNIJSON_LOG_DEBUG("registry", "hidden " << 1);
    UNIJSON_LOG_INFO("registry", "shown " << 2);
    UNIJSON_LOG_ERROR("decoder", "also shown");

    auto records = sink->records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "shown 2");
    EXPECT_EQ(records[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, FilterEnablesSingleChannel) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);
    logger.set_filter("decoder=debug");

    UNIJSON_LOG_DEBUG("decoder", "decoder debug");
    UNIJSON_LOG_DEBUG("encoder", "encoder debug");

    EXPECT_TRUE(sink->contains(LogLevel::Debug, "decoder", "decoder debug"));
    EXPECT_FALSE(sink->contains(LogLevel::Debug, "encoder", "encoder debug"));
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "test", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(sink->records().size()), num_threads * messages_per_thread);
}

// ============================================================================
// CLI Options
// ============================================================================

TEST(LogOptionsTest, ParsesFlags) {
    const char* args[] = {"prog", "--log-filter=decoder=debug", "--log-format=json",
                          "--log-file=/tmp/x.log"};
    auto config = parse_log_options(4, const_cast<char**>(args));

    EXPECT_EQ(config.filter_spec, "decoder=debug");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "/tmp/x.log");
}

TEST(LogOptionsTest, VerbosityFlags) {
    const char* vv[] = {"prog", "-vv"};
    EXPECT_EQ(parse_log_options(2, const_cast<char**>(vv)).level, LogLevel::Debug);

    const char* vvv[] = {"prog", "-vvv"};
    EXPECT_EQ(parse_log_options(2, const_cast<char**>(vvv)).level, LogLevel::Trace);

    const char* quiet[] = {"prog", "-q"};
    EXPECT_EQ(parse_log_options(2, const_cast<char**>(quiet)).level, LogLevel::Error);
}

TEST(LogOptionsTest, EnvironmentFallback) {
    setenv("UNIJSON_LOG", "registry=trace,*=warn", 1);
    const char* args[] = {"prog"};
    auto config = parse_log_options(1, const_cast<char**>(args));
    EXPECT_EQ(config.filter_spec, "registry=trace,*=warn");

    setenv("UNIJSON_LOG", "info", 1);
    EXPECT_EQ(parse_log_options(1, const_cast<char**>(args)).level, LogLevel::Info);
    unsetenv("UNIJSON_LOG");
}

//! # unijson Logging
//!
//! A structured logging library for the codec with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Channel-tagged messages for per-component filtering
//! - Multiple output sinks (Console, File, Memory, Null)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via UNIJSON_MIN_LOG_LEVEL
//! - ANSI colored console output with terminal detection
//!
//! ## Channels
//!
//! | Channel | Emitted by |
//! |---------|------------|
//! | `encoder` | Encoder fallbacks |
//! | `decoder` | Class resolution and strategy failures |
//! | `registry` | Class registration |
//! | `manager` | Registry lifecycle |
//! | `loader` | Type module loading |
//!
//! ## Usage
//!
//! ```cpp
//! UNIJSON_LOG_DEBUG("registry", "Registered new single class '" << name << "' in registry");
//! UNIJSON_LOG_WARN("encoder", "Type '" << cls << "' is not JSON serializable");
//! ```

#ifndef UNIJSON_LOG_HPP
#define UNIJSON_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace unijson::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
/// Setting a minimum level filters out all messages below that threshold.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues, fallbacks taken
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level from a string (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Channel tag (e.g., "decoder", "registry")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

// ============================================================================
// Output Format
// ============================================================================

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< Machine-parseable JSON (one object per line)
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// File sink that writes log messages to a file.
/// Auto-flushes on Error and Fatal messages.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Null sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// A record kept by `MemorySink`, owning its channel name.
struct CapturedRecord {
    LogLevel level;
    std::string module;
    std::string message;
};

/// Sink that keeps every record in memory, for tests that assert on
/// emitted diagnostics.
///
/// The sink is shared: the logger owns one reference and the caller keeps
/// another to inspect what was captured.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    /// Returns a snapshot of the captured records.
    std::vector<CapturedRecord> records() const;

    /// Returns `true` if a record on `module` at `level` contains `needle`.
    bool contains(LogLevel level, std::string_view module, std::string_view needle) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<CapturedRecord> records_;
};

/// Forwards records to a `MemorySink` the caller still holds.
class SharedSink : public LogSink {
public:
    explicit SharedSink(std::shared_ptr<LogSink> target) : target_(std::move(target)) {}

    void write(const LogRecord& record) override {
        target_->write(record);
    }
    void flush() override {
        target_->flush();
    }

private:
    std::shared_ptr<LogSink> target_;
};

/// Multi-sink that fans out log records to multiple child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    /// Add a child sink.
    void add(std::unique_ptr<LogSink> sink);

    /// Returns the number of child sinks.
    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Channel-based log level filter.
///
/// Parses filter strings like "decoder=trace,registry=debug,*=warn" and
/// provides fast `should_log(level, module)` checks.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "channel1=level,channel2=level,*=default_level"
    /// Channel names without "=level" log everything.
    void parse(std::string_view spec);

    /// Check if a message at the given level from the given channel should be logged.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Get the minimum configured level across all channels and the default.
    /// Used for the fast-path check in Logger::should_log().
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Warn;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Channel filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Manages sinks, filtering, and dispatches log records. Until `init()` is
/// called, warnings and above go to stderr.
class Logger {
public:
    /// Initialize the global logger with the given configuration.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Check if a message at the given level/channel should be logged.
    /// This is the fast-path check used by macros before constructing the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-formatted record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given channel.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Add a sink to the logger.
    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink. Records are dropped until a sink is added again.
    void clear_sinks();

    /// Set the global minimum log level.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    /// Set the channel filter from a filter specification string.
    void set_filter(std::string_view spec);

    /// Flush all sinks.
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helper
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Also checks the UNIJSON_LOG environment variable as fallback.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Define UNIJSON_MIN_LOG_LEVEL before including this header to elide
// log calls below that level at compile time.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef UNIJSON_MIN_LOG_LEVEL
#define UNIJSON_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define UNIJSON_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= UNIJSON_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::unijson::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: UNIJSON_LOG_TRACE("channel", "message " << value);
#define UNIJSON_LOG_TRACE(module, msg) UNIJSON_LOG_IMPL(::unijson::log::LogLevel::Trace, module, msg)

#define UNIJSON_LOG_DEBUG(module, msg) UNIJSON_LOG_IMPL(::unijson::log::LogLevel::Debug, module, msg)

#define UNIJSON_LOG_INFO(module, msg) UNIJSON_LOG_IMPL(::unijson::log::LogLevel::Info, module, msg)

#define UNIJSON_LOG_WARN(module, msg) UNIJSON_LOG_IMPL(::unijson::log::LogLevel::Warn, module, msg)

#define UNIJSON_LOG_ERROR(module, msg) UNIJSON_LOG_IMPL(::unijson::log::LogLevel::Error, module, msg)

#define UNIJSON_LOG_FATAL(module, msg) UNIJSON_LOG_IMPL(::unijson::log::LogLevel::Fatal, module, msg)

} // namespace unijson::log

#endif // UNIJSON_LOG_HPP

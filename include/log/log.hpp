//! # jsonfmt Logging
//!
//! A small structured logging library:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Pluggable output sinks (Console, File, Null, Multi)
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via JSONFMT_MIN_LOG_LEVEL
//!
//! ## Modules
//!
//! | Tag | Component |
//! |-----|-----------|
//! | `tokenizer` | `JsonTokenizer` |
//! | `parser` | `JsonParser` |
//! | `formatter` | `JsonFormatter` |
//! | `json` | `format_json` pipeline |
//! | `cli` | command-line front end |
//!
//! ## Usage
//!
//! ```cpp
//! JSONFMT_LOG_DEBUG("tokenizer", "Produced " << tokens.size() << " tokens");
//! JSONFMT_LOG_ERROR("cli", "Cannot read " << path);
//! ```

#ifndef JSONFMT_LOG_HPP
#define JSONFMT_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jsonfmt::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Failures reported to the user
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level (e.g. "TRACE").
auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case. Unknown names map to `LogLevel::Info`.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level = LogLevel::Info; ///< Severity level
    std::string_view module;         ///< Module tag (e.g. "parser")
    std::string message;             ///< Formatted message text
    const char* file = nullptr;      ///< Source file (__FILE__)
    int line = 0;                    ///< Source line (__LINE__)
    int64_t timestamp_ms = 0;        ///< Milliseconds since epoch
};

/// Output format for log lines.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as a text line (with trailing newline).
auto format_text_line(const LogRecord& record, bool colors = false) -> std::string;

/// Renders a record as a JSON line (with trailing newline).
auto format_json_line(const LogRecord& record) -> std::string;

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

/// Writes to a stream (stderr by default) with optional ANSI colors.
///
/// Colors are only used when requested and the stream is the terminal's
/// stderr.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    ConsoleSink(std::ostream& stream, bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto colors_enabled() const -> bool {
        return colors_enabled_;
    }

private:
    std::ostream& stream_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends log lines to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter.
///
/// Parses specs like `"tokenizer=trace,parser=debug,*=warn"`. A bare module
/// name (no `=level`) enables everything from that module; `*` sets the
/// default for unlisted modules.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level accepted by any module or by the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Until `init()` is called the logger has no sinks and drops every record.
class Logger {
public:
    /// Replaces sinks, level and filter according to `config`.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before building the message.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    /// Read without the lock by `should_log` and `level`; written under it.
    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
auto get_timestamp() -> std::string;

/// Milliseconds since epoch.
auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Builds a LogConfig from argv.
///
/// Recognizes `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=`, `-q`/`--quiet` and `-v`/`-vv`/`-vvv`/`--verbose`. Falls back
/// to the `JSONFMT_LOG` environment variable when neither a level nor a
/// filter is given. The default level is Warn.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true if `arg` is one of the options consumed by `parse_log_options`.
auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef JSONFMT_MIN_LOG_LEVEL
#define JSONFMT_MIN_LOG_LEVEL 0
#endif

/// Internal macro; use the level-specific macros below.
#define JSONFMT_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= JSONFMT_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::jsonfmt::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define JSONFMT_LOG_TRACE(module, msg) JSONFMT_LOG_IMPL(::jsonfmt::log::LogLevel::Trace, module, msg)
#define JSONFMT_LOG_DEBUG(module, msg) JSONFMT_LOG_IMPL(::jsonfmt::log::LogLevel::Debug, module, msg)
#define JSONFMT_LOG_INFO(module, msg) JSONFMT_LOG_IMPL(::jsonfmt::log::LogLevel::Info, module, msg)
#define JSONFMT_LOG_WARN(module, msg) JSONFMT_LOG_IMPL(::jsonfmt::log::LogLevel::Warn, module, msg)
#define JSONFMT_LOG_ERROR(module, msg) JSONFMT_LOG_IMPL(::jsonfmt::log::LogLevel::Error, module, msg)
#define JSONFMT_LOG_FATAL(module, msg) JSONFMT_LOG_IMPL(::jsonfmt::log::LogLevel::Fatal, module, msg)

} // namespace jsonfmt::log

#endif // JSONFMT_LOG_HPP

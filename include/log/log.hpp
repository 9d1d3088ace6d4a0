//! # PDL Logging
//!
//! Module-tagged logging for the profile toolchain:
//! - Levels Trace through Fatal, plus Off
//! - Per-module filtering (`lexer`, `parser`, `format`, `cli`)
//! - Records tagged with the profile file being processed (`SourceScope`)
//! - Console, file and null sinks, text or JSON lines
//! - Compile-time level elision via PDL_MIN_LOG_LEVEL
//!
//! Logging never changes what the tokenizer or parser returns; a parse that
//! logs nothing and a parse at `trace` produce the same result.
//!
//! ## Usage
//!
//! ```cpp
//! log::SourceScope scope(path);
//! PDL_LOG_DEBUG("parser", "parsed " << item_kind_name(item) << " at " << span.start);
//! PDL_LOG_INFO("cli", "formatting " << path);
//! ```
//!
//! ## Text Line
//!
//! ```text
//! 14:03:07.512 DEBUG [parser] component.profile: provide foo at 0..11
//! ```

#ifndef PDL_LOG_HPP
#define PDL_LOG_HPP

#include <array>
#include <atomic>
#include <chrono>
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

namespace pdl::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity, lowest first. `Off` is only meaningful as a threshold.
enum class LogLevel : int {
    Trace = 0, ///< Token-by-token tracing
    Debug = 1, ///< Per-declaration parser decisions
    Info = 2,  ///< Command progress
    Warn = 3,  ///< Recoverable oddities
    Error = 4, ///< Failures reported to the user
    Fatal = 5, ///< Unrecoverable failures
    Off = 6
};

inline constexpr std::array<const char*, 7> LEVEL_NAMES = {"TRACE", "DEBUG", "INFO", "WARN",
                                                            "ERROR", "FATAL", "OFF"};

/// Upper-case name of `level`.
inline const char* level_name(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "???";
}

/// Parses a level name, ignoring case. Unknown names yield `fallback`.
LogLevel parse_level(std::string_view name, LogLevel fallback = LogLevel::Info);

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module; ///< Module tag, e.g. "parser"
    std::string_view source; ///< Profile being processed, empty outside a SourceScope
    std::string message;
    const char* file = nullptr; ///< __FILE__ of the call site
    int line = 0;               ///< __LINE__ of the call site
    int64_t timestamp_ms = 0;   ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] source: message`
    JSON  ///< One object per line
};

/// Renders `record` as a text line (no trailing newline), using the record's
/// own timestamp.
std::string format_text(const LogRecord& record, bool colors = false);

/// Renders `record` as a JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

/// Milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Source Context
// ============================================================================

/// Tags every record logged on this thread with `source` while alive.
///
/// Scopes nest; the innermost one wins and the outer one is restored on exit.
/// `source` must outlive the scope.
class SourceScope {
public:
    explicit SourceScope(std::string_view source);
    ~SourceScope();

    SourceScope(const SourceScope&) = delete;
    SourceScope& operator=(const SourceScope&) = delete;

    /// The innermost active source on this thread, or empty.
    static std::string_view current();

private:
    std::string_view previous_;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for records. Each sink renders in its own format.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;

    void set_format(LogFormat format) {
        format_ = format;
    }

protected:
    /// Renders `record` in this sink's format, newline included.
    std::string render(const LogRecord& record, bool colors = false) const;

    LogFormat format_ = LogFormat::Text;
};

/// Writes to a stream, stderr by default. Colors are used only when the
/// stream is stderr and stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, std::ostream& out = std::cerr);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
    bool colors_enabled_;
};

/// Writes to a file. Error and Fatal records are flushed immediately.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module thresholds.
///
/// Specs look like "parser=trace, lexer=debug, *=warn". A bare module name
/// enables everything from that module; `*` sets the threshold for modules
/// not listed. Whitespace around entries is ignored.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold of any module or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter, empty for none
    std::string log_file;    ///< Path to log file, empty for none
    bool console = true;
    bool colors = true;
};

/// Process-wide logger.
///
/// Until `init()` is called there are no sinks and every record is dropped,
/// so library code can log unconditionally. The level check is lock-free;
/// the module filter and the sinks are guarded by a mutex.
class Logger {
public:
    /// Replaces the sinks, level and filter with those described by `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Sends `record` to every sink.
    void log(const LogRecord& record);

    /// Builds a record stamped with the time and the current SourceScope.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the filter's default threshold. Modules listed in the filter keep
    /// their own thresholds.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    /// Replaces the module filter. The global threshold drops to the lowest
    /// level the filter lets through.
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// CLI Parsing
// ============================================================================

/// Builds a LogConfig from argv and the PDL_LOG environment variable.
///
/// Recognized: --log-level=, --log-filter=, --log-file=, --log-format=,
/// -v/-vv/-vvv, -q. PDL_LOG is only read when argv sets neither a level nor
/// a filter.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

} // namespace pdl::log

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef PDL_MIN_LOG_LEVEL
#define PDL_MIN_LOG_LEVEL 0
#endif

#define PDL_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= PDL_MIN_LOG_LEVEL) {                                        \
            auto& pdl_logger_ = ::pdl::log::Logger::instance();                                    \
            if (pdl_logger_.should_log(level, module_str)) {                                       \
                std::ostringstream pdl_msg_;                                                       \
                pdl_msg_ << msg;                                                                   \
                pdl_logger_.log(level, module_str, pdl_msg_.str(), __FILE__, __LINE__);            \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define PDL_LOG_TRACE(module, msg) PDL_LOG_IMPL(::pdl::log::LogLevel::Trace, module, msg)
#define PDL_LOG_DEBUG(module, msg) PDL_LOG_IMPL(::pdl::log::LogLevel::Debug, module, msg)
#define PDL_LOG_INFO(module, msg) PDL_LOG_IMPL(::pdl::log::LogLevel::Info, module, msg)
#define PDL_LOG_WARN(module, msg) PDL_LOG_IMPL(::pdl::log::LogLevel::Warn, module, msg)
#define PDL_LOG_ERROR(module, msg) PDL_LOG_IMPL(::pdl::log::LogLevel::Error, module, msg)
#define PDL_LOG_FATAL(module, msg) PDL_LOG_IMPL(::pdl::log::LogLevel::Fatal, module, msg)

#endif // PDL_LOG_HPP

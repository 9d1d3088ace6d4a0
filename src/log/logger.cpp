//! # Logger Implementation
//!
//! | Piece         | Role                                              |
//! |---------------|---------------------------------------------------|
//! | `format_*`    | Render a record as a text or JSON line            |
//! | `SourceScope` | Thread-local "which profile is being processed"   |
//! | Sinks         | Console (any stream) and file output              |
//! | `LogFilter`   | Module thresholds parsed from a spec string       |
//! | `Logger`      | Level gate, filter and sink fan-out               |

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifdef _WIN32
#include <io.h>
#define PDL_ISATTY(fd) _isatty(fd)
#define PDL_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define PDL_ISATTY(fd) isatty(fd)
#define PDL_FILENO(f) fileno(f)
#endif

namespace pdl::log {

// ============================================================================
// Levels
// ============================================================================

static bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

LogLevel parse_level(std::string_view name, LogLevel fallback) {
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (equals_ignore_case(name, LEVEL_NAMES[i])) {
            return static_cast<LogLevel>(i);
        }
    }
    if (equals_ignore_case(name, "warning")) {
        return LogLevel::Warn;
    }
    return fallback;
}

// ============================================================================
// Record Formatting
// ============================================================================

static const char* level_color(LogLevel level) {
    static constexpr std::array<const char*, 7> colors = {
        "\033[90m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[1;31m", ""};
    auto index = static_cast<size_t>(level);
    return index < colors.size() ? colors[index] : "";
}

/// "HH:MM:SS.mmm" in local time.
static std::string clock_time(int64_t timestamp_ms) {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(timestamp_ms % 1000));
    return buf;
}

static void append_json_string(std::string& out, std::string_view text) {
    out += '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

std::string format_text(const LogRecord& record, bool colors) {
    std::string level = level_name(record.level);
    level.resize(5, ' ');

    std::string line = clock_time(record.timestamp_ms);
    line += ' ';
    if (colors) {
        line += level_color(record.level);
        line += level;
        line += "\033[0m";
    } else {
        line += level;
    }

    line += " [";
    line += record.module;
    line += "] ";
    if (!record.source.empty()) {
        line += record.source;
        line += ": ";
    }
    line += record.message;
    return line;
}

std::string format_json(const LogRecord& record) {
    std::string line = "{\"ts\":" + std::to_string(record.timestamp_ms);
    line += ",\"level\":\"";
    line += level_name(record.level);
    line += "\",\"module\":";
    append_json_string(line, record.module);
    if (!record.source.empty()) {
        line += ",\"source\":";
        append_json_string(line, record.source);
    }
    line += ",\"msg\":";
    append_json_string(line, record.message);
    line += '}';
    return line;
}

// ============================================================================
// SourceScope
// ============================================================================

static thread_local std::string_view current_source;

SourceScope::SourceScope(std::string_view source) : previous_(current_source) {
    current_source = source;
}

SourceScope::~SourceScope() {
    current_source = previous_;
}

std::string_view SourceScope::current() {
    return current_source;
}

// ============================================================================
// Sinks
// ============================================================================

std::string LogSink::render(const LogRecord& record, bool colors) const {
    std::string line =
        format_ == LogFormat::JSON ? format_json(record) : format_text(record, colors);
    line += '\n';
    return line;
}

static bool stderr_supports_colors() {
    if (!PDL_ISATTY(PDL_FILENO(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

ConsoleSink::ConsoleSink(bool use_colors, std::ostream& out)
    : out_(out), colors_enabled_(use_colors && &out == &std::cerr && stderr_supports_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    // One insertion per record so concurrent writers never interleave a line
    out_ << render(record, colors_enabled_ && format_ == LogFormat::Text);
}

void ConsoleSink::flush() {
    out_.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, std::ios::out | (append ? std::ios::app : std::ios::trunc)) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << render(record);
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

static std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        auto eq = entry.find('=');
        auto module = trim(entry.substr(0, eq));
        auto level = eq == std::string_view::npos ? LogLevel::Trace
                                                  : parse_level(trim(entry.substr(eq + 1)));
        if (module == "*") {
            default_level_ = level;
        } else if (!module.empty()) {
            module_levels_[std::string(module)] = level;
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    LogLevel threshold = it != module_levels_.end() ? it->second : default_level_;
    return level >= threshold;
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& entry : module_levels_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    // A filter without "*=level" keeps the configured level as its default
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    logger.filter_.parse(config.filter_spec);
    logger.level_.store(logger.filter_.min_level(), std::memory_order_relaxed);

    logger.sinks_.clear();
    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (!file->is_open()) {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
            return;
        }
        file->set_format(config.format);
        logger.sinks_.push_back(std::move(file));
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{.level = level,
                  .module = module,
                  .source = SourceScope::current(),
                  .message = message,
                  .file = file,
                  .line = line,
                  .timestamp_ms = epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    // Modules listed in the filter keep their own, possibly lower, thresholds
    level_.store(filter_.min_level(), std::memory_order_relaxed);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_.store(filter_.min_level(), std::memory_order_relaxed);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace pdl::log

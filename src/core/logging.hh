#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace qx {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6,
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view log_level_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        case LogLevel::OFF:   return "";
    }
    return "";
}

// Parses "trace", "debug", "info", "warn", "error", "fatal", "off" (any case)
[[nodiscard]] bool parse_log_level(std::string_view name, LogLevel& out);

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level = LogLevel::INFO;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;
    std::string component;
    std::string message;
    std::string file;
    std::uint32_t line = 0;
    std::string function;
};

struct FormatOptions {
    bool colors = false;
    bool thread_id = true;
    bool source_location = false;
};

// "2024-01-31 12:00:00.123 [tid] [ INFO] [component] message (file:line)"
[[nodiscard]] std::string format_log_entry(const LogEntry& entry, const FormatOptions& opts);

// ============================================================================
// Log Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogEntry& entry) override;
    void flush() override;

    void set_use_colors(bool use_colors) { opts_.colors = use_colors; }
    void set_show_thread_id(bool show) { opts_.thread_id = show; }
    void set_show_source_location(bool show) { opts_.source_location = show; }

private:
    FormatOptions opts_;
    std::mutex mutex_;
};

// Appends to a file, rolling over to name.1 .. name.N once max size is hit
class FileSink : public LogSink {
public:
    explicit FileSink(std::string filename);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const LogEntry& entry) override;
    void flush() override;

    [[nodiscard]] bool is_open() const;

    void set_max_file_size(std::size_t bytes) { max_file_size_ = bytes; }
    void set_max_files(std::size_t count) { max_files_ = count; }

private:
    std::string filename_;
    std::FILE* file_ = nullptr;
    std::size_t current_size_ = 0;
    std::size_t max_file_size_ = 50 * 1024 * 1024;
    std::size_t max_files_ = 3;
    mutable std::mutex mutex_;

    void roll_over();
};

// Keeps entries in memory; used by tests and diagnostics endpoints
class MemorySink : public LogSink {
public:
    explicit MemorySink(std::size_t capacity = 1000);

    void write(const LogEntry& entry) override;
    void flush() override {}

    [[nodiscard]] std::vector<LogEntry> entries() const;
    [[nodiscard]] bool contains(std::string_view needle) const;
    void clear();

private:
    std::size_t capacity_;
    std::vector<LogEntry> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void set_component_level(const std::string& component, LogLevel level);
    void clear_component_levels();

    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);
    void clear_sinks();

    // Component levels win over the global level; "rendezvous" covers "rendezvous.sweeper"
    [[nodiscard]] bool is_enabled(LogLevel level, const std::string& component = "") const;

    void log(LogLevel level,
             std::string_view component,
             std::string_view message,
             const std::source_location& loc = std::source_location::current());

    void flush();

    [[nodiscard]] LogLevel level() const { return level_.load(); }

private:
    Logger();
    ~Logger();

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::unordered_map<std::string, LogLevel> component_levels_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Log Stream Helper
// ============================================================================

class LogStream {
public:
    LogStream(LogLevel level,
              std::string_view component,
              const std::source_location& loc);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&) = default;
    LogStream& operator=(LogStream&&) = default;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::source_location loc_;
    std::ostringstream stream_;
    bool enabled_;
};

// ============================================================================
// Component Logger
// ============================================================================

class ComponentLogger {
public:
    explicit ComponentLogger(std::string component);

    [[nodiscard]] const std::string& component() const { return component_; }

    [[nodiscard]] bool is_trace_enabled() const;
    [[nodiscard]] bool is_debug_enabled() const;
    [[nodiscard]] bool is_info_enabled() const;

    LogStream trace(const std::source_location& loc = std::source_location::current()) const;
    LogStream debug(const std::source_location& loc = std::source_location::current()) const;
    LogStream info(const std::source_location& loc = std::source_location::current()) const;
    LogStream warn(const std::source_location& loc = std::source_location::current()) const;
    LogStream error(const std::source_location& loc = std::source_location::current()) const;

    void info(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void warn(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void error(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;

private:
    std::string component_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define QX_LOG_TRACE(logger) \
    if ((logger).is_trace_enabled()) (logger).trace()

#define QX_LOG_DEBUG(logger) \
    if ((logger).is_debug_enabled()) (logger).debug()

#define QX_LOG_INFO(logger) \
    if ((logger).is_info_enabled()) (logger).info()

#define QX_LOG_WARN(logger) (logger).warn()

#define QX_LOG_ERROR(logger) (logger).error()

// ============================================================================
// Component Loggers
// ============================================================================

namespace log {

inline ComponentLogger core("core");
inline ComponentLogger crypto("crypto");
inline ComponentLogger chunker("chunker");
inline ComponentLogger rendezvous("rendezvous");
inline ComponentLogger sweeper("rendezvous.sweeper");
inline ComponentLogger service("rendezvous.service");
inline ComponentLogger fec("fec");

}  // namespace log

// ============================================================================
// Initialization
// ============================================================================

struct LogConfig {
    LogLevel default_level = LogLevel::INFO;
    bool console_enabled = true;
    bool console_colors = true;
    bool console_thread_id = false;
    bool console_source_location = false;
    bool file_enabled = false;
    std::string file_path = "quantarax.log";
    std::size_t file_max_size = 50 * 1024 * 1024;
    std::size_t file_max_count = 3;
    std::unordered_map<std::string, LogLevel> component_levels;
};

void init_logging(const LogConfig& config = LogConfig{});
void shutdown_logging();

}  // namespace qx

#include "logging.hh"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace qx {

// ============================================================================
// Level Parsing
// ============================================================================

bool parse_log_level(std::string_view name, LogLevel& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<std::string_view, LogLevel> table[] = {
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN}, {"error", LogLevel::ERROR},
        {"fatal", LogLevel::FATAL}, {"off", LogLevel::OFF},
    };
    for (const auto& [key, level] : table) {
        if (lower == key) {
            out = level;
            return true;
        }
    }
    return false;
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_log_entry(const LogEntry& entry, const FormatOptions& opts) {
    std::ostringstream oss;

    auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << std::setfill(' ');

    if (opts.thread_id) {
        oss << " [" << entry.thread_id << "]";
    }

    oss << ' ';
    if (opts.colors) {
        oss << log_level_color(entry.level);
    }
    oss << '[' << std::setw(5) << log_level_name(entry.level) << ']';
    if (opts.colors) {
        oss << "\033[0m";
    }

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }

    oss << ' ' << entry.message;

    if (opts.source_location && !entry.file.empty()) {
        oss << " (" << std::filesystem::path(entry.file).filename().string()
            << ':' << entry.line << ')';
    }

    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) {
    opts_.colors = use_colors;
}

void ConsoleSink::write(const LogEntry& entry) {
    std::string line = format_log_entry(entry, opts_);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(std::string filename)
    : filename_(std::move(filename)) {
    file_ = std::fopen(filename_.c_str(), "a");
    if (file_) {
        std::fseek(file_, 0, SEEK_END);
        long pos = std::ftell(file_);
        current_size_ = pos > 0 ? static_cast<std::size_t>(pos) : 0;
    }
}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

bool FileSink::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_ != nullptr;
}

void FileSink::write(const LogEntry& entry) {
    FormatOptions opts;
    opts.source_location = true;
    std::string line = format_log_entry(entry, opts);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_) {
        return;
    }
    if (current_size_ + line.size() > max_file_size_ && current_size_ > 0) {
        roll_over();
        if (!file_) {
            return;
        }
    }
    std::fwrite(line.data(), 1, line.size(), file_);
    current_size_ += line.size();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fflush(file_);
    }
}

void FileSink::roll_over() {
    namespace fs = std::filesystem;

    std::fclose(file_);
    file_ = nullptr;

    std::error_code ec;
    if (max_files_ > 0) {
        fs::remove(filename_ + "." + std::to_string(max_files_), ec);
        for (std::size_t i = max_files_ - 1; i >= 1; --i) {
            fs::path src = filename_ + "." + std::to_string(i);
            if (fs::exists(src, ec)) {
                fs::rename(src, filename_ + "." + std::to_string(i + 1), ec);
            }
        }
        fs::rename(filename_, filename_ + ".1", ec);
    } else {
        fs::remove(filename_, ec);
    }

    file_ = std::fopen(filename_.c_str(), "w");
    current_size_ = 0;
}

// ============================================================================
// MemorySink
// ============================================================================

MemorySink::MemorySink(std::size_t capacity)
    : capacity_(capacity) {}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        return;
    }
    if (entries_.size() >= capacity_) {
        entries_.erase(entries_.begin());
    }
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool MemorySink::contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [&](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>(true));
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_component_level(const std::string& component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_[component] = level;
}

void Logger::clear_component_levels() {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_.clear();
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level, const std::string& component) const {
    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!component_levels_.empty()) {
            std::string name = component;
            while (true) {
                auto it = component_levels_.find(name);
                if (it != component_levels_.end()) {
                    return level >= it->second;
                }
                auto pos = name.rfind('.');
                if (pos == std::string::npos) {
                    break;
                }
                name.resize(pos);
            }
        }
    }

    return level >= level_.load();
}

void Logger::log(LogLevel level,
                 std::string_view component,
                 std::string_view message,
                 const std::source_location& loc) {
    if (level == LogLevel::OFF || !is_enabled(level, std::string(component))) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = std::string(component);
    entry.message = std::string(message);
    entry.file = loc.file_name();
    entry.line = loc.line();
    entry.function = loc.function_name();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level,
                     std::string_view component,
                     const std::source_location& loc)
    : level_(level)
    , component_(component)
    , loc_(loc)
    , enabled_(Logger::instance().is_enabled(level, component_)) {}

LogStream::~LogStream() {
    if (enabled_) {
        std::string msg = stream_.str();
        if (!msg.empty()) {
            Logger::instance().log(level_, component_, msg, loc_);
        }
    }
}

// ============================================================================
// ComponentLogger
// ============================================================================

ComponentLogger::ComponentLogger(std::string component)
    : component_(std::move(component)) {}

bool ComponentLogger::is_trace_enabled() const {
    return Logger::instance().is_enabled(LogLevel::TRACE, component_);
}

bool ComponentLogger::is_debug_enabled() const {
    return Logger::instance().is_enabled(LogLevel::DEBUG, component_);
}

bool ComponentLogger::is_info_enabled() const {
    return Logger::instance().is_enabled(LogLevel::INFO, component_);
}

LogStream ComponentLogger::trace(const std::source_location& loc) const {
    return LogStream(LogLevel::TRACE, component_, loc);
}

LogStream ComponentLogger::debug(const std::source_location& loc) const {
    return LogStream(LogLevel::DEBUG, component_, loc);
}

LogStream ComponentLogger::info(const std::source_location& loc) const {
    return LogStream(LogLevel::INFO, component_, loc);
}

LogStream ComponentLogger::warn(const std::source_location& loc) const {
    return LogStream(LogLevel::WARN, component_, loc);
}

LogStream ComponentLogger::error(const std::source_location& loc) const {
    return LogStream(LogLevel::ERROR, component_, loc);
}

void ComponentLogger::info(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::INFO, component_, msg, loc);
}

void ComponentLogger::warn(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::WARN, component_, msg, loc);
}

void ComponentLogger::error(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::ERROR, component_, msg, loc);
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(const LogConfig& config) {
    Logger& logger = Logger::instance();
    logger.clear_sinks();
    logger.clear_component_levels();
    logger.set_level(config.default_level);

    for (const auto& [component, level] : config.component_levels) {
        logger.set_component_level(component, level);
    }

    if (config.console_enabled) {
        auto console = std::make_shared<ConsoleSink>(config.console_colors);
        console->set_show_thread_id(config.console_thread_id);
        console->set_show_source_location(config.console_source_location);
        logger.add_sink(console);
    }

    if (config.file_enabled) {
        auto file = std::make_shared<FileSink>(config.file_path);
        file->set_max_file_size(config.file_max_size);
        file->set_max_files(config.file_max_count);
        if (!file->is_open()) {
            log::core.warn() << "Cannot open log file " << config.file_path;
        } else {
            logger.add_sink(file);
        }
    }

    log::core.info("Logging initialized");
}

void shutdown_logging() {
    log::core.info("Logging shutting down");
    Logger::instance().flush();
}

}  // namespace qx

// logging.h - Leveled, categorised logging for dlsaudit
// Console (stderr), optional log file, and callbacks. stdout carries report
// lines only and is never written here.
#ifndef DLS_LOGGING_H
#define DLS_LOGGING_H

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <functional>
#include <cstdint>

namespace dls {
namespace logging {

// =============================================================================
// Log Levels
// =============================================================================

enum class Level {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

inline const char* level_to_string(Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::FATAL: return "FATAL";
        default:           return "UNKNOWN";
    }
}

inline bool level_from_string(const std::string& s, Level& out) {
    if (s == "trace") { out = Level::TRACE; return true; }
    if (s == "debug") { out = Level::DEBUG; return true; }
    if (s == "info")  { out = Level::INFO;  return true; }
    if (s == "warn")  { out = Level::WARN;  return true; }
    if (s == "error") { out = Level::ERROR; return true; }
    if (s == "fatal") { out = Level::FATAL; return true; }
    if (s == "off")   { out = Level::OFF;   return true; }
    return false;
}

inline const char* level_to_color(Level level) {
    switch (level) {
        case Level::TRACE: return "\033[0;37m"; // White
        case Level::DEBUG: return "\033[0;36m"; // Cyan
        case Level::INFO:  return "\033[0;32m"; // Green
        case Level::WARN:  return "\033[0;33m"; // Yellow
        case Level::ERROR: return "\033[0;31m"; // Red
        case Level::FATAL: return "\033[1;31m"; // Bold Red
        default:           return "\033[0m";
    }
}

// =============================================================================
// Log Categories (for filtering)
// =============================================================================

enum class Category : uint32_t {
    NONE     = 0,
    SCAN     = (1 << 0),
    REPAIR   = (1 << 1),
    SIZEINFO = (1 << 2),
    FILTER   = (1 << 3),
    CONFIG   = (1 << 4)
};

inline const char* category_to_string(Category cat) {
    switch (cat) {
        case Category::SCAN:     return "scan";
        case Category::REPAIR:   return "repair";
        case Category::SIZEINFO: return "sizeinfo";
        case Category::FILTER:   return "filter";
        case Category::CONFIG:   return "config";
        default:                 return "unknown";
    }
}

// =============================================================================
// Log Entry
// =============================================================================

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    Level level;
    Category category;
    std::string message;

    std::string format(bool with_timestamp) const {
        std::ostringstream ss;

        if (with_timestamp) {
            auto time_t = std::chrono::system_clock::to_time_t(timestamp);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()) % 1000;
            ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(3) << ms.count() << " ";
        }

        ss << "[" << level_to_string(level) << "]";
        if (category != Category::NONE) {
            ss << " [" << category_to_string(category) << "]";
        }
        ss << " " << message;
        return ss.str();
    }

    std::string format_colored(bool with_timestamp) const {
        std::ostringstream ss;
        const char* color = level_to_color(level);
        const char* reset = "\033[0m";

        if (with_timestamp) {
            auto time_t = std::chrono::system_clock::to_time_t(timestamp);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()) % 1000;
            ss << "\033[2m";
            ss << std::put_time(std::localtime(&time_t), "%H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(3) << ms.count();
            ss << reset << " ";
        }

        ss << color << "[" << level_to_string(level) << "]" << reset;
        if (category != Category::NONE) {
            ss << " \033[0;36m[" << category_to_string(category) << "]\033[0m";
        }
        ss << " " << message;
        return ss.str();
    }

    std::string format_json() const {
        std::ostringstream ss;

        auto time_t = std::chrono::system_clock::to_time_t(timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()) % 1000;

        ss << "{";
        ss << "\"timestamp\":\"";
        ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\"";
        ss << ",\"level\":\"" << level_to_string(level) << "\"";
        if (category != Category::NONE) {
            ss << ",\"category\":\"" << category_to_string(category) << "\"";
        }
        ss << ",\"message\":\"" << escape_json(message) << "\"";
        ss << "}";
        return ss.str();
    }

private:
    static std::string escape_json(const std::string& s) {
        std::string result;
        result.reserve(s.length());
        for (char c : s) {
            switch (c) {
                case '"':  result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default:   result += c; break;
            }
        }
        return result;
    }
};

// =============================================================================
// Logger
// =============================================================================

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Configuration
    void set_level(Level level) { min_level_ = level; }
    Level get_level() const { return min_level_; }

    void set_console_output(bool enable) { console_output_ = enable; }
    void set_json_format(bool enable) { json_format_ = enable; }
    void set_color_output(bool enable) { color_output_ = enable; }
    void set_timestamps(bool enable) { timestamps_ = enable; }

    // File output
    bool open_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(path, std::ios::app);
        return log_file_.is_open();
    }

    void close_log_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    // Main logging function
    void log(Level level, Category category, const std::string& message) {
        if (level < min_level_) return;

        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = level;
        entry.category = category;
        entry.message = message;

        std::lock_guard<std::mutex> lock(mutex_);

        if (console_output_) {
            if (color_output_) {
                std::cerr << entry.format_colored(timestamps_) << std::endl;
            } else {
                std::cerr << entry.format(timestamps_) << std::endl;
            }
        }

        if (log_file_.is_open()) {
            if (json_format_) {
                log_file_ << entry.format_json() << std::endl;
            } else {
                log_file_ << entry.format(true) << std::endl;
            }
        }

        for (const auto& callback : callbacks_) {
            callback(entry);
        }
    }

    void add_callback(std::function<void(const LogEntry&)> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.push_back(callback);
    }

    void clear_callbacks() {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.clear();
    }

private:
    Logger()
        : min_level_(Level::INFO)
        , console_output_(true)
        , json_format_(false)
        , color_output_(false)
        , timestamps_(false) {}

    ~Logger() {
        close_log_file();
    }

    Level min_level_;
    bool console_output_;
    bool json_format_;
    bool color_output_;
    bool timestamps_;

    std::ofstream log_file_;
    std::vector<std::function<void(const LogEntry&)>> callbacks_;
    std::mutex mutex_;
};

// =============================================================================
// Logging Macros
// =============================================================================

#define DLS_LOG_CAT(level, cat, ...) \
    dls::logging::Logger::instance().log(level, cat, __VA_ARGS__)

#define LOG_SCAN(level, ...)     DLS_LOG_CAT(level, dls::logging::Category::SCAN, __VA_ARGS__)
#define LOG_REPAIR(level, ...)   DLS_LOG_CAT(level, dls::logging::Category::REPAIR, __VA_ARGS__)
#define LOG_SIZEINFO(level, ...) DLS_LOG_CAT(level, dls::logging::Category::SIZEINFO, __VA_ARGS__)
#define LOG_FILTER(level, ...)   DLS_LOG_CAT(level, dls::logging::Category::FILTER, __VA_ARGS__)
#define LOG_CONFIG(level, ...)   DLS_LOG_CAT(level, dls::logging::Category::CONFIG, __VA_ARGS__)

} // namespace logging

// Plain string helper for call sites that build their message inline
inline void log_warn(const std::string& msg) {
    logging::Logger::instance().log(logging::Level::WARN, logging::Category::NONE, msg);
}

} // namespace dls

#endif // DLS_LOGGING_H

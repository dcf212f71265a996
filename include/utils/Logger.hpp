#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace ivsurf::utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERR,
    OFF
};

inline const char* level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERR: return "ERROR";
        default: return "OFF";
    }
}

struct LoggerConfig {
    LogLevel min_level = LogLevel::INFO;
    bool include_timestamp = true;
    bool include_level = true;
};

// Process-wide, thread-safe console logger. Messages are written whole under
// a lock so lines from pool workers never interleave.
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void initialize(const LoggerConfig& config) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
        min_level_.store(config.min_level, std::memory_order_relaxed);
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel min_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool enabled(LogLevel level) const noexcept {
        return level != LogLevel::OFF && level >= min_level();
    }

    // Redirects output, mainly so tests can capture it. The stream must
    // outlive every later log call.
    void set_sink(std::ostream& sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = &sink;
    }

    void log(LogLevel level, const std::string& component, const std::string& message) {
        if (!enabled(level)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream line;
        if (config_.include_timestamp) {
            line << format_timestamp() << ' ';
        }
        if (config_.include_level) {
            line << '[' << level_to_string(level) << "] ";
        }
        if (!component.empty()) {
            line << component << ": ";
        }
        line << message << '\n';
        (*sink_) << line.str();
        sink_->flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static std::string format_timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream os;
        os << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
        return os.str();
    }

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::ostream* sink_ = &std::clog;
};

}

#define IVSURF_LOG(level, component, message)                                         \
    do {                                                                              \
        if (::ivsurf::utils::Logger::instance().enabled(level)) {                     \
            std::ostringstream ivsurf_log_os_;                                        \
            ivsurf_log_os_ << message;                                                \
            ::ivsurf::utils::Logger::instance().log(level, component, ivsurf_log_os_.str()); \
        }                                                                             \
    } while (0)

#define IVSURF_LOG_TRACE(component, message) IVSURF_LOG(::ivsurf::utils::LogLevel::TRACE, component, message)
#define IVSURF_LOG_DEBUG(component, message) IVSURF_LOG(::ivsurf::utils::LogLevel::DEBUG, component, message)
#define IVSURF_LOG_INFO(component, message) IVSURF_LOG(::ivsurf::utils::LogLevel::INFO, component, message)
#define IVSURF_LOG_WARN(component, message) IVSURF_LOG(::ivsurf::utils::LogLevel::WARNING, component, message)
#define IVSURF_LOG_ERROR(component, message) IVSURF_LOG(::ivsurf::utils::LogLevel::ERR, component, message)

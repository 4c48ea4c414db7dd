#pragma once

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace geocell {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// Four-letter tag printed in each record
constexpr const char* level_tag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "EROR";
        case LogLevel::FATAL: return "FATL";
    }
    return "UNKN";
}

/**
 * Process-wide logger
 *
 * Records look like
 *   [2026-10-19 14:03:07.412] DEBG adjacency.cpp:88 adjacent_unchecked() - carry N ...
 * and go to std::clog unless redirected with set_log_output().
 * FATAL records abort the process after flushing.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= level_;
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        std::ostringstream record;
        record << '[' << timestamp() << "] " << level_tag(level) << ' '
               << basename(file) << ':' << line << ' ' << func << "() - ";
        (record << ... << std::forward<Args>(args));

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        *output_ << record.str() << '\n';

        if (level == LogLevel::FATAL) {
            output_->flush();
            std::abort();
        }
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::clog) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* basename(const char* path) noexcept {
        const char* slash = std::strrchr(path, '/');
        if (!slash) slash = std::strrchr(path, '\\');
        return slash ? slash + 1 : path;
    }

    // Local time with milliseconds
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&secs, &local);

        std::ostringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

// Arguments are only evaluated when the level is enabled
#define GEOCELL_LOG_AT(lvl, ...)                                                        \
    do {                                                                               \
        geocell::Logger& geocell_logger_ = geocell::Logger::getInstance();             \
        if (geocell_logger_.enabled(lvl)) {                                            \
            geocell_logger_.log(lvl, __FILE__, __LINE__, __func__, __VA_ARGS__);       \
        }                                                                              \
    } while (0)

#define LOG_DEBUG(...) GEOCELL_LOG_AT(geocell::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  GEOCELL_LOG_AT(geocell::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WARN(...)  GEOCELL_LOG_AT(geocell::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERROR(...) GEOCELL_LOG_AT(geocell::LogLevel::ERROR, __VA_ARGS__)
#define LOG_FATAL(...) GEOCELL_LOG_AT(geocell::LogLevel::FATAL, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// "debug", "info", "warn", "error" or "fatal"; anything else gives fallback
inline LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    static const std::pair<const char*, LogLevel> names[] = {
        {"debug", LogLevel::DEBUG}, {"info", LogLevel::INFO}, {"warn", LogLevel::WARN},
        {"error", LogLevel::ERROR}, {"fatal", LogLevel::FATAL},
    };
    for (const auto& [text, level] : names) {
        if (name == text) return level;
    }
    return fallback;
}

} // namespace geocell

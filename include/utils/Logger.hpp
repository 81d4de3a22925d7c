#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

namespace Memopair {
namespace Utils {

/**
 * @brief Process-wide logger writing timestamped lines to stderr and,
 *        optionally, to a log file.
 *
 * Safe to call from OpenMP worker threads; each line is written under a lock.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const { return current_level_; }

    /**
     * @brief Mirrors all log lines (without colors) to a file, appending.
     * @throws std::runtime_error if the file cannot be opened.
     */
    void set_log_file(const std::string& filename);

    void set_color(bool enabled);

    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    bool color_ = true;
    std::ofstream log_file_;
    std::mutex mutex_;

    static const char* level_to_string(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief RAII helper that logs the start and duration of a phase.
 */
class ScopedLogger {
public:
    explicit ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace Memopair

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) Memopair::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) Memopair::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) Memopair::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) Memopair::Utils::Logger::error(msg, __FILE__, __LINE__)

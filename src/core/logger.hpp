#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <fstream>
#include <chrono>
#include <mutex>

namespace ibarrow::core {

/**
 * @brief Log levels
 */
enum class LogLevel {
    TRACE,   // Every ODBC call and batch hand-off
    DEBUG,   // Branch decisions, buffer sizing
    INFO,    // Connection and query lifecycle
    WARN,    // Truncation, ignored session attributes
    ERROR,   // Classified failures
    FATAL
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Each line carries the stage tag of the thread that wrote it, so the
 * fetch and encode halves of a query pipeline can be told apart.
 *
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("ibarrow.log");
 *   Logger::set_thread_tag("fetch");
 *
 *   LOG_INFO("Connected");
 *   LOG_IF(truncated, "Column value truncated");
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const noexcept { return min_level_; }

    /**
     * @brief Set output file (empty for console only)
     */
    void set_output(std::string_view filename);

    void set_console_enabled(bool enabled);

    /**
     * @brief Label the calling thread's log lines (e.g. "fetch", "encode")
     */
    static void set_thread_tag(std::string_view tag);
    static const std::string& thread_tag();

    bool enabled(LogLevel level) const noexcept { return level >= min_level_; }

    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log a conditional branch decision at DEBUG level
     */
    void log_branch(bool condition, std::string_view file, int line,
                    std::string_view function,
                    std::string_view true_msg,
                    std::string_view false_msg = "");

    static bool parse_level(std::string_view name, LogLevel& out);

private:
    Logger();
    ~Logger();

    LogLevel min_level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    std::mutex mutex_;

    static const char* level_to_string(LogLevel level);
    static std::string timestamp();
};

} // namespace ibarrow::core

#define LOG_TRACE(msg) \
    ibarrow::core::Logger::instance().log( \
        ibarrow::core::LogLevel::TRACE, __FILE__, __LINE__, __func__, msg)

#define LOG_DEBUG(msg) \
    ibarrow::core::Logger::instance().log( \
        ibarrow::core::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    ibarrow::core::Logger::instance().log( \
        ibarrow::core::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARN(msg) \
    ibarrow::core::Logger::instance().log( \
        ibarrow::core::LogLevel::WARN, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    ibarrow::core::Logger::instance().log( \
        ibarrow::core::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    ibarrow::core::Logger::instance().log( \
        ibarrow::core::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

#define LOG_IF(condition, true_msg, ...) \
    ibarrow::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <ctime>

namespace ibarrow::core {

namespace {

thread_local std::string t_thread_tag = "main";

} // anonymous namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::set_output(std::string_view filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }

    if (!filename.empty()) {
        file_stream_.open(std::string(filename), std::ios::app);
    }
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::set_thread_tag(std::string_view tag) {
    t_thread_tag.assign(tag.data(), tag.size());
}

const std::string& Logger::thread_tag() {
    return t_thread_tag;
}

void Logger::log(LogLevel level, std::string_view file, int line,
                 std::string_view function, std::string_view message) {
    if (level < min_level_) {
        return;
    }

    // Strip directories, the build tree path is noise in every line
    auto slash = file.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        file.remove_prefix(slash + 1);
    }

    // Format: [TIMESTAMP] [LEVEL] [tag] [file:line] [function] message
    std::ostringstream oss;
    oss << "[" << timestamp() << "] "
        << "[" << std::setw(5) << level_to_string(level) << "] "
        << "[" << t_thread_tag << "] "
        << "[" << file << ":" << line << "] "
        << "[" << function << "] "
        << message;

    std::string formatted = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);

    if (console_enabled_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::clog << formatted << std::endl;
        }
    }

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::endl;
        file_stream_.flush();
    }
}

void Logger::log_branch(bool condition, std::string_view file, int line,
                        std::string_view function,
                        std::string_view true_msg,
                        std::string_view false_msg) {
    if (LogLevel::DEBUG < min_level_) {
        return;
    }

    std::ostringstream oss;
    oss << "BRANCH: " << (condition ? "TRUE" : "FALSE") << " - ";

    if (condition) {
        oss << true_msg;
    } else if (!false_msg.empty()) {
        oss << false_msg;
    } else {
        oss << "condition false";
    }

    log(LogLevel::DEBUG, file, line, function, oss.str());
}

bool Logger::parse_level(std::string_view name, LogLevel& out) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") { out = LogLevel::TRACE; return true; }
    if (upper == "DEBUG") { out = LogLevel::DEBUG; return true; }
    if (upper == "INFO")  { out = LogLevel::INFO;  return true; }
    if (upper == "WARN" || upper == "WARNING") { out = LogLevel::WARN; return true; }
    if (upper == "ERROR") { out = LogLevel::ERROR; return true; }
    if (upper == "FATAL") { out = LogLevel::FATAL; return true; }
    return false;
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t_now);
#else
    localtime_r(&time_t_now, &local_tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace ibarrow::core

#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <thread>

namespace rpc_snoop {
namespace utils {

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool parse_log_level(const std::string& str, LogLevel* level) {
    std::string upper(str);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") { *level = LogLevel::DEBUG; return true; }
    if (upper == "INFO")  { *level = LogLevel::INFO;  return true; }
    if (upper == "WARN" || upper == "WARNING") { *level = LogLevel::WARN; return true; }
    if (upper == "ERROR") { *level = LogLevel::ERROR; return true; }
    return false;
}

Logger::Logger()
    : level_(LogLevel::WARN)
    , console_enabled_(true)
    , format_("[%time] [%level] [%module] %message")
{
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

int Logger::init(LogLevel level, const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;

    if (file_.is_open()) {
        file_.close();
    }

    if (!file.empty()) {
        file_.open(file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            return -1;  // 打开文件失败
        }
    }

    return 0;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::set_format(const std::string& format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

bool Logger::is_level_enabled(LogLevel level) const {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_.load());
}

void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
    if (!is_level_enabled(level)) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    logv(level, module, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* module, const char* fmt, va_list args) {
    char buffer[4096];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::lock_guard<std::mutex> lock(mutex_);
    format_and_write(level, module, buffer);
}

void Logger::format_and_write(LogLevel level, const char* module, const char* message) {
    std::string result = format_;

    std::string time_str = format_current_time("%Y-%m-%d %H:%M:%S");
    std::string level_str = log_level_to_string(level);
    std::string module_str = module ? module : "unknown";

    size_t pos;

    // %time
    pos = result.find("%time");
    if (pos != std::string::npos) {
        result.replace(pos, 5, time_str);
    }

    // %level
    pos = result.find("%level");
    if (pos != std::string::npos) {
        result.replace(pos, 6, level_str);
    }

    // %module
    pos = result.find("%module");
    if (pos != std::string::npos) {
        result.replace(pos, 7, module_str);
    }

    // %thread
    pos = result.find("%thread");
    if (pos != std::string::npos) {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        result.replace(pos, 7, oss.str());
    }

    // %message（最后替换，避免消息内容中的占位符被二次展开）
    pos = result.find("%message");
    if (pos != std::string::npos) {
        result.replace(pos, 8, message);
    }

    result += "\n";

    if (console_enabled_) {
        if (level >= LogLevel::WARN) {
            std::cerr << result;
        } else {
            std::cout << result;
        }
    }

    if (file_.is_open()) {
        file_ << result;
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cout.flush();
    std::cerr.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace utils
} // namespace rpc_snoop

#include "utils/time.hpp"
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace rpc_snoop {
namespace utils {

namespace {

std::tm to_local_tm(std::time_t time) {
    std::tm tm;
    localtime_r(&time, &tm);
    return tm;
}

} // anonymous namespace

uint64_t get_current_time_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

uint64_t get_monotonic_time_ms() {
    auto now = std::chrono::steady_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string format_current_time(const char* format) {
    std::time_t time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = to_local_tm(time);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string format_time_millis(uint64_t timestamp_ms) {
    std::time_t time = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm = to_local_tm(time);

    // %e 以空格补齐日期，与 syslog 风格一致
    char millis[8];
    std::snprintf(millis, sizeof(millis), ".%03u",
                  static_cast<unsigned>(timestamp_ms % 1000));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%b %e %H:%M:%S") << millis
        << std::put_time(&tm, " %Y");
    return oss.str();
}

DefaultTimeSource& DefaultTimeSource::instance() {
    static DefaultTimeSource source;
    return source;
}

uint64_t DefaultTimeSource::get_current_time_ms() const {
    return utils::get_current_time_ms();
}

// StopWatch implementation
StopWatch::StopWatch() {
    reset();
}

void StopWatch::reset() {
    start_ = std::chrono::steady_clock::now();
}

uint64_t StopWatch::elapsed_ms() const {
    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_);
    return duration.count();
}

} // namespace utils
} // namespace rpc_snoop

#pragma once

#include <cstdint>
#include <string>
#include <chrono>

namespace rpc_snoop {
namespace utils {

// ========== 时间获取函数 ==========

// 获取当前时间戳（毫秒）
// return: 自Unix纪元以来的毫秒数
uint64_t get_current_time_ms();

// 获取单调时间戳（毫秒，不受系统时间修改影响）
uint64_t get_monotonic_time_ms();

// ========== 时间格式化 ==========

// 格式化当前本地时间为字符串
// format: strftime格式字符串，默认 "%Y-%m-%d %H:%M:%S"
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

// 格式化毫秒时间戳为本地时间字符串（毫秒精度）
// 输出形如 "Oct 17 09:05:03.042 2026"
std::string format_time_millis(uint64_t timestamp_ms);

// ========== 时间工具类 ==========

// 时间提供者接口（用于可测试性）
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual uint64_t get_current_time_ms() const = 0;
};

// 默认时间提供者（使用系统时间）
class DefaultTimeSource : public TimeSource {
public:
    DefaultTimeSource() = default;
    ~DefaultTimeSource() override = default;
    static DefaultTimeSource& instance();
    uint64_t get_current_time_ms() const override;

private:
    DefaultTimeSource(const DefaultTimeSource&) = delete;
    DefaultTimeSource& operator=(const DefaultTimeSource&) = delete;
};

// 计时器类，用于测量耗时
class StopWatch {
public:
    StopWatch();
    ~StopWatch() = default;

    void reset();

    uint64_t elapsed_ms() const;

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace utils
} // namespace rpc_snoop

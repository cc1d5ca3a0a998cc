#pragma once

#include <atomic>
#include <cstdint>

namespace rpc_snoop {
namespace proxy {

// 统计快照
struct ExchangeCounters {
    uint64_t exchanges = 0;
    uint64_t forwarded = 0;
    uint64_t overridden = 0;
    uint64_t requests_dropped = 0;
    uint64_t responses_dropped = 0;
    uint64_t request_errors = 0;
    uint64_t response_errors = 0;
};

class ExchangeStatistics {
public:
    ExchangeStatistics();
    ~ExchangeStatistics();

    // 禁止拷贝
    ExchangeStatistics(const ExchangeStatistics&) = delete;
    ExchangeStatistics& operator=(const ExchangeStatistics&) = delete;

    // ========== 统计记录 ==========

    void record_exchange();
    void record_forwarded();
    void record_overridden();
    void record_request_dropped();
    void record_response_dropped();
    void record_request_error();
    void record_response_error();

    // ========== 获取统计 ==========

    void get_statistics(ExchangeCounters* counters) const;

    // 以INFO级别输出汇总
    void log_summary() const;

    void reset();

private:
    std::atomic<uint64_t> exchanges_;
    std::atomic<uint64_t> forwarded_;
    std::atomic<uint64_t> overridden_;
    std::atomic<uint64_t> requests_dropped_;
    std::atomic<uint64_t> responses_dropped_;
    std::atomic<uint64_t> request_errors_;
    std::atomic<uint64_t> response_errors_;
};

} // namespace proxy
} // namespace rpc_snoop

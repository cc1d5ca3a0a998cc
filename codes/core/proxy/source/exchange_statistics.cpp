#include "proxy/exchange_statistics.hpp"
#include "utils/logger.hpp"

namespace rpc_snoop {
namespace proxy {

ExchangeStatistics::ExchangeStatistics()
    : exchanges_(0)
    , forwarded_(0)
    , overridden_(0)
    , requests_dropped_(0)
    , responses_dropped_(0)
    , request_errors_(0)
    , response_errors_(0)
{
}

ExchangeStatistics::~ExchangeStatistics() {
}

void ExchangeStatistics::record_exchange() {
    exchanges_.fetch_add(1, std::memory_order_relaxed);
}

void ExchangeStatistics::record_forwarded() {
    forwarded_.fetch_add(1, std::memory_order_relaxed);
}

void ExchangeStatistics::record_overridden() {
    overridden_.fetch_add(1, std::memory_order_relaxed);
}

void ExchangeStatistics::record_request_dropped() {
    requests_dropped_.fetch_add(1, std::memory_order_relaxed);
}

void ExchangeStatistics::record_response_dropped() {
    responses_dropped_.fetch_add(1, std::memory_order_relaxed);
}

void ExchangeStatistics::record_request_error() {
    request_errors_.fetch_add(1, std::memory_order_relaxed);
}

void ExchangeStatistics::record_response_error() {
    response_errors_.fetch_add(1, std::memory_order_relaxed);
}

void ExchangeStatistics::get_statistics(ExchangeCounters* counters) const {
    if (!counters) {
        return;
    }
    counters->exchanges = exchanges_.load(std::memory_order_relaxed);
    counters->forwarded = forwarded_.load(std::memory_order_relaxed);
    counters->overridden = overridden_.load(std::memory_order_relaxed);
    counters->requests_dropped = requests_dropped_.load(std::memory_order_relaxed);
    counters->responses_dropped = responses_dropped_.load(std::memory_order_relaxed);
    counters->request_errors = request_errors_.load(std::memory_order_relaxed);
    counters->response_errors = response_errors_.load(std::memory_order_relaxed);
}

void ExchangeStatistics::log_summary() const {
    ExchangeCounters c;
    get_statistics(&c);
    LOG_INFO("Stats", "exchanges=%llu forwarded=%llu overridden=%llu "
             "dropped(request=%llu response=%llu) errors(request=%llu response=%llu)",
             static_cast<unsigned long long>(c.exchanges),
             static_cast<unsigned long long>(c.forwarded),
             static_cast<unsigned long long>(c.overridden),
             static_cast<unsigned long long>(c.requests_dropped),
             static_cast<unsigned long long>(c.responses_dropped),
             static_cast<unsigned long long>(c.request_errors),
             static_cast<unsigned long long>(c.response_errors));
}

void ExchangeStatistics::reset() {
    exchanges_.store(0, std::memory_order_relaxed);
    forwarded_.store(0, std::memory_order_relaxed);
    overridden_.store(0, std::memory_order_relaxed);
    requests_dropped_.store(0, std::memory_order_relaxed);
    responses_dropped_.store(0, std::memory_order_relaxed);
    request_errors_.store(0, std::memory_order_relaxed);
    response_errors_.store(0, std::memory_order_relaxed);
}

} // namespace proxy
} // namespace rpc_snoop

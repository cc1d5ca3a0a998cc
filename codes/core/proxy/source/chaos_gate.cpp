#include "proxy/chaos_gate.hpp"
#include <chrono>

namespace rpc_snoop {
namespace proxy {

ChaosGate::ChaosGate(ProxyContext* context)
    : context_(context)
    , cancelled_(false)
{
}

bool ChaosGate::roll(double probability) {
    if (probability <= 0.0) {
        return false;
    }
    return context_->draw_uniform() <= probability;
}

PacketType ChaosGate::classify_request() {
    const config::ChaosConfig& chaos = context_->config().get_chaos();
    if (roll(chaos.drop_request_rate)) {
        return PacketType::request_dropped(chaos.drop_delay_seconds);
    }
    return PacketType::request();
}

PacketType ChaosGate::classify_response() {
    const config::ChaosConfig& chaos = context_->config().get_chaos();
    if (roll(chaos.drop_response_rate)) {
        return PacketType::response_dropped(chaos.drop_delay_seconds);
    }
    return PacketType::response();
}

void ChaosGate::wait(const PacketType& type) {
    if (!type.is_dropped() || type.delay_seconds() <= 0.0) {
        return;
    }
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(type.delay_seconds()));
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

void ChaosGate::cancel_waits() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        cancelled_ = true;
    }
    wait_cv_.notify_all();
}

} // namespace proxy
} // namespace rpc_snoop

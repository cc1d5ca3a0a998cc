// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: proxy_context.cpp
//  描述: 进程级只读配置与共享随机数发生器实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "proxy/proxy_context.hpp"
#include "utils/logger.hpp"

namespace rpc_snoop {
namespace proxy {

namespace {

uint64_t make_seed(const config::ChaosConfig& chaos) {
    if (chaos.has_seed) {
        return chaos.seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

utils::Result<std::shared_ptr<ProxyContext>> ProxyContext::create(const config::Config& config) {
    auto uri = protocol::Uri::parse(config.get_endpoint());
    if (uri.is_err()) {
        return utils::make_err<std::shared_ptr<ProxyContext>>(
            utils::ErrorCode::CONFIG_INVALID_URI,
            "invalid RPC endpoint '" + config.get_endpoint() + "': " + uri.error_message());
    }
    std::shared_ptr<ProxyContext> context(new ProxyContext(config, uri.value()));
    LOG_INFO("Proxy", "Destination %s, drop rates request=%.2f response=%.2f",
             context->destination_base_.c_str(),
             config.get_chaos().drop_request_rate,
             config.get_chaos().drop_response_rate);
    return utils::make_ok(std::move(context));
}

ProxyContext::ProxyContext(const config::Config& config, const protocol::Uri& destination)
    : config_(config)
    , destination_(destination)
    , destination_base_(protocol::Uri::remove_trailing_slashes(config.get_endpoint()))
    , rng_(make_seed(config.get_chaos()))
    , uniform_(0.0, 1.0)
    , draw_count_(0)
{
}

ProxyContext::~ProxyContext() {
}

double ProxyContext::draw_uniform() {
    double value;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        value = uniform_(rng_);
    }
    draw_count_.fetch_add(1, std::memory_order_relaxed);
    return value;
}

uint64_t ProxyContext::draw_count() const {
    return draw_count_.load(std::memory_order_relaxed);
}

} // namespace proxy
} // namespace rpc_snoop

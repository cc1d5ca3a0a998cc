// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: proxy_context.hpp
//  描述: 进程级只读配置与共享随机数发生器
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "config/config.hpp"
#include "protocol/uri.hpp"
#include "utils/error.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace rpc_snoop {
namespace proxy {

// 启动时构造一次，之后所有会话并发只读访问
// 唯一可变的共享状态是随机数发生器，由rng_mutex_保护
class ProxyContext {
public:
    /**
     * @brief 创建上下文
     * @param config 已通过validate()的配置
     * @return 失败时返回CONFIG_INVALID_URI
     */
    static utils::Result<std::shared_ptr<ProxyContext>> create(const config::Config& config);

    ~ProxyContext();

    ProxyContext(const ProxyContext&) = delete;
    ProxyContext& operator=(const ProxyContext&) = delete;

    const config::Config& config() const { return config_; }

    // 已解析的上游基础URI
    const protocol::Uri& destination() const { return destination_; }

    // 去掉末尾'/'的上游基础URI文本
    const std::string& destination_base() const { return destination_base_; }

    /**
     * @brief 取一个[0,1)均匀分布随机数，锁只覆盖这一次抽取
     */
    double draw_uniform();

    // 累计抽取次数
    uint64_t draw_count() const;

private:
    ProxyContext(const config::Config& config, const protocol::Uri& destination);

    const config::Config config_;
    const protocol::Uri destination_;
    const std::string destination_base_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_;
    std::atomic<uint64_t> draw_count_;
};

} // namespace proxy
} // namespace rpc_snoop

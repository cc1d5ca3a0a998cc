// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: chaos_gate.hpp
//  描述: 按方向随机模拟丢包
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "proxy/packet_type.hpp"
#include "proxy/proxy_context.hpp"
#include <condition_variable>
#include <mutex>

namespace rpc_snoop {
namespace proxy {

class ChaosGate {
public:
    explicit ChaosGate(ProxyContext* context);

    ChaosGate(const ChaosGate&) = delete;
    ChaosGate& operator=(const ChaosGate&) = delete;

    /**
     * @brief 按请求方向丢包率分类
     * 丢包率为0时不抽取随机数；否则抽取一次，draw <= p 判定为丢弃
     */
    PacketType classify_request();

    /**
     * @brief 按响应方向丢包率分类
     */
    PacketType classify_response();

    /**
     * @brief 丢弃类型时睡眠注入的延迟，只阻塞当前会话线程
     * cancel_waits()之后立即返回
     */
    void wait(const PacketType& type);

    /**
     * @brief 唤醒所有正在等待的会话，之后的wait不再睡眠
     */
    void cancel_waits();

private:
    bool roll(double probability);

    ProxyContext* context_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool cancelled_;
};

} // namespace proxy
} // namespace rpc_snoop

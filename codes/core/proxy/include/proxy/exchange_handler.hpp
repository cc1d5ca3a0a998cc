// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: exchange_handler.hpp
//  描述: 单次请求/响应交换的处理流水线
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_client.hpp"
#include "protocol/http_message.hpp"
#include "proxy/chaos_gate.hpp"
#include "proxy/exchange_statistics.hpp"
#include "proxy/presenter.hpp"
#include "proxy/proxy_context.hpp"
#include "proxy/request_forwarder.hpp"
#include "proxy/response_retriever.hpp"
#include "proxy/rpc_modules_override.hpp"
#include "proxy/suppression_engine.hpp"

namespace rpc_snoop {
namespace proxy {

// 交换结果：要写回的响应，或被丢弃（关闭连接，不写响应）
struct ExchangeOutcome {
    bool dropped;
    protocol::HttpResponse response;

    ExchangeOutcome();
};

/**
 * @brief 交换处理器
 *
 * 构建出站请求 -> 两个方向的丢包分类 -> 请求输出 -> (丢弃则延迟后结束)
 * -> 覆盖或转发得到响应 -> 响应输出 -> (丢弃则延迟后结束) -> 返回响应
 *
 * 可被多个会话线程并发调用，所有依赖对象的生命周期须长于处理器
 */
class ExchangeHandler {
public:
    ExchangeHandler(ProxyContext* context,
                    protocol::HttpTransport* transport,
                    Presenter* presenter,
                    ExchangeStatistics* statistics);
    ~ExchangeHandler();

    ExchangeHandler(const ExchangeHandler&) = delete;
    ExchangeHandler& operator=(const ExchangeHandler&) = delete;

    /**
     * @brief 处理一次交换，不抛异常
     * 处理中抛出的异常按所处阶段转换为500内部错误响应
     */
    ExchangeOutcome handle(const protocol::HttpRequest& inbound);

    /**
     * @brief 提前结束所有会话的丢包延迟，停止服务时调用
     */
    void cancel_pending_waits();

    /**
     * @brief 内部错误响应：状态500，报文体为JSON-RPC错误
     * @param phase "processing request" 或 "processing response"
     */
    static protocol::HttpResponse make_error_response(const std::string& phase,
                                                      const std::string& cause);

private:
    // phase随处理进度更新为当前阶段
    ExchangeOutcome process(const protocol::HttpRequest& inbound, const char** phase);

    Presenter* presenter_;
    ExchangeStatistics* statistics_;

    RequestForwarder forwarder_;
    ResponseRetriever retriever_;
    ChaosGate chaos_gate_;
    SuppressionEngine suppression_;
    RpcModulesOverride override_;
};

} // namespace proxy
} // namespace rpc_snoop

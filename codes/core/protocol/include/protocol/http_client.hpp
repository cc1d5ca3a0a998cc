// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: http_client.hpp
//  描述: 上游HTTP发送接口与阻塞式HTTP/1.1客户端
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_message.hpp"
#include "protocol/socket.hpp"
#include "protocol/tls_stream.hpp"
#include "protocol/uri.hpp"
#include "utils/error.hpp"
#include <memory>

namespace rpc_snoop {
namespace protocol {

// ==================== 发送接口 ====================
// 发送一个完整请求并取回完整响应
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief 发送请求
     * @param destination 目标URI，决定明文或TLS及连接地址
     * @param request 已构建好的请求，target为destination的请求目标
     * @return 完整缓冲的响应，或连接/读写/解析错误
     */
    virtual utils::Result<HttpResponse> send(const Uri& destination,
                                             const HttpRequest& request) = 0;
};

// ==================== HTTP客户端 ====================
// 每次调用新建一条连接，不重试，无额外超时
class HttpClient : public HttpTransport {
public:
    /**
     * @brief 构造函数
     * @param tls_context https目标使用的TLS上下文，可为空（此时https请求失败）
     */
    explicit HttpClient(std::shared_ptr<TlsClientContext> tls_context);
    ~HttpClient() override;

    utils::Result<HttpResponse> send(const Uri& destination,
                                     const HttpRequest& request) override;

    /**
     * @brief 在给定字节流上写出请求并读取完整的最终响应（跳过1xx）
     */
    static utils::Result<HttpResponse> exchange(ByteStream* stream, const HttpRequest& request);

private:
    std::shared_ptr<TlsClientContext> tls_context_;
};

} // namespace protocol
} // namespace rpc_snoop

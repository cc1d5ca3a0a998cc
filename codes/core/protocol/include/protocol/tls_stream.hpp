// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: tls_stream.hpp
//  描述: TLS客户端上下文与基于Socket的TLS字节流
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/socket.hpp"
#include "utils/error.hpp"
#include <memory>
#include <string>

struct ssl_st;
struct ssl_ctx_st;

namespace rpc_snoop {
namespace protocol {

namespace details {

struct SslCtxDeleter {
    void operator()(ssl_ctx_st* ctx) const;
};

struct SslDeleter {
    void operator()(ssl_st* ssl) const;
};

using UniqueSslCtxPtr = std::unique_ptr<ssl_ctx_st, SslCtxDeleter>;
using UniqueSslPtr = std::unique_ptr<ssl_st, SslDeleter>;

} // namespace details

// ==================== TLS客户端上下文 ====================
// 进程内共享，SSL_CTX本身线程安全
class TlsClientContext {
public:
    /**
     * @brief 创建客户端上下文：TLS1.2起步，加载系统信任库
     * @param verify_peer 是否校验服务端证书与主机名
     */
    static utils::Result<std::shared_ptr<TlsClientContext>> create(bool verify_peer);

    ~TlsClientContext();

    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

    ssl_ctx_st* native() const { return ctx_.get(); }
    bool verify_peer() const { return verify_peer_; }

private:
    TlsClientContext(details::UniqueSslCtxPtr ctx, bool verify_peer);

    details::UniqueSslCtxPtr ctx_;
    bool verify_peer_;
};

// ==================== TLS字节流 ====================
class TlsStream : public ByteStream {
public:
    /**
     * @brief 在已连接的套接字上完成TLS握手（携带SNI）
     * @param context 客户端上下文
     * @param socket 已连接套接字，所有权转入
     * @param server_name 主机名，用于SNI与证书校验
     */
    static utils::Result<std::unique_ptr<TlsStream>> connect(
        const std::shared_ptr<TlsClientContext>& context,
        Socket socket,
        const std::string& server_name);

    ~TlsStream() override;

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    utils::Result<void> write_all(const char* data, size_t len) override;
    utils::Result<size_t> read_some(char* data, size_t len) override;

    /**
     * @brief 发送close_notify
     */
    void shutdown();

private:
    TlsStream(std::shared_ptr<TlsClientContext> context, Socket socket,
              details::UniqueSslPtr ssl);

    std::shared_ptr<TlsClientContext> context_;
    Socket socket_;
    details::UniqueSslPtr ssl_;
};

/**
 * @brief 取出并清空OpenSSL线程错误队列，拼接为可读字符串
 */
std::string last_ssl_error();

} // namespace protocol
} // namespace rpc_snoop

// 文件结束

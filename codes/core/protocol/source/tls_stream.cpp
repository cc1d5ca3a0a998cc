// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: tls_stream.cpp
//  描述: TlsClientContext与TlsStream实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/tls_stream.hpp"
#include "utils/logger.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <arpa/inet.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

namespace rpc_snoop {
namespace protocol {

using utils::ErrorCode;
using utils::Result;

// ==================== RAII资源包装器 ====================
namespace details {

void SslCtxDeleter::operator()(ssl_ctx_st* ctx) const {
    if (ctx) {
        SSL_CTX_free(ctx);
    }
}

void SslDeleter::operator()(ssl_st* ssl) const {
    if (ssl) {
        SSL_free(ssl);
    }
}

} // namespace details

namespace {

// 主机名是否为IP字面量（IP证书校验走X509_VERIFY_PARAM_set1_ip_asc）
bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

} // namespace

std::string last_ssl_error() {
    std::string out;
    unsigned long err = 0;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) {
            out += "; ";
        }
        out += buf;
    }
    return out.empty() ? std::string("unknown TLS error") : out;
}

// ==================== TlsClientContext实现 ====================

TlsClientContext::TlsClientContext(details::UniqueSslCtxPtr ctx, bool verify_peer)
    : ctx_(std::move(ctx))
    , verify_peer_(verify_peer)
{
}

TlsClientContext::~TlsClientContext() = default;

Result<std::shared_ptr<TlsClientContext>> TlsClientContext::create(bool verify_peer) {
    using ContextPtr = std::shared_ptr<TlsClientContext>;

    details::UniqueSslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return utils::make_err<ContextPtr>(ErrorCode::TLS_INIT_ERROR,
                                           "SSL_CTX_new failed: " + last_ssl_error());
    }

    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
        return utils::make_err<ContextPtr>(ErrorCode::TLS_INIT_ERROR,
                                           "failed to set minimum TLS version: " +
                                           last_ssl_error());
    }

    // 对端未发送close_notify直接断开时按EOF处理
    SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
    SSL_CTX_set_mode(ctx.get(), SSL_MODE_AUTO_RETRY);

    if (verify_peer) {
        if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
            LOG_WARN("TLS", "Failed to load system trust store: %s", last_ssl_error().c_str());
        }
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }

    // 上游仅使用HTTP/1.1
    static const unsigned char kAlpn[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};
    if (SSL_CTX_set_alpn_protos(ctx.get(), kAlpn, sizeof(kAlpn)) != 0) {
        LOG_WARN("TLS", "Failed to configure ALPN");
    }

    return utils::make_ok(ContextPtr(new TlsClientContext(std::move(ctx), verify_peer)));
}

// ==================== TlsStream实现 ====================

TlsStream::TlsStream(std::shared_ptr<TlsClientContext> context, Socket socket,
                     details::UniqueSslPtr ssl)
    : context_(std::move(context))
    , socket_(std::move(socket))
    , ssl_(std::move(ssl))
{
}

TlsStream::~TlsStream() {
    shutdown();
}

Result<std::unique_ptr<TlsStream>> TlsStream::connect(
    const std::shared_ptr<TlsClientContext>& context,
    Socket socket,
    const std::string& server_name) {
    using StreamPtr = std::unique_ptr<TlsStream>;

    if (!context) {
        return utils::make_err<StreamPtr>(ErrorCode::TLS_INIT_ERROR, "TLS context not initialized");
    }

    ERR_clear_error();
    details::UniqueSslPtr ssl(SSL_new(context->native()));
    if (!ssl) {
        return utils::make_err<StreamPtr>(ErrorCode::TLS_INIT_ERROR,
                                          "SSL_new failed: " + last_ssl_error());
    }

    if (SSL_set_fd(ssl.get(), socket.fd()) != 1) {
        return utils::make_err<StreamPtr>(ErrorCode::TLS_INIT_ERROR,
                                          "SSL_set_fd failed: " + last_ssl_error());
    }

    bool ip_literal = is_ip_literal(server_name);
    // SNI不允许IP字面量
    if (!ip_literal && SSL_set_tlsext_host_name(ssl.get(), server_name.c_str()) != 1) {
        return utils::make_err<StreamPtr>(ErrorCode::TLS_INIT_ERROR,
                                          "failed to set SNI: " + last_ssl_error());
    }

    if (context->verify_peer()) {
        X509_VERIFY_PARAM* param = SSL_get0_param(ssl.get());
        int ok = ip_literal ? X509_VERIFY_PARAM_set1_ip_asc(param, server_name.c_str())
                            : X509_VERIFY_PARAM_set1_host(param, server_name.c_str(), 0);
        if (ok != 1) {
            return utils::make_err<StreamPtr>(ErrorCode::TLS_INIT_ERROR,
                                              "failed to set verification host: " +
                                              last_ssl_error());
        }
    }

    int ret = SSL_connect(ssl.get());
    if (ret != 1) {
        int err = SSL_get_error(ssl.get(), ret);
        std::string reason;
        long verify = SSL_get_verify_result(ssl.get());
        if (verify != X509_V_OK) {
            reason = X509_verify_cert_error_string(verify);
        } else if (err == SSL_ERROR_SYSCALL && errno != 0) {
            reason = std::strerror(errno);
        } else {
            reason = last_ssl_error();
        }
        return utils::make_err<StreamPtr>(ErrorCode::TLS_HANDSHAKE_ERROR,
                                          "TLS handshake with " + server_name + " failed: " +
                                          reason);
    }

    LOG_DEBUG("TLS", "Handshake with %s done, %s", server_name.c_str(),
              SSL_get_version(ssl.get()));
    return utils::make_ok(StreamPtr(new TlsStream(context, std::move(socket), std::move(ssl))));
}

Result<void> TlsStream::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        size_t chunk = std::min(len - sent, static_cast<size_t>(INT_MAX));
        ERR_clear_error();
        int ret = SSL_write(ssl_.get(), data + sent, static_cast<int>(chunk));
        if (ret <= 0) {
            int err = SSL_get_error(ssl_.get(), ret);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                continue;
            }
            return utils::make_err(ErrorCode::TLS_WRITE_ERROR,
                                   "SSL_write failed: " + last_ssl_error());
        }
        sent += static_cast<size_t>(ret);
    }
    return utils::make_ok();
}

Result<size_t> TlsStream::read_some(char* data, size_t len) {
    while (true) {
        ERR_clear_error();
        errno = 0;
        int chunk = static_cast<int>(std::min(len, static_cast<size_t>(INT_MAX)));
        int ret = SSL_read(ssl_.get(), data, chunk);
        if (ret > 0) {
            return utils::make_ok(static_cast<size_t>(ret));
        }
        int err = SSL_get_error(ssl_.get(), ret);
        switch (err) {
            case SSL_ERROR_ZERO_RETURN:
                return utils::make_ok(static_cast<size_t>(0));
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                continue;
            case SSL_ERROR_SYSCALL:
                if (errno == 0 || errno == ECONNRESET) {
                    return utils::make_ok(static_cast<size_t>(0));
                }
                return utils::make_err<size_t>(ErrorCode::TLS_READ_ERROR,
                                               std::string("SSL_read failed: ") +
                                               std::strerror(errno));
            default:
                return utils::make_err<size_t>(ErrorCode::TLS_READ_ERROR,
                                               "SSL_read failed: " + last_ssl_error());
        }
    }
}

void TlsStream::shutdown() {
    if (ssl_) {
        // 单向关闭，不等待对端的close_notify
        SSL_shutdown(ssl_.get());
        ssl_.reset();
    }
    socket_.close();
}

} // namespace protocol
} // namespace rpc_snoop

// 文件结束

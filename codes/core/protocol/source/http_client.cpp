// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: http_client.cpp
//  描述: HttpClient类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_client.hpp"
#include "protocol/http_parser.hpp"
#include "protocol/protocol_utils.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"

namespace rpc_snoop {
namespace protocol {

using utils::ErrorCode;
using utils::Result;

HttpClient::HttpClient(std::shared_ptr<TlsClientContext> tls_context)
    : tls_context_(std::move(tls_context))
{
}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::send(const Uri& destination, const HttpRequest& request) {
    auto connected = Socket::connect(destination.host(), destination.port());
    if (connected.is_err()) {
        return utils::make_err<HttpResponse>(connected.error_code(), connected.error_message());
    }
    LOG_DEBUG("HttpClient", "Connected to %s:%u", destination.host().c_str(),
              static_cast<unsigned>(destination.port()));

    if (!destination.is_tls()) {
        Socket socket = connected.take();
        return exchange(&socket, request);
    }

    auto tls = TlsStream::connect(tls_context_, connected.take(), destination.host());
    if (tls.is_err()) {
        return utils::make_err<HttpResponse>(tls.error_code(), tls.error_message());
    }
    std::unique_ptr<TlsStream> stream = tls.take();
    return exchange(stream.get(), request);
}

Result<HttpResponse> HttpClient::exchange(ByteStream* stream, const HttpRequest& request) {
    std::string wire = HttpParser::serialize_request(request);
    auto written = stream->write_all(wire.data(), wire.size());
    if (written.is_err()) {
        return utils::make_err<HttpResponse>(written.error_code(), written.error_message());
    }

    utils::Buffer buffer;
    HttpParser parser(HttpParser::Mode::RESPONSE);
    parser.init(&buffer);
    parser.set_expect_no_body(StrCaseCmp(request.method.c_str(), "HEAD") == 0);

    HttpResponse response;
    char chunk[TEMP_BUFFER_SIZE];
    while (true) {
        int ret = parser.parse_response(&response);
        if (ret == PROTOCOL_OK) {
            // 1xx为中间响应，继续等待最终响应
            if (response.status_code < 200) {
                LOG_DEBUG("HttpClient", "Skipping interim response %d", response.status_code);
                continue;
            }
            return utils::make_ok(std::move(response));
        }
        if (ret != PROTOCOL_ERROR_EAGAIN) {
            return utils::make_err<HttpResponse>(parser_error_to_code(ret),
                                                 "invalid upstream response: " +
                                                 parser.get_error_msg());
        }

        auto got = stream->read_some(chunk, sizeof(chunk));
        if (got.is_err()) {
            return utils::make_err<HttpResponse>(got.error_code(), got.error_message());
        }
        if (got.value() == 0) {
            ret = parser.finish_response(&response);
            if (ret != PROTOCOL_OK) {
                return utils::make_err<HttpResponse>(parser_error_to_code(ret),
                                                     parser.get_error_msg());
            }
            if (response.status_code < 200) {
                return utils::make_err<HttpResponse>(ErrorCode::PROTOCOL_INCOMPLETE_MESSAGE,
                                                     "Connection closed after interim response");
            }
            return utils::make_ok(std::move(response));
        }
        if (buffer.write(chunk, got.value()) != got.value()) {
            return utils::make_err<HttpResponse>(ErrorCode::BUFFER_OVERFLOW,
                                                 "upstream response exceeds buffer capacity");
        }
    }
}

} // namespace protocol
} // namespace rpc_snoop

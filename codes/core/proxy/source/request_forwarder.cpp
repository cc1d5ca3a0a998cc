// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: request_forwarder.cpp
//  描述: 出站请求构建实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "proxy/request_forwarder.hpp"
#include "protocol/protocol_types.hpp"
#include "protocol/protocol_utils.hpp"
#include "proxy/json_rpc.hpp"

namespace rpc_snoop {
namespace proxy {

using utils::ErrorCode;
using utils::Result;

RequestForwarder::RequestForwarder(const ProxyContext* context)
    : context_(context)
{
}

bool RequestForwarder::split_target(const std::string& target, std::string* path,
                                    bool* has_query, std::string* query) {
    if (target.empty()) {
        return false;
    }

    if (target[0] == '/') {
        size_t pos = target.find('?');
        *has_query = (pos != std::string::npos);
        *path = *has_query ? target.substr(0, pos) : target;
        *query = *has_query ? target.substr(pos + 1) : std::string();
        return true;
    }

    // absolute-form
    auto uri = protocol::Uri::parse(target);
    if (uri.is_err()) {
        return false;
    }
    *path = uri.value().path();
    *has_query = uri.value().has_query();
    *query = uri.value().query();
    return true;
}

Result<protocol::Uri> RequestForwarder::compose_destination(const std::string& path,
                                                            bool has_query,
                                                            const std::string& query) const {
    if (path == "/" && !has_query) {
        return utils::make_ok(context_->destination());
    }

    std::string text = context_->destination_base() + path;
    if (has_query) {
        text += '?';
        text += query;
    }

    auto uri = protocol::Uri::parse(text);
    if (uri.is_err()) {
        return utils::make_err<protocol::Uri>(ErrorCode::PROTOCOL_INVALID_URI,
                                              "invalid destination URI '" + text + "': " +
                                              uri.error_message());
    }
    return uri;
}

Result<ForwardedRequest> RequestForwarder::forward(const protocol::HttpRequest& inbound) const {
    std::string path;
    std::string query;
    bool has_query = false;
    if (!split_target(inbound.target, &path, &has_query, &query)) {
        return utils::make_err<ForwardedRequest>(ErrorCode::PROTOCOL_INVALID_URI,
                                                 "invalid request target '" + inbound.target + "'");
    }

    auto destination = compose_destination(path, has_query, query);
    if (destination.is_err()) {
        return utils::make_err<ForwardedRequest>(destination.error_code(),
                                                 destination.error_message());
    }

    ForwardedRequest forwarded;
    forwarded.destination = destination.take();

    protocol::HttpRequest& out = forwarded.request;
    out.method = inbound.method;
    out.target = forwarded.destination.request_target();
    out.version = "HTTP/1.1";
    out.body = inbound.body;

    const std::string host = forwarded.destination.host_port();
    bool host_written = false;
    for (const auto& header : inbound.headers) {
        if (!protocol::IsValidHeaderName(header.first) ||
            !protocol::IsValidHeaderValue(header.second)) {
            return utils::make_err<ForwardedRequest>(ErrorCode::PROTOCOL_INVALID_HEADER,
                                                     "invalid header '" + header.first + "'");
        }
        if (protocol::StrCaseCmp(header.first.c_str(), protocol::HEADER_ACCEPT_ENCODING) == 0) {
            continue;
        }
        if (protocol::StrCaseCmp(header.first.c_str(), protocol::HEADER_HOST) == 0) {
            if (!host_written) {
                out.add_header(protocol::HEADER_HOST, host);
                host_written = true;
            }
            continue;
        }
        out.add_header(header.first, header.second);
    }
    if (!host_written) {
        out.add_header(protocol::HEADER_HOST, host);
    }

    forwarded.display_json = render_display_json(inbound.body);
    return utils::make_ok(std::move(forwarded));
}

} // namespace proxy
} // namespace rpc_snoop

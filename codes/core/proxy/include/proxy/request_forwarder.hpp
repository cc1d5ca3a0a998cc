// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: request_forwarder.hpp
//  描述: 由入站请求构建出站请求
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_message.hpp"
#include "protocol/uri.hpp"
#include "proxy/proxy_context.hpp"
#include "utils/error.hpp"
#include <string>

namespace rpc_snoop {
namespace proxy {

// 构建结果
struct ForwardedRequest {
    protocol::Uri destination;
    protocol::HttpRequest request;
    std::string display_json;
};

class RequestForwarder {
public:
    explicit RequestForwarder(const ProxyContext* context);

    /**
     * @brief 构建出站请求
     * 去掉accept-encoding，host改写为目标host[:port]，其余头部和报文体原样复制
     * @return 头部或URI拼装非法时返回构建错误，请求不会被转发
     */
    utils::Result<ForwardedRequest> forward(const protocol::HttpRequest& inbound) const;

    /**
     * @brief 拼装目标URI
     * 入站路径恰为"/"且无查询串时直接使用基础URI；
     * 否则为 基础URI(去掉末尾'/') + 路径 + [?查询串]
     */
    utils::Result<protocol::Uri> compose_destination(const std::string& path,
                                                     bool has_query,
                                                     const std::string& query) const;

    /**
     * @brief 拆分请求目标，支持origin-form和absolute-form
     * @return 请求目标非法时返回false
     */
    static bool split_target(const std::string& target, std::string* path,
                             bool* has_query, std::string* query);

private:
    const ProxyContext* context_;
};

} // namespace proxy
} // namespace rpc_snoop

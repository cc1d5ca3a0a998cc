// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: response_retriever.hpp
//  描述: 向上游发送出站请求并缓冲完整响应
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_client.hpp"
#include "proxy/request_forwarder.hpp"
#include "utils/error.hpp"

namespace rpc_snoop {
namespace proxy {

struct RetrievedResponse {
    protocol::HttpResponse response;
    std::string display_json;
};

class ResponseRetriever {
public:
    // transport生命周期须长于ResponseRetriever
    explicit ResponseRetriever(protocol::HttpTransport* transport);

    /**
     * @brief 发送请求，状态、版本、头部和报文体原样保留
     * @return 连接或读取失败时返回传输错误，不重试
     */
    utils::Result<RetrievedResponse> retrieve(const ForwardedRequest& forwarded) const;

private:
    protocol::HttpTransport* transport_;
};

} // namespace proxy
} // namespace rpc_snoop

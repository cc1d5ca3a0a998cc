// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: rpc_modules_override.hpp
//  描述: 本地合成rpc_modules响应
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "config/config.hpp"
#include "protocol/http_message.hpp"
#include <string>
#include <vector>

namespace rpc_snoop {
namespace proxy {

// 被替换的JSON-RPC方法名
constexpr const char* RPC_MODULES_METHOD = "rpc_modules";

class RpcModulesOverride {
public:
    explicit RpcModulesOverride(const config::RpcModulesOverrideConfig& config);

    /**
     * @brief 是否拦截该请求
     * @param rpc_method 请求体识别出的方法名，不是JSON-RPC调用时为nullptr
     */
    bool applies(const std::string* rpc_method) const;

    /**
     * @brief 合成响应：状态200，content-type为application/json
     * 报文体 {"jsonrpc":"2.0","result":{"<module>":"1.0",...},"id":1}，模块按配置顺序
     */
    protocol::HttpResponse synthesize() const;

    static std::string make_body(const std::vector<std::string>& modules);

private:
    const config::RpcModulesOverrideConfig& config_;
};

} // namespace proxy
} // namespace rpc_snoop

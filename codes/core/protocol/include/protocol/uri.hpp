// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: uri.hpp
//  描述: 绝对http/https URI解析
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>
#include <string>

namespace rpc_snoop {
namespace protocol {

// scheme://host[:port][/path][?query]，片段部分被丢弃
class Uri {
public:
    Uri();

    /**
     * @brief 解析绝对URI
     * @param text URI字符串
     * @return 成功返回Uri，失败返回PROTOCOL_INVALID_URI
     */
    static utils::Result<Uri> parse(const std::string& text);

    /**
     * @brief 去掉末尾所有'/'
     */
    static std::string remove_trailing_slashes(const std::string& text);

    // 小写scheme，"http"或"https"
    const std::string& scheme() const { return scheme_; }
    // 不带方括号的主机名
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    bool has_explicit_port() const { return explicit_port_; }
    bool is_tls() const { return scheme_ == "https"; }
    bool has_query() const { return has_query_; }
    const std::string& query() const { return query_; }

    /**
     * @brief 路径，为空时返回"/"
     */
    std::string path() const;

    /**
     * @brief 请求目标：path[?query]
     */
    std::string request_target() const;

    /**
     * @brief Host头取值：host[:port]，仅在URI显式写出端口时带端口
     */
    std::string host_port() const;

    std::string to_string() const;

private:
    std::string scheme_;
    std::string host_;
    uint16_t port_;
    bool explicit_port_;
    bool ipv6_;
    std::string path_;
    std::string query_;
    bool has_query_;
};

} // namespace protocol
} // namespace rpc_snoop

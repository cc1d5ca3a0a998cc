// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: suppression_engine.hpp
//  描述: 按方法名/路径规则决定每个方向的输出程度
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "config/config.hpp"
#include "proxy/packet_type.hpp"
#include <cstdint>
#include <string>

namespace rpc_snoop {
namespace proxy {

// 输出决定
// limited=false 完整输出且无标签
// limited=true 时 line_limit < 0 不输出；= 0 只输出标题行；> 0 报文体最多line_limit行
struct SuppressDecision {
    bool limited;
    int32_t line_limit;
    std::string label;

    SuppressDecision();

    static SuppressDecision full();
    static SuppressDecision limit(int32_t lines, const std::string& label);

    bool is_suppressed() const { return limited && line_limit < 0; }
    bool is_header_only() const { return limited && line_limit == 0; }
};

class SuppressionEngine {
public:
    explicit SuppressionEngine(const config::SuppressConfig& config);

    /**
     * @brief 计算某个方向的输出决定
     * @param direction 当前方向
     * @param rpc_method 请求体识别出的JSON-RPC方法名，不是JSON-RPC调用时为nullptr
     * @param request_path 入站请求路径
     * @param request_type 本次交换的请求方向分类
     * @param response_type 本次交换的响应方向分类
     *
     * 优先级：任一方向被丢弃时完整输出；方法规则；路径规则；完整输出
     * 规则作用方向不匹配时继续尝试下一级
     */
    SuppressDecision decide(Direction direction,
                            const std::string* rpc_method,
                            const std::string& request_path,
                            const PacketType& request_type,
                            const PacketType& response_type) const;

    /**
     * @brief 按行截断
     * limit <= 0 返回空串；limit >= 行数原样返回；
     * 否则保留前 ceil(limit/2) 行和后 floor(limit/2) 行，中间以一行"..."代替
     */
    static std::string trim_json(const std::string& json, int32_t limit);

private:
    const config::SuppressConfig& config_;
};

} // namespace proxy
} // namespace rpc_snoop

// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: presenter.hpp
//  描述: 交换记录的终端着色输出
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "config/config.hpp"
#include "protocol/protocol_types.hpp"
#include "proxy/packet_type.hpp"
#include "proxy/suppression_engine.hpp"
#include "utils/color.hpp"
#include "utils/time.hpp"
#include <mutex>
#include <ostream>
#include <string>

namespace rpc_snoop {
namespace proxy {

// 一条待输出的记录，头部为决定时刻的快照
struct PresentRecord {
    PacketType type;
    std::string json;               // 完整展示文本
    protocol::HttpHeaders headers;
    std::string message;            // 请求为入站路径，响应为空
    int status;                     // 响应状态码，0表示不输出

    PresentRecord();
};

/**
 * @brief 输出格式
 *
 * <时间> <类型>[ (status NNN)][ <消息>]
 * [headers:
 *     (name,"value")]
 * <逐行着色的报文体>
 *
 * 一条记录在锁内一次写出，不同交换之间的记录可以交错
 */
class Presenter {
public:
    /**
     * @brief 构造函数
     * @param display 输出配置（头部开关、颜色开关）
     * @param out 输出流，生命周期须长于Presenter
     * @param time_source 时间来源，为nullptr时使用系统时间
     */
    Presenter(const config::DisplayConfig& display, std::ostream* out,
              const utils::TimeSource* time_source = nullptr);

    /**
     * @brief 按输出决定渲染一条记录
     * @return 完全抑制时返回空串
     */
    std::string render(const PresentRecord& record, const SuppressDecision& decision) const;

    void present(const PresentRecord& record, const SuppressDecision& decision);

    /**
     * @brief 渲染内部错误响应体，整体使用错误色
     */
    std::string render_internal_error(const std::string& error_body) const;

    void present_internal_error(const std::string& error_body);

    /**
     * @brief 报文体颜色：请求为信息色；响应为JSON-RPC错误时为错误色，否则为成功色；
     * 被丢弃的报文一律为弱化色
     */
    const std::string& body_color(const PacketType& type, const std::string& full_json) const;

    const utils::ColorPalette& palette() const { return palette_; }

private:
    std::string render_headers(const protocol::HttpHeaders& headers) const;
    void write(const std::string& text);

    bool log_headers_;
    utils::ColorPalette palette_;
    std::ostream* out_;
    const utils::TimeSource* time_source_;
    std::mutex out_mutex_;
};

} // namespace proxy
} // namespace rpc_snoop

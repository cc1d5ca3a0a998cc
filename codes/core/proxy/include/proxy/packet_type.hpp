// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: packet_type.hpp
//  描述: 报文方向与丢弃状态
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "config/config.hpp"

namespace rpc_snoop {
namespace proxy {

// 报文方向
enum class Direction {
    REQUEST = 0,
    RESPONSE = 1
};

// 抑制规则是否作用于该方向
bool scope_matches(config::SuppressScope scope, Direction direction);

// 方向 + 是否被丢弃；丢弃时携带注入的延迟（秒）
class PacketType {
public:
    enum class Kind {
        REQUEST = 0,
        RESPONSE = 1,
        REQUEST_DROPPED = 2,
        RESPONSE_DROPPED = 3
    };

    static PacketType request();
    static PacketType response();
    static PacketType request_dropped(double delay_seconds);
    static PacketType response_dropped(double delay_seconds);

    Kind kind() const { return kind_; }

    // 非丢弃类型为0
    double delay_seconds() const { return delay_seconds_; }

    Direction direction() const;
    bool is_dropped() const;

    // REQUEST / RESPONSE / DROPPED REQUEST / DROPPED RESPONSE
    const char* label() const;

    bool operator==(const PacketType& other) const;
    bool operator!=(const PacketType& other) const { return !(*this == other); }

private:
    PacketType(Kind kind, double delay_seconds);

    Kind kind_;
    double delay_seconds_;
};

} // namespace proxy
} // namespace rpc_snoop

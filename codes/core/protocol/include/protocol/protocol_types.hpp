// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: protocol_types.hpp
//  描述: Protocol模块类型定义、常量
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cerrno>
#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace rpc_snoop {
namespace protocol {

// ==================== 错误码定义 ====================
constexpr int PROTOCOL_OK = 0;
constexpr int PROTOCOL_ERROR_EAGAIN = -EAGAIN;
constexpr int PROTOCOL_ERROR_INVALID = -1;
constexpr int PROTOCOL_ERROR_TOO_LONG = -2;
constexpr int PROTOCOL_ERROR_TOO_MANY = -3;
constexpr int PROTOCOL_ERROR_BODY_TOO_LARGE = -4;
constexpr int PROTOCOL_ERROR_VERSION = -5;
constexpr int PROTOCOL_ERROR_CHUNK = -6;
constexpr int PROTOCOL_ERROR_INCOMPLETE = -7;

// ==================== HTTP解析相关常量 ====================
constexpr size_t MAX_HEADER_LINE_LEN = 8192;
constexpr size_t MAX_HEADERS = 100;
constexpr size_t MAX_HEADER_NAME_LEN = 256;
constexpr size_t MAX_BODY_SIZE = 64 * 1024 * 1024;

// ==================== 通用缓冲区常量 ====================
constexpr size_t TEMP_BUFFER_SIZE = 16384;

// ==================== 默认端口 ====================
constexpr uint16_t HTTP_DEFAULT_PORT = 80;
constexpr uint16_t HTTPS_DEFAULT_PORT = 443;

// ==================== 常用头部名称（小写） ====================
constexpr const char* HEADER_HOST = "host";
constexpr const char* HEADER_ACCEPT_ENCODING = "accept-encoding";
constexpr const char* HEADER_CONTENT_LENGTH = "content-length";
constexpr const char* HEADER_CONTENT_TYPE = "content-type";
constexpr const char* HEADER_TRANSFER_ENCODING = "transfer-encoding";
constexpr const char* HEADER_CONNECTION = "connection";

// ==================== HTTP/1.x解析状态枚举 ====================
enum class Http1ParseState {
    EXPECT_START_LINE = 0,
    EXPECT_HEADERS = 1,
    EXPECT_BODY = 2,
    EXPECT_CHUNK_SIZE = 3,
    EXPECT_CHUNK_DATA = 4,
    EXPECT_CHUNK_TRAILER = 5,
    EXPECT_COMPLETE = 6,
    ERROR = 7
};

// ==================== 报文体分帧方式 ====================
enum class BodyFraming {
    NONE = 0,
    CONTENT_LENGTH = 1,
    CHUNKED = 2,
    UNTIL_CLOSE = 3
};

// ==================== HTTP头部 ====================
// 保持报文中的原始顺序，允许同名重复；名称统一为小写
using HttpHeader = std::pair<std::string, std::string>;
using HttpHeaders = std::vector<HttpHeader>;

} // namespace protocol
} // namespace rpc_snoop

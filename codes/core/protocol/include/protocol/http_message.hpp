// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: http_message.hpp
//  描述: HttpRequest和HttpResponse类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include <string>

namespace rpc_snoop {
namespace protocol {

/**
 * @brief 大小写不敏感查找头部（返回第一个匹配项）
 * @param headers 头部集合
 * @param name 头部名称
 * @param value 输出头部值（可为nullptr）
 * @return true找到，false未找到
 */
bool find_header(const HttpHeaders& headers, const std::string& name, std::string* value);

/**
 * @brief 删除所有同名头部（大小写不敏感）
 * @return 删除的条数
 */
size_t remove_header(HttpHeaders* headers, const std::string& name);

// ==================== HTTP请求类 ====================
class HttpRequest {
public:
    /**
     * @brief 默认构造函数
     */
    HttpRequest();

    /**
     * @brief 重置请求对象到初始状态
     */
    void reset();

    /**
     * @brief 添加请求头（名称转小写，保留原有同名项）
     */
    void add_header(const std::string& name, const std::string& value);

    /**
     * @brief 请求目标中'?'之前的部分
     */
    std::string path() const;

    /**
     * @brief 请求目标中'?'之后的部分，不含'?'
     * @param has_query 输出是否存在'?'（可为nullptr）
     */
    std::string query(bool* has_query) const;

    /**
     * @brief 按版本和Connection头判断连接是否保持
     */
    bool keep_alive() const;

    // 公开属性
    std::string method;
    std::string target;
    std::string version;
    HttpHeaders headers;
    std::string body;
};

// ==================== HTTP响应类 ====================
class HttpResponse {
public:
    /**
     * @brief 默认构造函数
     */
    HttpResponse();

    /**
     * @brief 重置响应对象到初始状态
     */
    void reset();

    /**
     * @brief 设置状态码和状态文本
     * @param code HTTP状态码
     * @param text 状态文本
     */
    void set_status(int code, const std::string& text);

    /**
     * @brief 添加响应头（名称转小写，保留原有同名项）
     * @param name 头部名称
     * @param value 头部值
     */
    void add_header(const std::string& name, const std::string& value);

    /**
     * @brief 设置响应体
     */
    void set_body(const std::string& data);

    /**
     * @brief 是否要求发送后关闭连接
     */
    bool wants_close() const;

    // 公开属性
    std::string version;
    int status_code;
    std::string status_text;
    HttpHeaders headers;
    std::string body;
};

/**
 * @brief 常见状态码的标准状态文本，未知状态码返回空串
 */
const char* status_reason(int code);

} // namespace protocol
} // namespace rpc_snoop

// 文件结束

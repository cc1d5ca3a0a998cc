// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: http_parser.hpp
//  描述: HttpParser类定义 - HTTP/1.x增量解析与序列化
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "protocol/http_message.hpp"
#include "utils/buffer.hpp"
#include "utils/error.hpp"
#include <string>

namespace rpc_snoop {
namespace protocol {

// ==================== HTTP解析器类 ====================
// 从绑定的Buffer中增量解析完整报文；数据不足时返回PROTOCOL_ERROR_EAGAIN，
// 已消费的部分保存在解析器内部，下次调用继续
class HttpParser {
public:
    enum class Mode {
        REQUEST = 0,
        RESPONSE = 1
    };

    /**
     * @brief 构造函数
     * @param mode 解析请求或响应
     */
    explicit HttpParser(Mode mode);

    /**
     * @brief 析构函数
     */
    ~HttpParser();

    /**
     * @brief 初始化解析器，绑定缓冲区
     * @param buffer 缓冲区指针
     */
    void init(utils::Buffer* buffer);

    /**
     * @brief 解析一个完整请求
     * @param req 输出请求
     * @return 0成功，-EAGAIN需要更多数据，负数失败
     */
    int parse_request(HttpRequest* req);

    /**
     * @brief 解析一个完整响应（1xx中间响应同样作为完整响应返回）
     * @param resp 输出响应
     * @return 0成功，-EAGAIN需要更多数据，负数失败
     */
    int parse_response(HttpResponse* resp);

    /**
     * @brief 对端关闭连接时结束响应解析（以连接关闭分帧的报文体）
     * @param resp 输出响应
     * @return 0成功，PROTOCOL_ERROR_INCOMPLETE报文不完整
     */
    int finish_response(HttpResponse* resp);

    /**
     * @brief 下一个响应没有报文体（对应HEAD请求）
     */
    void set_expect_no_body(bool no_body);

    /**
     * @brief 是否已开始解析但尚未完成一个报文
     */
    bool has_partial_message() const;

    /**
     * @brief 从缓冲区读取一行（以\r\n结尾，不含\r\n）
     * @param out 输出行内容
     * @return 0成功，-EAGAIN需要更多数据，负数失败
     */
    int read_line(std::string* out);

    /**
     * @brief 解析HTTP请求行
     * @param line 请求行字符串
     * @param method 输出方法
     * @param target 输出请求目标
     * @param version 输出版本
     * @return 0成功，负数失败
     */
    int parse_request_line(const std::string& line,
                           std::string* method,
                           std::string* target,
                           std::string* version);

    /**
     * @brief 解析HTTP状态行
     * @param line 状态行字符串
     * @param version 输出版本
     * @param code 输出状态码
     * @param text 输出状态文本
     * @return 0成功，负数失败
     */
    int parse_status_line(const std::string& line,
                          std::string* version,
                          int* code,
                          std::string* text);

    /**
     * @brief 解析单条HTTP头部行
     * @param line 头部行字符串
     * @param key 输出头部名称
     * @param value 输出头部值
     * @return 0成功，负数失败
     */
    int parse_header(const std::string& line,
                     std::string* key,
                     std::string* value);

    /**
     * @brief 序列化请求，分帧头部按缓冲的报文体重新生成
     */
    static std::string serialize_request(const HttpRequest& req);

    /**
     * @brief 序列化响应，分帧头部按缓冲的报文体重新生成
     */
    static std::string serialize_response(const HttpResponse& resp);

    /**
     * @brief 设置错误信息
     * @param code 错误码
     * @param msg 错误信息
     */
    void set_error(int code, const std::string& msg);

    /**
     * @brief 获取错误码
     * @return 错误码
     */
    int get_error_code() const;

    /**
     * @brief 获取错误信息
     * @return 错误信息
     */
    const std::string& get_error_msg() const;

    /**
     * @brief 重置解析器状态
     */
    void reset();

private:
    int advance();
    int on_headers_complete();
    int read_body();
    int read_chunk_size();
    int read_chunk_data();
    int append_body(size_t len);
    int fail(int code, const std::string& msg);

    Mode mode_;
    utils::Buffer* buffer_;
    Http1ParseState state_;
    BodyFraming framing_;
    bool expect_no_body_;
    size_t body_remaining_;

    // 当前报文
    std::string method_;
    std::string target_;
    std::string version_;
    int status_code_;
    std::string status_text_;
    HttpHeaders headers_;
    std::string body_;

    int error_code_;
    std::string error_msg_;
};

/**
 * @brief 解析器返回码映射到统一错误码
 */
utils::ErrorCode parser_error_to_code(int code);

} // namespace protocol
} // namespace rpc_snoop

// 文件结束

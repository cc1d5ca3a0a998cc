// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: json_rpc.hpp
//  描述: 报文体展示格式化与JSON-RPC形状识别
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <string>

namespace rpc_snoop {
namespace proxy {

// JSON-RPC内部错误码
constexpr int JSON_RPC_INTERNAL_ERROR = -32603;

// 展示与形状识别时解析的最大嵌套层数
constexpr int MAX_JSON_DEPTH = 128;

// 报文体转展示文本
// 空报文体返回"null"；可解析为JSON时按2空格缩进输出；否则原样返回
// 嵌套超过MAX_JSON_DEPTH时也原样返回
std::string render_display_json(const std::string& body);

// JSON-RPC调用形状 {id:number, jsonrpc:string, method:string, params?:array}
// 匹配时输出method（可为nullptr）
bool sniff_rpc_request(const std::string& text, std::string* method);

// JSON-RPC错误响应形状 {id:number, jsonrpc:string, error:{code:number, message:string}}
bool is_rpc_error_response(const std::string& text);

// 内部错误响应体（缩进格式）
// {"id":1,"jsonrpc":"2.0","error":{"code":-32603,"message":"<phase>: <cause>"}}
std::string make_internal_error_body(const std::string& phase, const std::string& cause);

} // namespace proxy
} // namespace rpc_snoop

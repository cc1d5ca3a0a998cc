// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: http_message.cpp
//  描述: HttpRequest和HttpResponse类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_message.hpp"
#include "protocol/protocol_utils.hpp"
#include <algorithm>

namespace rpc_snoop {
namespace protocol {

// ==================== 头部辅助函数 ====================

bool find_header(const HttpHeaders& headers, const std::string& name, std::string* value) {
    for (const auto& header : headers) {
        if (StrCaseCmp(header.first.c_str(), name.c_str()) == 0) {
            if (value) {
                *value = header.second;
            }
            return true;
        }
    }
    return false;
}

size_t remove_header(HttpHeaders* headers, const std::string& name) {
    size_t before = headers->size();
    headers->erase(std::remove_if(headers->begin(), headers->end(),
                                  [&name](const HttpHeader& header) {
                                      return StrCaseCmp(header.first.c_str(), name.c_str()) == 0;
                                  }),
                   headers->end());
    return before - headers->size();
}

namespace {

// Connection头是否包含指定选项（逗号分隔，大小写不敏感）
bool connection_has_token(const HttpHeaders& headers, const char* token) {
    for (const auto& header : headers) {
        if (StrCaseCmp(header.first.c_str(), HEADER_CONNECTION) != 0) {
            continue;
        }
        size_t start = 0;
        const std::string& value = header.second;
        while (start <= value.size()) {
            size_t comma = value.find(',', start);
            if (comma == std::string::npos) {
                comma = value.size();
            }
            std::string item = TrimWhitespace(value.substr(start, comma - start));
            if (StrCaseCmp(item.c_str(), token) == 0) {
                return true;
            }
            start = comma + 1;
        }
    }
    return false;
}

} // namespace

// ==================== HttpRequest实现 ====================

HttpRequest::HttpRequest()
    : method()
    , target()
    , version("HTTP/1.1")
    , headers()
    , body()
{
}

void HttpRequest::reset() {
    method.clear();
    target.clear();
    version = "HTTP/1.1";
    headers.clear();
    body.clear();
}

void HttpRequest::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(ToLower(name), value);
}

std::string HttpRequest::path() const {
    size_t pos = target.find('?');
    return pos == std::string::npos ? target : target.substr(0, pos);
}

std::string HttpRequest::query(bool* has_query) const {
    size_t pos = target.find('?');
    if (has_query) {
        *has_query = (pos != std::string::npos);
    }
    return pos == std::string::npos ? std::string() : target.substr(pos + 1);
}

bool HttpRequest::keep_alive() const {
    if (connection_has_token(headers, "close")) {
        return false;
    }
    if (version == "HTTP/1.0") {
        return connection_has_token(headers, "keep-alive");
    }
    return true;
}

// ==================== HttpResponse实现 ====================

HttpResponse::HttpResponse()
    : version("HTTP/1.1")
    , status_code(200)
    , status_text("OK")
    , headers()
    , body()
{
}

void HttpResponse::reset() {
    version = "HTTP/1.1";
    status_code = 200;
    status_text = "OK";
    headers.clear();
    body.clear();
}

void HttpResponse::set_status(int code, const std::string& text) {
    status_code = code;
    status_text = text;
}

void HttpResponse::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(ToLower(name), value);
}

void HttpResponse::set_body(const std::string& data) {
    body = data;
}

bool HttpResponse::wants_close() const {
    return connection_has_token(headers, "close");
}

const char* status_reason(int code) {
    switch (code) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

} // namespace protocol
} // namespace rpc_snoop

// 文件结束

// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: protocol_utils.hpp
//  描述: Protocol模块公共工具函数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <strings.h>

namespace rpc_snoop {
namespace protocol {

// 大小写不敏感字符串比较
inline int StrCaseCmp(const char* a, const char* b) {
    return strcasecmp(a, b);
}

// 转小写（ASCII）
inline std::string ToLower(const std::string& str) {
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// 去除首尾空白（空格与制表符）
inline std::string TrimWhitespace(const std::string& str) {
    size_t start = 0;
    size_t end = str.size();
    while (start < end && (str[start] == ' ' || str[start] == '\t')) {
        ++start;
    }
    while (end > start && (str[end - 1] == ' ' || str[end - 1] == '\t')) {
        --end;
    }
    return str.substr(start, end - start);
}

// RFC 7230 token字符
inline bool IsTokenChar(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'':
        case '*': case '+': case '-': case '.': case '^': case '_':
        case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

// 头部名称合法：非空且全部为token字符
inline bool IsValidHeaderName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (unsigned char c : name) {
        if (!IsTokenChar(c)) {
            return false;
        }
    }
    return true;
}

// 头部值合法：不含CR/LF/NUL等控制字符（允许HTAB）
inline bool IsValidHeaderValue(const std::string& value) {
    for (unsigned char c : value) {
        if ((c < 0x20 && c != '\t') || c == 0x7F) {
            return false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace rpc_snoop

// =============================================================================
//  JSON-RPC Snoop - Utils Module
//  文件: color.hpp
//  描述: 终端前景色转义序列与逐行着色
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <string>

namespace rpc_snoop {
namespace utils {

// ANSI前景色
constexpr const char* ANSI_FG_CYAN = "\x1b[36m";
constexpr const char* ANSI_FG_RED = "\x1b[31m";
constexpr const char* ANSI_FG_GREEN = "\x1b[32m";
constexpr const char* ANSI_FG_WHITE = "\x1b[37m";
constexpr const char* ANSI_FG_RESET = "\x1b[39m";

// 调色板：禁用颜色时所有字段均为空串
struct ColorPalette {
    std::string info;     // 请求
    std::string success;  // 正常响应
    std::string error;    // JSON-RPC错误响应/内部错误
    std::string muted;    // 被丢弃的报文
    std::string reset;

    explicit ColorPalette(bool enabled);
};

// 逐行着色：每行输出 color + line + reset + "\n"
// 按'\n'切分，末尾的'\n'会产生一个空行
std::string color_treat(const std::string& multi_line, const std::string& color,
                        const std::string& reset);

// 去除ANSI CSI转义序列（ESC '[' ... 终止字节）
std::string strip_ansi(const std::string& text);

} // namespace utils
} // namespace rpc_snoop

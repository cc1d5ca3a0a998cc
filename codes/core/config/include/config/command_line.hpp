// =============================================================================
//  JSON-RPC Snoop - Config Module
//  文件: command_line.hpp
//  描述: 命令行解析（getopt_long）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "config/config.hpp"
#include "utils/error.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace rpc_snoop {
namespace config {

// 命令行中出现过的选项；未出现的保持配置文件或默认值
struct CommandLineOptions {
    std::string config_file;
    std::string endpoint;

    bool has_bind_address;
    std::string bind_address;
    bool has_port;
    uint16_t port;

    bool log_headers;
    bool no_color;

    std::vector<SuppressEntry> suppress_methods;
    std::vector<SuppressEntry> suppress_paths;

    bool has_drop_request_rate;
    double drop_request_rate;
    bool has_drop_response_rate;
    double drop_response_rate;
    bool has_drop_delay;
    double drop_delay_seconds;
    bool has_seed;
    uint64_t seed;

    bool fix_geth_attach;
    std::vector<std::string> rpc_modules;

    bool has_log_level;
    std::string log_level;
    bool has_log_file;
    std::string log_file;

    CommandLineOptions();
};

class CommandLine {
public:
    enum class Action {
        RUN = 0,
        HELP = 1,
        VERSION = 2
    };

    CommandLine();
    ~CommandLine();

    /**
     * @brief 解析命令行，可重复调用
     * @param argc 参数个数
     * @param argv 参数数组（getopt_long可能调整其顺序）
     * @return 要执行的动作；用法错误返回INVALID_ARGUMENT及说明
     */
    utils::Result<Action> parse(int argc, char* argv[]);

    const CommandLineOptions& options() const;

    /**
     * @brief 把命令行选项覆盖到配置上
     */
    void apply(Config* config) const;

    /**
     * @brief 用法说明（包含LINES/TYPE说明）
     */
    static std::string usage(const std::string& program);

    static const char* version();

private:
    CommandLineOptions options_;
};

} // namespace config
} // namespace rpc_snoop

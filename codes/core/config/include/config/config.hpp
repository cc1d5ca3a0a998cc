// =============================================================================
//  JSON-RPC Snoop - Config Module
//  文件: config.hpp
//  描述: 代理配置定义（启动后只读）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace rpc_snoop {
namespace config {

// 抑制规则作用方向
enum class SuppressScope {
    REQUEST_ONLY = 0,
    RESPONSE_ONLY = 1,
    ALL = 2
};

// 返回 "REQUEST" / "RESPONSE" / "ALL"
const char* suppress_scope_to_string(SuppressScope scope);

// 大小写不敏感解析 REQUEST / RESPONSE / ALL
bool parse_suppress_scope(const std::string& text, SuppressScope* scope);

// 抑制规则
// lines < 0 完全不输出；lines = 0 只输出标题行；lines > 0 最多输出lines行报文体
struct SuppressRule {
    int32_t lines;
    SuppressScope scope;

    SuppressRule();
    SuppressRule(int32_t lines_value, SuppressScope scope_value);
};

using SuppressTable = std::map<std::string, SuppressRule>;

struct SuppressEntry {
    std::string key;
    SuppressRule rule;
};

// 解析 KEY[:LINES][:TYPE]
// 只有一个附加字段时先尝试按TYPE解析，再按LINES解析
utils::Result<SuppressEntry> parse_suppress_value(const std::string& value);

// 监听配置
struct ListenConfig {
    std::string ip;
    uint16_t port;

    ListenConfig();
};

// 输出配置
struct DisplayConfig {
    bool log_headers;
    bool color;

    DisplayConfig();
};

// 抑制配置
struct SuppressConfig {
    SuppressTable methods;
    SuppressTable paths;
};

// 随机丢包配置
struct ChaosConfig {
    double drop_request_rate;    // [0,1]
    double drop_response_rate;   // [0,1]
    double drop_delay_seconds;
    bool has_seed;
    uint64_t seed;

    ChaosConfig();
};

// rpc_modules覆盖配置
struct RpcModulesOverrideConfig {
    bool enabled;
    std::vector<std::string> modules;

    RpcModulesOverrideConfig();
};

// 日志配置
struct LoggingConfig {
    std::string level;
    std::string file;

    LoggingConfig();
};

// 默认覆盖模块列表 eth,net,web3
const std::vector<std::string>& default_rpc_modules();

// 百分比[0,100]转概率
utils::Result<double> percent_to_probability(int64_t percent);

// 主配置类
class Config {
public:
    Config();
    ~Config();

    // 从JSON文件加载配置
    utils::Result<void> load_from_file(const std::string& config_path);

    // 从JSON字符串加载配置，缺失或类型不符的字段保持原值
    utils::Result<void> load_from_string(const std::string& json_str);

    // 验证配置
    utils::Result<void> validate() const;

    // 获取配置项
    const std::string& get_endpoint() const;
    const ListenConfig& get_listen() const;
    const DisplayConfig& get_display() const;
    const SuppressConfig& get_suppress() const;
    const ChaosConfig& get_chaos() const;
    const RpcModulesOverrideConfig& get_rpc_modules_override() const;
    const LoggingConfig& get_logging() const;

    // 设置配置项
    void set_endpoint(const std::string& endpoint);
    void set_listen(const ListenConfig& listen);
    void set_display(const DisplayConfig& display);
    void set_suppress(const SuppressConfig& suppress);
    void set_chaos(const ChaosConfig& chaos);
    void set_rpc_modules_override(const RpcModulesOverrideConfig& override_config);
    void set_logging(const LoggingConfig& logging);

    // 重置为默认配置
    void reset();

private:
    std::string endpoint_;
    ListenConfig listen_;
    DisplayConfig display_;
    SuppressConfig suppress_;
    ChaosConfig chaos_;
    RpcModulesOverrideConfig rpc_modules_override_;
    LoggingConfig logging_;
};

} // namespace config
} // namespace rpc_snoop

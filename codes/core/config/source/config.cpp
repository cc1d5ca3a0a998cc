#include "config/config.hpp"
#include "protocol/uri.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include "nlohmann/json.hpp"

namespace rpc_snoop {
namespace config {

using Json = nlohmann::json;
using utils::ErrorCode;
using utils::Result;

namespace details {

// 解析带符号十进制整数，要求整个字符串都是数字
bool ParseInt32(const std::string& text, int32_t* out) {
    if (text.empty()) {
        return false;
    }
    size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (start == text.size()) {
        return false;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    errno = 0;
    long long value = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE || value < INT32_MIN || value > INT32_MAX) {
        return false;
    }
    *out = static_cast<int32_t>(value);
    return true;
}

// 解析抑制规则列表（字符串数组，每项 KEY[:LINES][:TYPE]）
Result<void> ParseSuppressList(const Json& j, const char* name, SuppressTable& table) {
    if (!j.is_array()) {
        LOG_WARN("Config", "suppress.%s is not an array, ignored", name);
        return utils::make_ok();
    }
    for (const auto& item : j) {
        if (!item.is_string()) {
            return utils::make_err(ErrorCode::CONFIG_INVALID_SUPPRESS,
                                   std::string("suppress.") + name + " entries must be strings");
        }
        auto entry = parse_suppress_value(item.get<std::string>());
        if (entry.is_err()) {
            return utils::make_err(entry.error_code(), entry.error_message());
        }
        table[entry.value().key] = entry.value().rule;
    }
    return utils::make_ok();
}

// 解析百分比字段
Result<void> ParseRate(const Json& j, const char* name, double& rate) {
    if (!j.contains(name) || !j[name].is_number_integer()) {
        return utils::make_ok();
    }
    auto prob = percent_to_probability(j[name].get<int64_t>());
    if (prob.is_err()) {
        return utils::make_err(prob.error_code(), std::string("chaos.") + name + ": " +
                               prob.error_message());
    }
    rate = prob.value();
    return utils::make_ok();
}

// 解析ListenConfig
Result<void> ParseListenConfig(const Json& j, ListenConfig& cfg) {
    if (j.contains("ip") && j["ip"].is_string()) {
        cfg.ip = j["ip"].get<std::string>();
    }
    if (j.contains("port") && j["port"].is_number_integer()) {
        int64_t port = j["port"].get<int64_t>();
        if (port <= 0 || port > 65535) {
            return utils::make_err(ErrorCode::CONFIG_INVALID_PORT,
                                   "listen.port out of range: " + std::to_string(port));
        }
        cfg.port = static_cast<uint16_t>(port);
    }
    return utils::make_ok();
}

// 解析DisplayConfig
void ParseDisplayConfig(const Json& j, DisplayConfig& cfg) {
    if (j.contains("log_headers") && j["log_headers"].is_boolean()) {
        cfg.log_headers = j["log_headers"].get<bool>();
    }
    if (j.contains("color") && j["color"].is_boolean()) {
        cfg.color = j["color"].get<bool>();
    }
}

// 解析SuppressConfig
Result<void> ParseSuppressConfig(const Json& j, SuppressConfig& cfg) {
    if (j.contains("methods")) {
        auto ret = ParseSuppressList(j["methods"], "methods", cfg.methods);
        if (ret.is_err()) {
            return ret;
        }
    }
    if (j.contains("paths")) {
        auto ret = ParseSuppressList(j["paths"], "paths", cfg.paths);
        if (ret.is_err()) {
            return ret;
        }
    }
    return utils::make_ok();
}

// 解析ChaosConfig
Result<void> ParseChaosConfig(const Json& j, ChaosConfig& cfg) {
    auto ret = ParseRate(j, "drop_request_rate", cfg.drop_request_rate);
    if (ret.is_err()) {
        return ret;
    }
    ret = ParseRate(j, "drop_response_rate", cfg.drop_response_rate);
    if (ret.is_err()) {
        return ret;
    }
    if (j.contains("drop_delay_seconds") && j["drop_delay_seconds"].is_number()) {
        cfg.drop_delay_seconds = j["drop_delay_seconds"].get<double>();
    }
    if (j.contains("seed") && j["seed"].is_number_unsigned()) {
        cfg.seed = j["seed"].get<uint64_t>();
        cfg.has_seed = true;
    }
    return utils::make_ok();
}

// 解析RpcModulesOverrideConfig
void ParseRpcModulesOverrideConfig(const Json& j, RpcModulesOverrideConfig& cfg) {
    if (j.contains("enabled") && j["enabled"].is_boolean()) {
        cfg.enabled = j["enabled"].get<bool>();
    }
    if (j.contains("modules") && j["modules"].is_array()) {
        cfg.modules.clear();
        for (const auto& module : j["modules"]) {
            if (module.is_string()) {
                cfg.modules.push_back(module.get<std::string>());
            }
        }
    }
    if (cfg.enabled && cfg.modules.empty()) {
        cfg.modules = default_rpc_modules();
    }
}

// 解析LoggingConfig
void ParseLoggingConfig(const Json& j, LoggingConfig& cfg) {
    if (j.contains("level") && j["level"].is_string()) {
        cfg.level = j["level"].get<std::string>();
    }
    if (j.contains("file") && j["file"].is_string()) {
        cfg.file = j["file"].get<std::string>();
    }
}

} // namespace details

// ==================== 抑制规则 ====================

const char* suppress_scope_to_string(SuppressScope scope) {
    switch (scope) {
        case SuppressScope::REQUEST_ONLY:
            return "REQUEST";
        case SuppressScope::RESPONSE_ONLY:
            return "RESPONSE";
        case SuppressScope::ALL:
            return "ALL";
    }
    return "ALL";
}

bool parse_suppress_scope(const std::string& text, SuppressScope* scope) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper += static_cast<char>((c >= 'a' && c <= 'z') ? c - 'a' + 'A' : c);
    }
    if (upper == "REQUEST") {
        *scope = SuppressScope::REQUEST_ONLY;
    } else if (upper == "RESPONSE") {
        *scope = SuppressScope::RESPONSE_ONLY;
    } else if (upper == "ALL") {
        *scope = SuppressScope::ALL;
    } else {
        return false;
    }
    return true;
}

SuppressRule::SuppressRule()
    : lines(-1)
    , scope(SuppressScope::ALL)
{
}

SuppressRule::SuppressRule(int32_t lines_value, SuppressScope scope_value)
    : lines(lines_value)
    , scope(scope_value)
{
}

Result<SuppressEntry> parse_suppress_value(const std::string& value) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t colon = value.find(':', start);
        if (colon == std::string::npos) {
            fields.push_back(value.substr(start));
            break;
        }
        fields.push_back(value.substr(start, colon - start));
        start = colon + 1;
    }

    auto invalid = [&value](const std::string& reason) {
        return utils::make_err<SuppressEntry>(ErrorCode::CONFIG_INVALID_SUPPRESS,
                                              "invalid suppress value '" + value + "': " + reason);
    };

    if (fields.size() > 3) {
        return invalid("too many ':' separated fields");
    }
    if (fields[0].empty()) {
        return invalid("missing name");
    }

    SuppressEntry entry;
    entry.key = fields[0];

    if (fields.size() == 2) {
        if (!parse_suppress_scope(fields[1], &entry.rule.scope) &&
            !details::ParseInt32(fields[1], &entry.rule.lines)) {
            return invalid("expected LINES or TYPE after ':'");
        }
    } else if (fields.size() == 3) {
        if (!details::ParseInt32(fields[1], &entry.rule.lines)) {
            return invalid("LINES must be an integer");
        }
        if (!parse_suppress_scope(fields[2], &entry.rule.scope)) {
            return invalid("TYPE must be one of REQUEST, RESPONSE, ALL");
        }
    }
    return utils::make_ok(std::move(entry));
}

// ==================== 子配置默认值 ====================

// ListenConfig
ListenConfig::ListenConfig()
    : ip("127.0.0.1")
    , port(3000)
{
}

// DisplayConfig
DisplayConfig::DisplayConfig()
    : log_headers(false)
    , color(true)
{
}

// ChaosConfig
ChaosConfig::ChaosConfig()
    : drop_request_rate(0.0)
    , drop_response_rate(0.0)
    , drop_delay_seconds(12.0)
    , has_seed(false)
    , seed(0)
{
}

// RpcModulesOverrideConfig
RpcModulesOverrideConfig::RpcModulesOverrideConfig()
    : enabled(false)
{
}

// LoggingConfig
LoggingConfig::LoggingConfig()
    : level("WARN")
{
}

const std::vector<std::string>& default_rpc_modules() {
    static const std::vector<std::string> modules = {"eth", "net", "web3"};
    return modules;
}

Result<double> percent_to_probability(int64_t percent) {
    if (percent < 0 || percent > 100) {
        return utils::make_err<double>(ErrorCode::CONFIG_INVALID_VALUE,
                                       "rate must be within [0..100], got " +
                                       std::to_string(percent));
    }
    return utils::make_ok(static_cast<double>(percent) / 100.0);
}

// ==================== Config ====================

Config::Config() {
    reset();
}

Config::~Config() {
}

Result<void> Config::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return utils::make_err(ErrorCode::FILE_NOT_FOUND,
                               "cannot open config file: " + config_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return utils::make_err(ErrorCode::FILE_READ_ERROR,
                               "failed to read config file: " + config_path);
    }
    return load_from_string(buffer.str());
}

Result<void> Config::load_from_string(const std::string& json_str) {
    Json j = Json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
        return utils::make_err(ErrorCode::CONFIG_PARSE_ERROR, "config is not valid JSON");
    }
    if (!j.is_object()) {
        return utils::make_err(ErrorCode::CONFIG_PARSE_ERROR, "config root must be an object");
    }

    // 解析endpoint
    if (j.contains("endpoint") && j["endpoint"].is_string()) {
        endpoint_ = j["endpoint"].get<std::string>();
    }

    // 解析listen
    if (j.contains("listen") && j["listen"].is_object()) {
        auto ret = details::ParseListenConfig(j["listen"], listen_);
        if (ret.is_err()) {
            return ret;
        }
    }

    // 解析display
    if (j.contains("display") && j["display"].is_object()) {
        details::ParseDisplayConfig(j["display"], display_);
    }

    // 解析suppress
    if (j.contains("suppress") && j["suppress"].is_object()) {
        auto ret = details::ParseSuppressConfig(j["suppress"], suppress_);
        if (ret.is_err()) {
            return ret;
        }
    }

    // 解析chaos
    if (j.contains("chaos") && j["chaos"].is_object()) {
        auto ret = details::ParseChaosConfig(j["chaos"], chaos_);
        if (ret.is_err()) {
            return ret;
        }
    }

    // 解析rpc_modules_override
    if (j.contains("rpc_modules_override") && j["rpc_modules_override"].is_object()) {
        details::ParseRpcModulesOverrideConfig(j["rpc_modules_override"], rpc_modules_override_);
    }

    // 解析logging
    if (j.contains("logging") && j["logging"].is_object()) {
        details::ParseLoggingConfig(j["logging"], logging_);
    }

    return utils::make_ok();
}

Result<void> Config::validate() const {
    if (endpoint_.empty()) {
        return utils::make_err(ErrorCode::CONFIG_MISSING_REQUIRED, "RPC_ENDPOINT is required");
    }
    auto uri = protocol::Uri::parse(endpoint_);
    if (uri.is_err()) {
        return utils::make_err(ErrorCode::CONFIG_INVALID_URI, uri.error_message());
    }
    if (listen_.port == 0) {
        return utils::make_err(ErrorCode::CONFIG_INVALID_PORT, "port must not be 0");
    }
    if (chaos_.drop_request_rate < 0.0 || chaos_.drop_request_rate > 1.0 ||
        chaos_.drop_response_rate < 0.0 || chaos_.drop_response_rate > 1.0) {
        return utils::make_err(ErrorCode::CONFIG_INVALID_VALUE,
                               "drop rates must be within [0..100]");
    }
    if (!(chaos_.drop_delay_seconds >= 0.0)) {
        return utils::make_err(ErrorCode::CONFIG_INVALID_VALUE,
                               "drop delay must not be negative");
    }
    const std::vector<std::string>& modules = rpc_modules_override_.modules;
    for (auto it = modules.begin(); it != modules.end(); ++it) {
        if (std::find(modules.begin(), it, *it) != it) {
            return utils::make_err(ErrorCode::CONFIG_INVALID_VALUE,
                                   "duplicate rpc module: " + *it);
        }
    }
    utils::LogLevel level;
    if (!utils::parse_log_level(logging_.level, &level)) {
        return utils::make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL,
                               "unknown log level: " + logging_.level);
    }
    return utils::make_ok();
}

const std::string& Config::get_endpoint() const {
    return endpoint_;
}

const ListenConfig& Config::get_listen() const {
    return listen_;
}

const DisplayConfig& Config::get_display() const {
    return display_;
}

const SuppressConfig& Config::get_suppress() const {
    return suppress_;
}

const ChaosConfig& Config::get_chaos() const {
    return chaos_;
}

const RpcModulesOverrideConfig& Config::get_rpc_modules_override() const {
    return rpc_modules_override_;
}

const LoggingConfig& Config::get_logging() const {
    return logging_;
}

void Config::set_endpoint(const std::string& endpoint) {
    endpoint_ = endpoint;
}

void Config::set_listen(const ListenConfig& listen) {
    listen_ = listen;
}

void Config::set_display(const DisplayConfig& display) {
    display_ = display;
}

void Config::set_suppress(const SuppressConfig& suppress) {
    suppress_ = suppress;
}

void Config::set_chaos(const ChaosConfig& chaos) {
    chaos_ = chaos;
}

void Config::set_rpc_modules_override(const RpcModulesOverrideConfig& override_config) {
    rpc_modules_override_ = override_config;
}

void Config::set_logging(const LoggingConfig& logging) {
    logging_ = logging;
}

void Config::reset() {
    endpoint_.clear();
    listen_ = ListenConfig();
    display_ = DisplayConfig();
    suppress_ = SuppressConfig();
    chaos_ = ChaosConfig();
    rpc_modules_override_ = RpcModulesOverrideConfig();
    logging_ = LoggingConfig();
}

} // namespace config
} // namespace rpc_snoop

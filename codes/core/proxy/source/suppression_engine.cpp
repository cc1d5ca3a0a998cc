// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: suppression_engine.cpp
//  描述: 抑制规则匹配与报文体截断
//  版权: Copyright (c) 2026
// =============================================================================
#include "proxy/suppression_engine.hpp"
#include <vector>

namespace rpc_snoop {
namespace proxy {

namespace {

// 按'\n'切分，末尾换行不产生额外的空行
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

} // namespace

SuppressDecision::SuppressDecision()
    : limited(false)
    , line_limit(0)
{
}

SuppressDecision SuppressDecision::full() {
    return SuppressDecision();
}

SuppressDecision SuppressDecision::limit(int32_t lines, const std::string& label) {
    SuppressDecision decision;
    decision.limited = true;
    decision.line_limit = lines;
    decision.label = label;
    return decision;
}

SuppressionEngine::SuppressionEngine(const config::SuppressConfig& config)
    : config_(config)
{
}

SuppressDecision SuppressionEngine::decide(Direction direction,
                                           const std::string* rpc_method,
                                           const std::string& request_path,
                                           const PacketType& request_type,
                                           const PacketType& response_type) const {
    // 被丢弃的交换总是完整输出
    if (request_type.is_dropped() || response_type.is_dropped()) {
        return SuppressDecision::full();
    }

    if (rpc_method != nullptr) {
        auto it = config_.methods.find(*rpc_method);
        if (it != config_.methods.end() && scope_matches(it->second.scope, direction)) {
            return SuppressDecision::limit(it->second.lines, "[method " + *rpc_method + "]");
        }
    }

    auto it = config_.paths.find(request_path);
    if (it != config_.paths.end() && scope_matches(it->second.scope, direction)) {
        return SuppressDecision::limit(it->second.lines, request_path);
    }

    return SuppressDecision::full();
}

std::string SuppressionEngine::trim_json(const std::string& json, int32_t limit) {
    if (limit <= 0) {
        return std::string();
    }

    std::vector<std::string> lines = split_lines(json);
    size_t n = static_cast<size_t>(limit);
    if (n >= lines.size()) {
        return json;
    }

    size_t head = (n + 1) / 2;
    size_t tail = n / 2;

    std::string result;
    for (size_t i = 0; i < head; ++i) {
        result += lines[i];
        result += '\n';
    }
    result += "...";
    for (size_t i = lines.size() - tail; i < lines.size(); ++i) {
        result += '\n';
        result += lines[i];
    }
    return result;
}

} // namespace proxy
} // namespace rpc_snoop

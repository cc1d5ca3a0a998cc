#include "proxy/rpc_modules_override.hpp"
#include "protocol/protocol_types.hpp"
#include "nlohmann/json.hpp"

namespace rpc_snoop {
namespace proxy {

using Json = nlohmann::ordered_json;

RpcModulesOverride::RpcModulesOverride(const config::RpcModulesOverrideConfig& config)
    : config_(config)
{
}

bool RpcModulesOverride::applies(const std::string* rpc_method) const {
    return config_.enabled && rpc_method != nullptr && *rpc_method == RPC_MODULES_METHOD;
}

std::string RpcModulesOverride::make_body(const std::vector<std::string>& modules) {
    Json result = Json::object();
    for (const auto& module : modules) {
        result[module] = "1.0";
    }

    Json body = Json::object();
    body["jsonrpc"] = "2.0";
    body["result"] = std::move(result);
    body["id"] = 1;
    return body.dump(-1, ' ', false, Json::error_handler_t::replace);
}

protocol::HttpResponse RpcModulesOverride::synthesize() const {
    protocol::HttpResponse response;
    response.set_status(200, protocol::status_reason(200));
    response.add_header(protocol::HEADER_CONTENT_TYPE, "application/json");
    response.set_body(make_body(config_.modules));
    return response;
}

} // namespace proxy
} // namespace rpc_snoop

#include "proxy/json_rpc.hpp"
#include "nlohmann/json.hpp"

namespace rpc_snoop {
namespace proxy {

using Json = nlohmann::ordered_json;

namespace {

// 不抛异常地解析，失败时返回discarded值
// 超过MAX_JSON_DEPTH的容器不保留，too_deep置位
Json parse_quiet(const std::string& text, bool* too_deep = nullptr) {
    if (too_deep) {
        *too_deep = false;
    }
    Json::parser_callback_t limit_depth =
        [too_deep](int depth, Json::parse_event_t event, Json&) {
            if (depth < MAX_JSON_DEPTH) {
                return true;
            }
            if (event == Json::parse_event_t::object_start ||
                event == Json::parse_event_t::array_start) {
                if (too_deep) {
                    *too_deep = true;
                }
                return false;
            }
            return true;
        };
    return Json::parse(text, limit_depth, false);
}

std::string dump_pretty(const Json& j) {
    return j.dump(2, ' ', false, Json::error_handler_t::replace);
}

} // namespace

std::string render_display_json(const std::string& body) {
    if (body.empty()) {
        return "null";
    }
    bool too_deep = false;
    Json j = parse_quiet(body, &too_deep);
    if (j.is_discarded() || too_deep) {
        return body;
    }
    return dump_pretty(j);
}

bool sniff_rpc_request(const std::string& text, std::string* method) {
    Json j = parse_quiet(text);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }
    auto id = j.find("id");
    auto jsonrpc = j.find("jsonrpc");
    auto m = j.find("method");
    if (id == j.end() || !id->is_number() ||
        jsonrpc == j.end() || !jsonrpc->is_string() ||
        m == j.end() || !m->is_string()) {
        return false;
    }
    auto params = j.find("params");
    if (params != j.end() && !params->is_array()) {
        return false;
    }
    if (method) {
        *method = m->get<std::string>();
    }
    return true;
}

bool is_rpc_error_response(const std::string& text) {
    Json j = parse_quiet(text);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }
    auto id = j.find("id");
    auto jsonrpc = j.find("jsonrpc");
    auto error = j.find("error");
    if (id == j.end() || !id->is_number() ||
        jsonrpc == j.end() || !jsonrpc->is_string() ||
        error == j.end() || !error->is_object()) {
        return false;
    }
    auto code = error->find("code");
    auto message = error->find("message");
    return code != error->end() && code->is_number() &&
           message != error->end() && message->is_string();
}

std::string make_internal_error_body(const std::string& phase, const std::string& cause) {
    Json error = Json::object();
    error["code"] = JSON_RPC_INTERNAL_ERROR;
    error["message"] = phase + ": " + cause;

    Json body = Json::object();
    body["id"] = 1;
    body["jsonrpc"] = "2.0";
    body["error"] = std::move(error);
    return dump_pretty(body);
}

} // namespace proxy
} // namespace rpc_snoop

// =============================================================================
//  JSON-RPC Snoop - Proxy Module
//  文件: exchange_handler.cpp
//  描述: 交换处理流水线实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "proxy/exchange_handler.hpp"
#include "protocol/protocol_types.hpp"
#include "proxy/json_rpc.hpp"
#include "utils/logger.hpp"
#include <exception>

namespace rpc_snoop {
namespace proxy {

namespace {

const char* const PHASE_REQUEST = "processing request";
const char* const PHASE_RESPONSE = "processing response";

} // namespace

ExchangeOutcome::ExchangeOutcome()
    : dropped(false)
{
}

ExchangeHandler::ExchangeHandler(ProxyContext* context,
                                 protocol::HttpTransport* transport,
                                 Presenter* presenter,
                                 ExchangeStatistics* statistics)
    : presenter_(presenter)
    , statistics_(statistics)
    , forwarder_(context)
    , retriever_(transport)
    , chaos_gate_(context)
    , suppression_(context->config().get_suppress())
    , override_(context->config().get_rpc_modules_override())
{
}

ExchangeHandler::~ExchangeHandler() {
}

protocol::HttpResponse ExchangeHandler::make_error_response(const std::string& phase,
                                                            const std::string& cause) {
    protocol::HttpResponse response;
    response.set_status(500, protocol::status_reason(500));
    response.add_header(protocol::HEADER_CONTENT_TYPE, "application/json");
    response.set_body(make_internal_error_body(phase, cause));
    return response;
}

ExchangeOutcome ExchangeHandler::handle(const protocol::HttpRequest& inbound) {
    statistics_->record_exchange();

    // 交换边界：任何异常都转换为500响应，不离开会话线程
    const char* phase = PHASE_REQUEST;
    try {
        return process(inbound, &phase);
    } catch (const std::exception& e) {
        LOG_ERROR("Proxy", "Exchange for %s failed while %s: %s",
                  inbound.target.c_str(), phase, e.what());
        if (phase == PHASE_REQUEST) {
            statistics_->record_request_error();
        } else {
            statistics_->record_response_error();
        }
        ExchangeOutcome outcome;
        outcome.response = make_error_response(phase, e.what());
        presenter_->present_internal_error(outcome.response.body);
        return outcome;
    }
}

void ExchangeHandler::cancel_pending_waits() {
    chaos_gate_.cancel_waits();
}

ExchangeOutcome ExchangeHandler::process(const protocol::HttpRequest& inbound,
                                         const char** phase) {
    ExchangeOutcome outcome;

    // ========== 请求方向 ==========
    auto forwarded = forwarder_.forward(inbound);
    if (forwarded.is_err()) {
        LOG_WARN("Proxy", "Failed to build request for %s: %s",
                 inbound.target.c_str(), forwarded.error_message().c_str());
        statistics_->record_request_error();
        outcome.response = make_error_response(PHASE_REQUEST, forwarded.error_message());
        presenter_->present_internal_error(outcome.response.body);
        return outcome;
    }
    const ForwardedRequest& request = forwarded.value();

    std::string request_path;
    std::string query;
    bool has_query = false;
    if (!RequestForwarder::split_target(inbound.target, &request_path, &has_query, &query)) {
        request_path = inbound.path();
    }

    std::string method;
    const std::string* rpc_method = nullptr;
    if (sniff_rpc_request(inbound.body, &method)) {
        rpc_method = &method;
    } else if (!inbound.body.empty()) {
        LOG_WARN("Proxy", "Request body for %s is not a JSON-RPC call", request_path.c_str());
    }

    // 两个方向都先抽取，请求输出时需要知道响应是否会被丢弃
    PacketType request_type = chaos_gate_.classify_request();
    PacketType response_type = chaos_gate_.classify_response();

    PresentRecord request_record;
    request_record.type = request_type;
    request_record.json = request.display_json;
    request_record.headers = request.request.headers;
    request_record.message = request_path;
    presenter_->present(request_record,
                        suppression_.decide(Direction::REQUEST, rpc_method, request_path,
                                            request_type, response_type));

    if (request_type.is_dropped()) {
        LOG_DEBUG("Proxy", "Dropping request %s after %.1fs", request_path.c_str(),
                  request_type.delay_seconds());
        statistics_->record_request_dropped();
        chaos_gate_.wait(request_type);
        outcome.dropped = true;
        return outcome;
    }

    // ========== 响应方向 ==========
    *phase = PHASE_RESPONSE;
    std::string response_json;
    if (override_.applies(rpc_method)) {
        statistics_->record_overridden();
        outcome.response = override_.synthesize();
        response_json = render_display_json(outcome.response.body);
    } else {
        auto retrieved = retriever_.retrieve(request);
        if (retrieved.is_err()) {
            statistics_->record_response_error();
            outcome.response = make_error_response(PHASE_RESPONSE, retrieved.error_message());
            response_json = outcome.response.body;
        } else {
            statistics_->record_forwarded();
            RetrievedResponse& value = retrieved.value();
            outcome.response = std::move(value.response);
            response_json = std::move(value.display_json);
        }
    }

    PresentRecord response_record;
    response_record.type = response_type;
    response_record.json = response_json;
    response_record.headers = outcome.response.headers;
    response_record.status = outcome.response.status_code;
    presenter_->present(response_record,
                        suppression_.decide(Direction::RESPONSE, rpc_method, request_path,
                                            request_type, response_type));

    if (response_type.is_dropped()) {
        LOG_DEBUG("Proxy", "Dropping response for %s after %.1fs", request_path.c_str(),
                  response_type.delay_seconds());
        statistics_->record_response_dropped();
        chaos_gate_.wait(response_type);
        outcome.dropped = true;
        outcome.response.reset();
        return outcome;
    }
    return outcome;
}

} // namespace proxy
} // namespace rpc_snoop

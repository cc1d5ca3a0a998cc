#include "proxy/presenter.hpp"
#include "proxy/json_rpc.hpp"
#include <cstdio>

namespace rpc_snoop {
namespace proxy {

namespace {

// 头部值加引号输出，转义引号、反斜杠和不可见字符
std::string quote_header_value(const std::string& value) {
    std::string result;
    result.reserve(value.size() + 2);
    result += '"';
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == '"' || c == '\\') {
            result += '\\';
            result += ch;
        } else if (c < 0x20 || c >= 0x7F) {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "\\x%02x", static_cast<unsigned>(c));
            result += hex;
        } else {
            result += ch;
        }
    }
    result += '"';
    return result;
}

} // namespace

PresentRecord::PresentRecord()
    : type(PacketType::request())
    , status(0)
{
}

Presenter::Presenter(const config::DisplayConfig& display, std::ostream* out,
                     const utils::TimeSource* time_source)
    : log_headers_(display.log_headers)
    , palette_(display.color)
    , out_(out)
    , time_source_(time_source ? time_source : &utils::DefaultTimeSource::instance())
{
}

const std::string& Presenter::body_color(const PacketType& type,
                                         const std::string& full_json) const {
    switch (type.kind()) {
        case PacketType::Kind::REQUEST:
            return palette_.info;
        case PacketType::Kind::RESPONSE:
            return is_rpc_error_response(full_json) ? palette_.error : palette_.success;
        case PacketType::Kind::REQUEST_DROPPED:
        case PacketType::Kind::RESPONSE_DROPPED:
            return palette_.muted;
    }
    return palette_.muted;
}

std::string Presenter::render_headers(const protocol::HttpHeaders& headers) const {
    if (!log_headers_ || headers.empty()) {
        return std::string();
    }
    std::string result = "headers:\n";
    for (const auto& header : headers) {
        result += "    (";
        result += header.first;
        result += ',';
        result += quote_header_value(header.second);
        result += ")\n";
    }
    return result;
}

std::string Presenter::render(const PresentRecord& record, const SuppressDecision& decision) const {
    if (decision.is_suppressed()) {
        return std::string();
    }

    // 请求命中规则时以规则标签代替路径
    std::string message = record.message;
    if (decision.limited && record.type.direction() == Direction::REQUEST) {
        message = decision.label;
    }

    std::string text = utils::format_time_millis(time_source_->get_current_time_ms());
    text += ' ';
    text += record.type.label();
    if (record.status > 0) {
        text += " (status " + std::to_string(record.status) + ")";
    }
    if (!message.empty() && message != "/") {
        text += ' ';
        text += message;
    }
    text += '\n';
    text += render_headers(record.headers);

    if (decision.is_header_only()) {
        return text;
    }

    const std::string& color = body_color(record.type, record.json);
    if (decision.limited) {
        text += utils::color_treat(SuppressionEngine::trim_json(record.json, decision.line_limit),
                                   color, palette_.reset);
    } else {
        text += utils::color_treat(record.json, color, palette_.reset);
    }
    return text;
}

void Presenter::present(const PresentRecord& record, const SuppressDecision& decision) {
    std::string text = render(record, decision);
    if (!text.empty()) {
        write(text);
    }
}

std::string Presenter::render_internal_error(const std::string& error_body) const {
    return utils::color_treat(error_body, palette_.error, palette_.reset);
}

void Presenter::present_internal_error(const std::string& error_body) {
    write(render_internal_error(error_body));
}

void Presenter::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_->write(text.data(), static_cast<std::streamsize>(text.size()));
    out_->flush();
}

} // namespace proxy
} // namespace rpc_snoop

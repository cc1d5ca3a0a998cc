// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: http_parser.cpp
//  描述: HttpParser类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_parser.hpp"
#include "protocol/protocol_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <cerrno>

namespace rpc_snoop {
namespace protocol {

namespace {

// 状态码是否禁止携带报文体
bool status_has_no_body(int code) {
    return (code >= 100 && code < 200) || code == 204 || code == 304;
}

// 解析十进制Content-Length，仅允许数字
bool parse_content_length(const std::string& text, size_t* out) {
    if (text.empty() || text.size() > 19) {
        return false;
    }
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    *out = value;
    return true;
}

// Transfer-Encoding的最后一个编码是否为chunked
bool is_chunked_last(const std::string& value) {
    size_t comma = value.rfind(',');
    std::string last = (comma == std::string::npos) ? value : value.substr(comma + 1);
    return StrCaseCmp(TrimWhitespace(last).c_str(), "chunked") == 0;
}

bool is_framing_header(const std::string& name) {
    return StrCaseCmp(name.c_str(), HEADER_CONTENT_LENGTH) == 0 ||
           StrCaseCmp(name.c_str(), HEADER_TRANSFER_ENCODING) == 0;
}

void append_headers(std::string* out, const HttpHeaders& headers) {
    for (const auto& header : headers) {
        if (is_framing_header(header.first)) {
            continue;
        }
        out->append(header.first);
        out->append(": ");
        out->append(header.second);
        out->append("\r\n");
    }
}

} // namespace

// ==================== HttpParser实现 ====================

HttpParser::HttpParser(Mode mode)
    : mode_(mode)
    , buffer_(nullptr)
    , state_(Http1ParseState::EXPECT_START_LINE)
    , framing_(BodyFraming::NONE)
    , expect_no_body_(false)
    , body_remaining_(0)
    , status_code_(0)
    , error_code_(0)
{
}

HttpParser::~HttpParser() = default;

void HttpParser::init(utils::Buffer* buffer) {
    buffer_ = buffer;
    reset();
}

int HttpParser::parse_request(HttpRequest* req) {
    if (mode_ != Mode::REQUEST) {
        return fail(PROTOCOL_ERROR_INVALID, "Parser is not in request mode");
    }
    int ret = advance();
    if (ret != PROTOCOL_OK) {
        return ret;
    }

    req->method = std::move(method_);
    req->target = std::move(target_);
    req->version = std::move(version_);
    req->headers = std::move(headers_);
    req->body = std::move(body_);
    reset();
    return PROTOCOL_OK;
}

int HttpParser::parse_response(HttpResponse* resp) {
    if (mode_ != Mode::RESPONSE) {
        return fail(PROTOCOL_ERROR_INVALID, "Parser is not in response mode");
    }
    int ret = advance();
    if (ret != PROTOCOL_OK) {
        return ret;
    }

    resp->version = std::move(version_);
    resp->status_code = status_code_;
    resp->status_text = std::move(status_text_);
    resp->headers = std::move(headers_);
    resp->body = std::move(body_);
    // 1xx之后还有最终响应，HEAD标记保留
    bool keep_no_body = expect_no_body_ && status_code_ < 200;
    reset();
    expect_no_body_ = keep_no_body;
    return PROTOCOL_OK;
}

int HttpParser::finish_response(HttpResponse* resp) {
    if (mode_ != Mode::RESPONSE) {
        return fail(PROTOCOL_ERROR_INVALID, "Parser is not in response mode");
    }
    if (state_ == Http1ParseState::EXPECT_BODY && framing_ == BodyFraming::UNTIL_CLOSE) {
        int ret = read_body();
        if (ret != PROTOCOL_OK && ret != PROTOCOL_ERROR_EAGAIN) {
            return ret;
        }
        state_ = Http1ParseState::EXPECT_COMPLETE;
        return parse_response(resp);
    }
    if (!has_partial_message()) {
        return fail(PROTOCOL_ERROR_INCOMPLETE, "Connection closed before response");
    }
    return fail(PROTOCOL_ERROR_INCOMPLETE, "Connection closed in the middle of a response");
}

void HttpParser::set_expect_no_body(bool no_body) {
    expect_no_body_ = no_body;
}

bool HttpParser::has_partial_message() const {
    if (state_ != Http1ParseState::EXPECT_START_LINE) {
        return true;
    }
    return buffer_ != nullptr && buffer_->readable_bytes() > 0;
}

int HttpParser::read_line(std::string* out) {
    if (!buffer_) {
        return fail(PROTOCOL_ERROR_INVALID, "Buffer not initialized");
    }

    size_t pos = buffer_->find_crlf();
    if (pos == utils::Buffer::npos) {
        if (buffer_->readable_bytes() > MAX_HEADER_LINE_LEN) {
            return fail(PROTOCOL_ERROR_TOO_LONG, "Line too long");
        }
        return PROTOCOL_ERROR_EAGAIN;
    }
    if (pos > MAX_HEADER_LINE_LEN) {
        return fail(PROTOCOL_ERROR_TOO_LONG, "Line too long");
    }

    out->assign(reinterpret_cast<const char*>(buffer_->read_ptr()), pos);
    // 消耗缓冲区数据（包含\r\n）
    buffer_->skip(pos + 2);
    return PROTOCOL_OK;
}

int HttpParser::parse_request_line(const std::string& line,
                                   std::string* method,
                                   std::string* target,
                                   std::string* version) {
    method->clear();
    target->clear();
    version->clear();

    // 第一部分: method
    size_t first = line.find(' ');
    if (first == 0 || first == std::string::npos) {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid request line format");
    }
    for (size_t i = 0; i < first; ++i) {
        if (!IsTokenChar(static_cast<unsigned char>(line[i]))) {
            return fail(PROTOCOL_ERROR_INVALID, "Invalid request method");
        }
    }

    // 第二部分: target
    size_t second = line.find(' ', first + 1);
    if (second == std::string::npos || second == first + 1) {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid request line format");
    }

    // 第三部分: version
    std::string ver = line.substr(second + 1);
    if (ver != "HTTP/1.1" && ver != "HTTP/1.0") {
        return fail(PROTOCOL_ERROR_VERSION, "HTTP version not supported");
    }

    *method = line.substr(0, first);
    *target = line.substr(first + 1, second - first - 1);
    *version = ver;
    return PROTOCOL_OK;
}

int HttpParser::parse_status_line(const std::string& line,
                                  std::string* version,
                                  int* code,
                                  std::string* text) {
    // HTTP/1.x SP 3DIGIT [SP reason]
    if (line.size() < 12 || line.compare(0, 7, "HTTP/1.") != 0 || line[8] != ' ') {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid status line format");
    }
    if (line[7] != '0' && line[7] != '1') {
        return fail(PROTOCOL_ERROR_VERSION, "HTTP version not supported");
    }

    int status = 0;
    for (size_t i = 9; i < 12; ++i) {
        if (line[i] < '0' || line[i] > '9') {
            return fail(PROTOCOL_ERROR_INVALID, "Invalid status code");
        }
        status = status * 10 + (line[i] - '0');
    }
    if (status < 100) {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid status code");
    }
    if (line.size() > 12 && line[12] != ' ') {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid status line format");
    }

    *version = line.substr(0, 8);
    *code = status;
    *text = line.size() > 13 ? line.substr(13) : std::string();
    return PROTOCOL_OK;
}

int HttpParser::parse_header(const std::string& line,
                             std::string* key,
                             std::string* value) {
    // 不支持折叠行
    if (!line.empty() && (line[0] == ' ' || line[0] == '\t')) {
        return fail(PROTOCOL_ERROR_INVALID, "Obsolete header line folding");
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid header format");
    }

    std::string name = line.substr(0, colon);
    if (name.size() > MAX_HEADER_NAME_LEN) {
        return fail(PROTOCOL_ERROR_TOO_LONG, "Header name too long");
    }
    if (!IsValidHeaderName(name)) {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid header name");
    }

    std::string val = TrimWhitespace(line.substr(colon + 1));
    if (!IsValidHeaderValue(val)) {
        return fail(PROTOCOL_ERROR_INVALID, "Invalid header value");
    }

    *key = name;
    *value = val;
    return PROTOCOL_OK;
}

std::string HttpParser::serialize_request(const HttpRequest& req) {
    std::string out;
    out.reserve(256 + req.body.size());

    out.append(req.method);
    out.append(" ");
    out.append(req.target.empty() ? "/" : req.target);
    out.append(" ");
    out.append(req.version);
    out.append("\r\n");

    append_headers(&out, req.headers);

    bool had_framing = find_header(req.headers, HEADER_CONTENT_LENGTH, nullptr) ||
                       find_header(req.headers, HEADER_TRANSFER_ENCODING, nullptr);
    if (!req.body.empty() || had_framing) {
        out.append("content-length: ");
        out.append(std::to_string(req.body.size()));
        out.append("\r\n");
    }
    out.append("\r\n");
    out.append(req.body);
    return out;
}

std::string HttpParser::serialize_response(const HttpResponse& resp) {
    std::string out;
    out.reserve(256 + resp.body.size());

    out.append(resp.version.empty() ? "HTTP/1.1" : resp.version);
    out.append(" ");
    out.append(std::to_string(resp.status_code));
    out.append(" ");
    out.append(resp.status_text);
    out.append("\r\n");

    append_headers(&out, resp.headers);

    if (!status_has_no_body(resp.status_code)) {
        out.append("content-length: ");
        out.append(std::to_string(resp.body.size()));
        out.append("\r\n");
    }
    out.append("\r\n");
    out.append(resp.body);
    return out;
}

void HttpParser::set_error(int code, const std::string& msg) {
    error_code_ = code;
    error_msg_ = msg;
}

int HttpParser::get_error_code() const {
    return error_code_;
}

const std::string& HttpParser::get_error_msg() const {
    return error_msg_;
}

void HttpParser::reset() {
    // 保留buffer_指针，只重置解析状态
    state_ = Http1ParseState::EXPECT_START_LINE;
    framing_ = BodyFraming::NONE;
    expect_no_body_ = false;
    body_remaining_ = 0;
    method_.clear();
    target_.clear();
    version_.clear();
    status_code_ = 0;
    status_text_.clear();
    headers_.clear();
    body_.clear();
    error_code_ = 0;
    error_msg_.clear();
}

// ==================== 内部状态机 ====================

int HttpParser::advance() {
    if (!buffer_) {
        return fail(PROTOCOL_ERROR_INVALID, "Buffer not initialized");
    }

    while (true) {
        int ret = PROTOCOL_OK;
        std::string line;

        switch (state_) {
            case Http1ParseState::EXPECT_START_LINE:
                ret = read_line(&line);
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                // 请求之间允许出现多余的空行
                if (line.empty() && mode_ == Mode::REQUEST) {
                    break;
                }
                if (mode_ == Mode::REQUEST) {
                    ret = parse_request_line(line, &method_, &target_, &version_);
                } else {
                    ret = parse_status_line(line, &version_, &status_code_, &status_text_);
                }
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                state_ = Http1ParseState::EXPECT_HEADERS;
                break;

            case Http1ParseState::EXPECT_HEADERS: {
                ret = read_line(&line);
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                // 空行表示头部结束
                if (line.empty()) {
                    ret = on_headers_complete();
                    if (ret != PROTOCOL_OK) {
                        return ret;
                    }
                    break;
                }
                if (headers_.size() >= MAX_HEADERS) {
                    return fail(PROTOCOL_ERROR_TOO_MANY, "Too many headers");
                }
                std::string key;
                std::string value;
                ret = parse_header(line, &key, &value);
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                headers_.emplace_back(ToLower(key), value);
                break;
            }

            case Http1ParseState::EXPECT_BODY:
                ret = read_body();
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                break;

            case Http1ParseState::EXPECT_CHUNK_SIZE:
                ret = read_chunk_size();
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                break;

            case Http1ParseState::EXPECT_CHUNK_DATA:
                ret = read_chunk_data();
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                break;

            case Http1ParseState::EXPECT_CHUNK_TRAILER:
                ret = read_line(&line);
                if (ret != PROTOCOL_OK) {
                    return ret;
                }
                // 尾部头部直接丢弃
                if (line.empty()) {
                    state_ = Http1ParseState::EXPECT_COMPLETE;
                }
                break;

            case Http1ParseState::EXPECT_COMPLETE:
                return PROTOCOL_OK;

            case Http1ParseState::ERROR:
                return error_code_;
        }
    }
}

int HttpParser::on_headers_complete() {
    bool no_body = (mode_ == Mode::RESPONSE) &&
                   (expect_no_body_ || status_has_no_body(status_code_));

    std::string te;
    std::string cl;
    bool has_te = false;
    bool has_cl = false;
    for (const auto& header : headers_) {
        if (header.first == HEADER_TRANSFER_ENCODING) {
            te = has_te ? te + "," + header.second : header.second;
            has_te = true;
        } else if (header.first == HEADER_CONTENT_LENGTH) {
            if (has_cl && cl != header.second) {
                return fail(PROTOCOL_ERROR_INVALID, "Conflicting Content-Length headers");
            }
            cl = header.second;
            has_cl = true;
        }
    }

    if (no_body) {
        framing_ = BodyFraming::NONE;
    } else if (has_te) {
        if (is_chunked_last(te)) {
            framing_ = BodyFraming::CHUNKED;
        } else if (mode_ == Mode::RESPONSE) {
            framing_ = BodyFraming::UNTIL_CLOSE;
        } else {
            return fail(PROTOCOL_ERROR_INVALID, "Unsupported transfer coding");
        }
    } else if (has_cl) {
        size_t length = 0;
        if (!parse_content_length(cl, &length)) {
            return fail(PROTOCOL_ERROR_INVALID, "Invalid Content-Length");
        }
        if (length > MAX_BODY_SIZE) {
            return fail(PROTOCOL_ERROR_BODY_TOO_LARGE, "Body too large");
        }
        body_remaining_ = length;
        framing_ = (length == 0) ? BodyFraming::NONE : BodyFraming::CONTENT_LENGTH;
    } else if (mode_ == Mode::RESPONSE) {
        framing_ = BodyFraming::UNTIL_CLOSE;
    } else {
        framing_ = BodyFraming::NONE;
    }

    switch (framing_) {
        case BodyFraming::NONE:
            state_ = Http1ParseState::EXPECT_COMPLETE;
            break;
        case BodyFraming::CONTENT_LENGTH:
        case BodyFraming::UNTIL_CLOSE:
            body_.reserve(body_remaining_);
            state_ = Http1ParseState::EXPECT_BODY;
            break;
        case BodyFraming::CHUNKED:
            state_ = Http1ParseState::EXPECT_CHUNK_SIZE;
            break;
    }
    return PROTOCOL_OK;
}

int HttpParser::read_body() {
    size_t readable = buffer_->readable_bytes();

    if (framing_ == BodyFraming::UNTIL_CLOSE) {
        int ret = append_body(readable);
        if (ret != PROTOCOL_OK) {
            return ret;
        }
        // 只有连接关闭才能结束
        return PROTOCOL_ERROR_EAGAIN;
    }

    size_t len = std::min(readable, body_remaining_);
    int ret = append_body(len);
    if (ret != PROTOCOL_OK) {
        return ret;
    }
    body_remaining_ -= len;
    if (body_remaining_ > 0) {
        return PROTOCOL_ERROR_EAGAIN;
    }
    state_ = Http1ParseState::EXPECT_COMPLETE;
    return PROTOCOL_OK;
}

int HttpParser::read_chunk_size() {
    std::string line;
    int ret = read_line(&line);
    if (ret != PROTOCOL_OK) {
        return ret;
    }

    // 忽略chunk扩展
    size_t semi = line.find(';');
    std::string hex = TrimWhitespace(semi == std::string::npos ? line : line.substr(0, semi));
    if (hex.empty() || hex.size() > 15) {
        return fail(PROTOCOL_ERROR_CHUNK, "Invalid chunk size");
    }

    size_t size = 0;
    for (char c : hex) {
        int digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            return fail(PROTOCOL_ERROR_CHUNK, "Invalid chunk size");
        }
        size = size * 16 + static_cast<size_t>(digit);
    }

    if (size == 0) {
        state_ = Http1ParseState::EXPECT_CHUNK_TRAILER;
        return PROTOCOL_OK;
    }
    if (body_.size() + size > MAX_BODY_SIZE) {
        return fail(PROTOCOL_ERROR_BODY_TOO_LARGE, "Body too large");
    }
    body_remaining_ = size;
    state_ = Http1ParseState::EXPECT_CHUNK_DATA;
    return PROTOCOL_OK;
}

int HttpParser::read_chunk_data() {
    if (body_remaining_ > 0) {
        size_t len = std::min(buffer_->readable_bytes(), body_remaining_);
        int ret = append_body(len);
        if (ret != PROTOCOL_OK) {
            return ret;
        }
        body_remaining_ -= len;
        if (body_remaining_ > 0) {
            return PROTOCOL_ERROR_EAGAIN;
        }
    }

    // chunk数据后必须是\r\n
    if (buffer_->readable_bytes() < 2) {
        return PROTOCOL_ERROR_EAGAIN;
    }
    const uint8_t* data = buffer_->read_ptr();
    if (data[0] != '\r' || data[1] != '\n') {
        return fail(PROTOCOL_ERROR_CHUNK, "Missing CRLF after chunk data");
    }
    buffer_->skip(2);
    state_ = Http1ParseState::EXPECT_CHUNK_SIZE;
    return PROTOCOL_OK;
}

int HttpParser::append_body(size_t len) {
    if (len == 0) {
        return PROTOCOL_OK;
    }
    if (body_.size() + len > MAX_BODY_SIZE) {
        return fail(PROTOCOL_ERROR_BODY_TOO_LARGE, "Body too large");
    }
    body_.append(reinterpret_cast<const char*>(buffer_->read_ptr()), len);
    buffer_->skip(len);
    return PROTOCOL_OK;
}

utils::ErrorCode parser_error_to_code(int code) {
    switch (code) {
        case PROTOCOL_OK:
            return utils::ErrorCode::SUCCESS;
        case PROTOCOL_ERROR_TOO_LONG:
        case PROTOCOL_ERROR_TOO_MANY:
            return utils::ErrorCode::PROTOCOL_INVALID_HEADER;
        case PROTOCOL_ERROR_BODY_TOO_LARGE:
            return utils::ErrorCode::PROTOCOL_BODY_TOO_LARGE;
        case PROTOCOL_ERROR_VERSION:
            return utils::ErrorCode::PROTOCOL_INVALID_START_LINE;
        case PROTOCOL_ERROR_CHUNK:
            return utils::ErrorCode::PROTOCOL_INVALID_CHUNK;
        case PROTOCOL_ERROR_INCOMPLETE:
            return utils::ErrorCode::PROTOCOL_INCOMPLETE_MESSAGE;
        default:
            return utils::ErrorCode::PROTOCOL_INVALID_HEADER;
    }
}

int HttpParser::fail(int code, const std::string& msg) {
    set_error(code, msg);
    state_ = Http1ParseState::ERROR;
    return code;
}

} // namespace protocol
} // namespace rpc_snoop

// 文件结束

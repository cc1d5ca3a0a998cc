// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: uri.cpp
//  描述: Uri类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/uri.hpp"
#include "protocol/protocol_types.hpp"
#include "protocol/protocol_utils.hpp"

namespace rpc_snoop {
namespace protocol {

using utils::ErrorCode;
using utils::Result;

namespace {

Result<Uri> invalid(const std::string& text, const char* reason) {
    return utils::make_err<Uri>(ErrorCode::PROTOCOL_INVALID_URI,
                                std::string("invalid URI '") + text + "': " + reason);
}

} // namespace

Uri::Uri()
    : port_(HTTP_DEFAULT_PORT)
    , explicit_port_(false)
    , ipv6_(false)
    , has_query_(false)
{
}

Result<Uri> Uri::parse(const std::string& text) {
    for (unsigned char c : text) {
        if (c <= 0x20 || c == 0x7F) {
            return invalid(text, "contains whitespace or control characters");
        }
    }

    size_t scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return invalid(text, "missing scheme");
    }

    Uri uri;
    uri.scheme_ = ToLower(text.substr(0, scheme_end));
    if (uri.scheme_ == "http") {
        uri.port_ = HTTP_DEFAULT_PORT;
    } else if (uri.scheme_ == "https") {
        uri.port_ = HTTPS_DEFAULT_PORT;
    } else {
        return invalid(text, "scheme must be http or https");
    }

    // authority
    size_t auth_start = scheme_end + 3;
    size_t auth_end = text.find_first_of("/?#", auth_start);
    if (auth_end == std::string::npos) {
        auth_end = text.size();
    }
    std::string authority = text.substr(auth_start, auth_end - auth_start);
    if (authority.empty()) {
        return invalid(text, "missing host");
    }
    if (authority.find('@') != std::string::npos) {
        return invalid(text, "user info is not supported");
    }

    std::string port_text;
    bool has_port = false;
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos || close == 1) {
            return invalid(text, "malformed IPv6 host");
        }
        uri.host_ = authority.substr(1, close - 1);
        uri.ipv6_ = true;
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return invalid(text, "malformed IPv6 host");
            }
            port_text = authority.substr(close + 2);
            has_port = true;
        }
    } else {
        size_t colon = authority.find(':');
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
            has_port = true;
        }
        uri.host_ = authority.substr(0, colon);
        if (uri.host_.empty()) {
            return invalid(text, "missing host");
        }
    }

    if (has_port) {
        if (port_text.empty() || port_text.size() > 5) {
            return invalid(text, "invalid port");
        }
        uint32_t port = 0;
        for (char c : port_text) {
            if (c < '0' || c > '9') {
                return invalid(text, "invalid port");
            }
            port = port * 10 + static_cast<uint32_t>(c - '0');
        }
        if (port == 0 || port > 65535) {
            return invalid(text, "invalid port");
        }
        uri.port_ = static_cast<uint16_t>(port);
        uri.explicit_port_ = true;
    }

    // path / query，片段丢弃
    size_t pos = auth_end;
    size_t fragment = text.find('#', pos);
    std::string rest = text.substr(pos, fragment == std::string::npos ? std::string::npos
                                                                       : fragment - pos);
    size_t question = rest.find('?');
    if (question == std::string::npos) {
        uri.path_ = rest;
    } else {
        uri.path_ = rest.substr(0, question);
        uri.query_ = rest.substr(question + 1);
        uri.has_query_ = true;
    }

    return utils::make_ok(std::move(uri));
}

std::string Uri::remove_trailing_slashes(const std::string& text) {
    size_t end = text.size();
    while (end > 0 && text[end - 1] == '/') {
        --end;
    }
    return text.substr(0, end);
}

std::string Uri::path() const {
    return path_.empty() ? std::string("/") : path_;
}

std::string Uri::request_target() const {
    std::string target = path();
    if (has_query_) {
        target += "?";
        target += query_;
    }
    return target;
}

std::string Uri::host_port() const {
    std::string out = ipv6_ ? "[" + host_ + "]" : host_;
    if (explicit_port_) {
        out += ":";
        out += std::to_string(port_);
    }
    return out;
}

std::string Uri::to_string() const {
    std::string out = scheme_ + "://" + host_port() + path_;
    if (has_query_) {
        out += "?";
        out += query_;
    }
    return out;
}

} // namespace protocol
} // namespace rpc_snoop

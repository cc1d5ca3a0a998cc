// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: socket.cpp
//  描述: Socket类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/socket.hpp"
#include "utils/logger.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>

namespace rpc_snoop {
namespace protocol {

using utils::ErrorCode;
using utils::Result;

namespace {

struct AddrInfoDeleter {
    void operator()(struct addrinfo* info) const {
        if (info) {
            freeaddrinfo(info);
        }
    }
};

using UniqueAddrInfoPtr = std::unique_ptr<struct addrinfo, AddrInfoDeleter>;

} // namespace

Socket::Socket() : fd_(-1) {}

Socket::Socket(int fd) : fd_(fd) {}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<Socket> Socket::connect(const std::string& host, uint16_t port) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* raw = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    if (gai != 0) {
        return utils::make_err<Socket>(ErrorCode::NETWORK_RESOLVE_ERROR,
                                       "failed to resolve " + host + ": " + gai_strerror(gai));
    }
    UniqueAddrInfoPtr result(raw);

    std::string last_error = "no address";
    for (struct addrinfo* ai = result.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        Socket sock(fd);
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            last_error = std::strerror(errno);
            continue;
        }
        int opt = 1;
        if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != 0) {
            LOG_DEBUG("Socket", "Failed to set TCP_NODELAY, errno=%d", errno);
        }
        return utils::make_ok(std::move(sock));
    }

    return utils::make_err<Socket>(ErrorCode::NETWORK_CONNECT_ERROR,
                                   "failed to connect to " + host + ":" + service + ": " +
                                   last_error);
}

Result<void> Socket::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return utils::make_err(ErrorCode::NETWORK_WRITE_ERROR,
                                   std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
    return utils::make_ok();
}

Result<size_t> Socket::read_some(char* data, size_t len) {
    while (true) {
        ssize_t n = ::recv(fd_, data, len, 0);
        if (n >= 0) {
            return utils::make_ok(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        return utils::make_err<size_t>(ErrorCode::NETWORK_READ_ERROR,
                                       std::string("recv failed: ") + std::strerror(errno));
    }
}

void Socket::shutdown_write() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_WR);
    }
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace protocol
} // namespace rpc_snoop

// =============================================================================
//  JSON-RPC Snoop - Server Module
//  文件: server.cpp
//  描述: Server类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "server/server.hpp"
#include "protocol/http_parser.hpp"
#include "protocol/protocol_types.hpp"
#include "protocol/socket.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <condition_variable>
#include <cstring>
#include <cerrno>
#include <cstdio>
#include <set>
#include <system_error>

namespace rpc_snoop {
namespace server {

const char* server_error_to_string(int code)
{
    switch (code) {
        case ERR_SUCCESS:          return "success";
        case ERR_INVALID_STATE:    return "invalid server state";
        case ERR_SOCKET_CREATE:    return "failed to create socket";
        case ERR_SOCKET_BIND:      return "failed to bind";
        case ERR_SOCKET_LISTEN:    return "failed to listen";
        case ERR_INVALID_ARGUMENT: return "invalid bind address";
        case ERR_INTERNAL:         return "internal error";
        default:                   return "unknown error";
    }
}

// ==================== 会话登记 ====================
// 由Server和所有会话线程共享，会话线程可能晚于Server退出
class SessionRegistry {
public:
    SessionRegistry() : total_(0) {}

    void add(int fd)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fds_.insert(fd);
        ++total_;
    }

    // 必须在关闭fd之前调用，避免对已复用的fd执行shutdown
    void remove(int fd)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fds_.erase(fd);
        if (fds_.empty()) {
            cv_.notify_all();
        }
    }

    void shutdown_all()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int fd : fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    bool wait_empty(std::chrono::seconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return fds_.empty(); });
    }

    // 不限时等待，会话线程全部退出后才返回
    void wait_all()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return fds_.empty(); });
    }

    uint32_t active() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<uint32_t>(fds_.size());
    }

    uint64_t total() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<int> fds_;
    uint64_t total_;
};

namespace {

bool write_response(protocol::Socket* socket, const protocol::HttpResponse& response)
{
    std::string wire = protocol::HttpParser::serialize_response(response);
    auto written = socket->write_all(wire.data(), wire.size());
    if (written.is_err()) {
        LOG_DEBUG("Server", "Failed to write response on fd %d: %s",
                  socket->fd(), written.error_message().c_str());
        return false;
    }
    return true;
}

protocol::HttpResponse make_bad_request()
{
    protocol::HttpResponse response;
    response.set_status(400, protocol::status_reason(400));
    response.add_header(protocol::HEADER_CONTENT_TYPE, "text/plain");
    response.add_header(protocol::HEADER_CONNECTION, "close");
    response.set_body("Bad Request\n");
    return response;
}

} // namespace

// ==================== Server实现 ====================

Server::Server(proxy::ExchangeHandler* handler)
    : handler_(handler)
    , registry_(std::make_shared<SessionRegistry>())
    , listen_fd_(-1)
    , listen_port_(0)
    , status_(SERVER_STATUS_STOPPED)
    , running_(false)
{
}

Server::~Server()
{
    if (running_) {
        stop();
    }
    cleanup();

    // 会话线程持有handler_，必须在Server析构前全部退出
    if (registry_->active() > 0) {
        LOG_WARN("Server", "Waiting for %u sessions to finish", registry_->active());
        handler_->cancel_pending_waits();
        registry_->shutdown_all();
        registry_->wait_all();
    }
}

int Server::init(const config::ListenConfig& listen)
{
    // 步骤1: 设置状态（仅在修改status_时加锁）
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != SERVER_STATUS_STOPPED || listen_fd_ >= 0) {
            return ERR_INVALID_STATE;
        }
        status_ = SERVER_STATUS_INITIALIZING;
    }

    // 步骤2: 创建socket
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_ERROR("Server", "Failed to create socket: %s", std::strerror(errno));
        set_status(SERVER_STATUS_STOPPED);
        return ERR_SOCKET_CREATE;
    }
    listen_fd_ = fd;

    // 步骤3: 设置SO_REUSEADDR选项
    int opt = 1;
    int ret = setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (ret < 0) {
        LOG_ERROR("Server", "Failed to set SO_REUSEADDR");
        rollback_listen_socket();
        return ERR_INTERNAL;
    }

    // 步骤4: 填充sockaddr_in结构
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(listen.port);

    ret = inet_pton(AF_INET, listen.ip.c_str(), &addr.sin_addr);
    if (ret == 0) {
        LOG_ERROR("Server", "Invalid IP address format: %s", listen.ip.c_str());
        rollback_listen_socket();
        return ERR_INVALID_ARGUMENT;
    } else if (ret < 0) {
        LOG_ERROR("Server", "Failed to convert IP address: %s, errno=%d",
                  listen.ip.c_str(), errno);
        rollback_listen_socket();
        return ERR_INTERNAL;
    }

    // 步骤5: 绑定
    ret = bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0) {
        LOG_ERROR("Server", "Failed to bind to %s:%d: %s", listen.ip.c_str(), listen.port,
                  std::strerror(errno));
        rollback_listen_socket();
        return ERR_SOCKET_BIND;
    }

    // 步骤6: 监听
    ret = ::listen(fd, DEFAULT_BACKLOG);
    if (ret < 0) {
        LOG_ERROR("Server", "Failed to listen on %s:%d", listen.ip.c_str(), listen.port);
        rollback_listen_socket();
        return ERR_SOCKET_LISTEN;
    }

    // 端口为0时取系统分配的端口
    struct sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    std::memset(&bound, 0, sizeof(bound));
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
        listen_port_ = ntohs(bound.sin_port);
    } else {
        listen_port_ = listen.port;
    }
    listen_ip_ = listen.ip;

    LOG_INFO("Server", "Listening on %s:%u", listen_ip_.c_str(),
             static_cast<unsigned>(listen_port_));
    set_status(SERVER_STATUS_STOPPED);
    return ERR_SUCCESS;
}

int Server::start()
{
    // 步骤1: 检查当前状态并设置RUNNING（加锁）
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listen_fd_ < 0 || status_ != SERVER_STATUS_STOPPED) {
            return ERR_INVALID_STATE;
        }
        status_ = SERVER_STATUS_RUNNING;
        running_ = true;
    }

    // 步骤2: 启动accept线程
    try {
        accept_thread_ = std::thread(&Server::accept_loop, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("Server", "Failed to start accept thread: %s", e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = SERVER_STATUS_ERROR;
            running_ = false;
        }
        return ERR_INTERNAL;
    }

    // 步骤3: 记录启动时间
    start_time_ = std::chrono::steady_clock::now();

    LOG_INFO("Server", "Server started successfully");
    return ERR_SUCCESS;
}

int Server::stop()
{
    // 步骤1: 检查当前状态（加锁）
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != SERVER_STATUS_RUNNING) {
            return ERR_INVALID_STATE;
        }
        status_ = SERVER_STATUS_SHUTTING_DOWN;
    }

    // 步骤2: 停止接受新连接
    stop_accepting();

    // 步骤3: 关闭会话连接（最多等待5秒）
    close_all_connections();

    set_status(SERVER_STATUS_STOPPED);
    LOG_INFO("Server", "Server stopped successfully");
    return ERR_SUCCESS;
}

void Server::cleanup()
{
    if (accept_thread_.joinable()) {
        running_ = false;
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
        }
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    listen_port_ = 0;
    listen_ip_.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    status_ = SERVER_STATUS_STOPPED;
}

void Server::get_status(ServerStatus* status) const
{
    if (status == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    status->status = status_;

    // 计算运行时间
    if (status_ == SERVER_STATUS_RUNNING &&
        start_time_ != std::chrono::steady_clock::time_point()) {
        auto now = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
        status->uptime_seconds = static_cast<uint64_t>(duration.count());
    } else {
        status->uptime_seconds = 0;
    }

    status->current_connections = registry_->active();
    status->total_connections = registry_->total();
    status->listen_port = listen_port_;

    std::memset(status->listen_ip, 0, sizeof(status->listen_ip));
    std::snprintf(status->listen_ip, sizeof(status->listen_ip), "%s", listen_ip_.c_str());
}

uint16_t Server::listen_port() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listen_port_;
}

void Server::accept_loop()
{
    while (running_) {
        struct sockaddr_in peer;
        socklen_t peer_len = sizeof(peer);
        int fd = ::accept4(listen_fd_, reinterpret_cast<struct sockaddr*>(&peer), &peer_len,
                           SOCK_CLOEXEC);
        if (fd < 0) {
            if (!running_) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            LOG_ERROR("Server", "accept failed: %s", std::strerror(errno));
            // 文件描述符耗尽等情况，稍后重试
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
        LOG_DEBUG("Server", "Accepted connection fd=%d from %s:%u", fd, ip,
                  static_cast<unsigned>(ntohs(peer.sin_port)));

        registry_->add(fd);
        try {
            std::thread(&Server::run_session, fd, handler_, registry_).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("Server", "Failed to start session thread: %s", e.what());
            registry_->remove(fd);
            ::close(fd);
        }
    }
    LOG_DEBUG("Server", "Accept loop exited");
}

void Server::run_session(int fd, proxy::ExchangeHandler* handler,
                         std::shared_ptr<SessionRegistry> registry)
{
    protocol::Socket socket(fd);
    utils::Buffer buffer;
    protocol::HttpParser parser(protocol::HttpParser::Mode::REQUEST);
    parser.init(&buffer);

    protocol::HttpRequest request;
    char chunk[protocol::TEMP_BUFFER_SIZE];

    while (true) {
        int ret = parser.parse_request(&request);
        if (ret == protocol::PROTOCOL_OK) {
            proxy::ExchangeOutcome outcome = handler->handle(request);
            if (outcome.dropped) {
                // 丢弃的交换不写响应，直接关闭连接
                LOG_DEBUG("Server", "Exchange dropped, closing fd=%d", fd);
                break;
            }
            bool close_after = !request.keep_alive() || outcome.response.wants_close();
            if (!write_response(&socket, outcome.response) || close_after) {
                break;
            }
            continue;
        }

        if (ret != protocol::PROTOCOL_ERROR_EAGAIN) {
            LOG_WARN("Server", "Malformed request on fd=%d: %s", fd,
                     parser.get_error_msg().c_str());
            write_response(&socket, make_bad_request());
            break;
        }

        auto got = socket.read_some(chunk, sizeof(chunk));
        if (got.is_err()) {
            LOG_DEBUG("Server", "Read failed on fd=%d: %s", fd, got.error_message().c_str());
            break;
        }
        if (got.value() == 0) {
            if (parser.has_partial_message()) {
                LOG_DEBUG("Server", "Peer closed fd=%d in the middle of a request", fd);
            }
            break;
        }
        if (buffer.write(chunk, got.value()) != got.value()) {
            LOG_WARN("Server", "Request on fd=%d exceeds buffer capacity", fd);
            break;
        }
    }

    registry->remove(fd);
    socket.close();
}

void Server::stop_accepting()
{
    running_ = false;
    if (listen_fd_ >= 0) {
        // 唤醒阻塞在accept上的线程
        ::shutdown(listen_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void Server::close_all_connections()
{
    handler_->cancel_pending_waits();
    registry_->shutdown_all();

    // 正在等待上游响应的会话不会立即退出，超时后放弃等待，析构时再等
    if (!registry_->wait_empty(std::chrono::seconds(MAX_SESSION_CLOSE_WAIT_SECONDS))) {
        LOG_WARN("Server", "Close all connections timeout after %d seconds, %u still active",
                 MAX_SESSION_CLOSE_WAIT_SECONDS, registry_->active());
    }
}

void Server::rollback_listen_socket()
{
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    // 回到STOPPED以允许重新init
    set_status(SERVER_STATUS_STOPPED);
}

void Server::set_status(ServerStatusEnum new_status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = new_status;
}

} // namespace server
} // namespace rpc_snoop

// 文件结束

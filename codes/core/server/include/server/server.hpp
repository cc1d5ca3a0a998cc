// =============================================================================
//  JSON-RPC Snoop - Server Module
//  文件: server.hpp
//  描述: Server类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>
#include "config/config.hpp"
#include "proxy/exchange_handler.hpp"

namespace rpc_snoop {
namespace server {

// Server错误码
constexpr int ERR_SUCCESS = 0;
constexpr int ERR_INVALID_STATE = -1;
constexpr int ERR_SOCKET_CREATE = -4;
constexpr int ERR_SOCKET_BIND = -5;
constexpr int ERR_SOCKET_LISTEN = -6;
constexpr int ERR_INVALID_ARGUMENT = -8;
constexpr int ERR_INTERNAL = -9;

// 错误码转描述
const char* server_error_to_string(int code);

// Server状态枚举
typedef enum {
    SERVER_STATUS_STOPPED = 0,
    SERVER_STATUS_INITIALIZING = 1,
    SERVER_STATUS_RUNNING = 2,
    SERVER_STATUS_SHUTTING_DOWN = 3,
    SERVER_STATUS_ERROR = 4
} ServerStatusEnum;

// Server状态结构体
struct ServerStatus {
    ServerStatusEnum status;
    uint64_t uptime_seconds;
    uint32_t current_connections;
    uint64_t total_connections;
    uint16_t listen_port;
    char listen_ip[64];
};

class SessionRegistry;

// Server类
// 每个接受的连接由独立的分离线程服务，连接上的请求按keep-alive顺序处理
class Server {
public:
    /**
     * @brief 构造函数
     * @param handler 交换处理器，生命周期须长于Server
     */
    explicit Server(proxy::ExchangeHandler* handler);

    /**
     * @brief 析构函数，等待所有会话线程退出
     */
    ~Server();

    // 禁止拷贝
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ==================== 生命周期管理 ====================

    /**
     * @brief 初始化监听socket
     * @param listen 监听地址与端口，端口为0时由系统分配
     * @return 0 成功，非0 失败
     */
    int init(const config::ListenConfig& listen);

    /**
     * @brief 启动accept线程
     * @return 0 成功，非0 失败
     */
    int start();

    /**
     * @brief 停止Server：关闭监听socket，结束丢包延迟，关闭所有会话连接并有限等待会话退出
     * @return 0 成功，非0 失败
     */
    int stop();

    /**
     * @brief 清理资源
     */
    void cleanup();

    // ==================== 状态查询 ====================

    /**
     * @brief 获取Server状态
     * @param status 输出参数，状态结构体指针
     */
    void get_status(ServerStatus* status) const;

    /**
     * @brief 实际监听端口
     */
    uint16_t listen_port() const;

private:
    // ==================== 私有方法 ====================

    void accept_loop();

    /**
     * @brief 服务一个连接直到对端关闭、出错或交换被丢弃
     */
    static void run_session(int fd, proxy::ExchangeHandler* handler,
                            std::shared_ptr<SessionRegistry> registry);

    void stop_accepting();
    void close_all_connections();
    void rollback_listen_socket();
    void set_status(ServerStatusEnum new_status);

    // ==================== 成员变量 ====================

    proxy::ExchangeHandler* handler_;
    std::shared_ptr<SessionRegistry> registry_;

    int listen_fd_;
    uint16_t listen_port_;
    std::string listen_ip_;

    std::thread accept_thread_;

    ServerStatusEnum status_;
    std::atomic<bool> running_;

    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex mutex_;

    // 超时常量
    static constexpr int MAX_SESSION_CLOSE_WAIT_SECONDS = 5;
    static constexpr int DEFAULT_BACKLOG = 128;
};

} // namespace server
} // namespace rpc_snoop

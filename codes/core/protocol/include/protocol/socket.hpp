// =============================================================================
//  JSON-RPC Snoop - Protocol Module
//  文件: socket.hpp
//  描述: 字节流接口与RAII TCP套接字
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace rpc_snoop {
namespace protocol {

// ==================== 阻塞字节流接口 ====================
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief 写入全部数据
     * @return 成功或写错误
     */
    virtual utils::Result<void> write_all(const char* data, size_t len) = 0;

    /**
     * @brief 读取最多len字节
     * @return 读取的字节数，0表示对端关闭
     */
    virtual utils::Result<size_t> read_some(char* data, size_t len) = 0;
};

// ==================== TCP套接字 ====================
class Socket : public ByteStream {
public:
    Socket();
    explicit Socket(int fd);
    ~Socket() override;

    // 禁止拷贝，允许移动
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    /**
     * @brief 解析主机名并连接，依次尝试每个地址
     * @param host 主机名或IP
     * @param port 端口
     * @return 已连接的套接字
     */
    static utils::Result<Socket> connect(const std::string& host, uint16_t port);

    utils::Result<void> write_all(const char* data, size_t len) override;
    utils::Result<size_t> read_some(char* data, size_t len) override;

    /**
     * @brief 关闭写方向
     */
    void shutdown_write();

    void close();
    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }

private:
    int fd_;
};

} // namespace protocol
} // namespace rpc_snoop

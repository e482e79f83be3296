#pragma once

#include <chrono>
#include <string>

/**
 * 本地 TCP 通信工具
 * grader 与 answer service 之间只通过回环地址通信，每个连接只发送一行 JSON 请求，
 * 并接收一行 JSON 响应。所有阻塞操作都有截止时间。
 */
namespace grader {

/**
 * @brief 自动关闭的文件描述符
 */
struct socket_fd {
    socket_fd();
    explicit socket_fd(int fd);
    socket_fd(socket_fd &&other);
    socket_fd(const socket_fd &) = delete;
    ~socket_fd();

    socket_fd &operator=(socket_fd &&other);
    socket_fd &operator=(const socket_fd &) = delete;

    int get() const;

    bool valid() const;

    void close();

private:
    int fd = -1;
};

typedef std::chrono::steady_clock::time_point deadline_t;

deadline_t deadline_after(std::chrono::milliseconds timeout);

/**
 * @brief 判断 host 是否为回环地址（127.0.0.0/8、::1 或 localhost）
 */
bool is_loopback_address(const std::string &host);

/**
 * @brief 在回环地址上监听
 * @param host 监听地址，必须是回环地址
 * @param port 端口，为 0 时由系统分配
 * @throw std::invalid_argument host 不是回环地址
 * @throw std::system_error 无法创建 socket 或者无法绑定端口
 */
socket_fd listen_loopback(const std::string &host, int port);

/**
 * @brief 获得 socket 绑定的本地端口
 */
int local_port(const socket_fd &sock);

/**
 * @brief 接受一个连接
 * @param timeout 最长等待时间，超时返回无效的 socket_fd
 * @param peer 对端地址，可以为 nullptr
 * @throw std::system_error accept 失败
 */
socket_fd accept_connection(const socket_fd &listener, std::chrono::milliseconds timeout, std::string *peer = nullptr);

/**
 * @brief 连接回环地址上的服务
 * @throw std::invalid_argument host 不是回环地址
 * @throw std::system_error 连接失败或者超时
 */
socket_fd connect_loopback(const std::string &host, int port, deadline_t deadline);

/**
 * @brief 发送全部数据
 * @throw std::system_error 发送失败或者超时
 */
void send_all(const socket_fd &sock, const std::string &data, deadline_t deadline);

/**
 * @brief 读取一行数据（不包含换行符）
 * @param max_bytes 一行的最大长度，超出时抛出异常
 * @throw std::system_error 读取失败、超时，或者对端在发送换行符之前关闭连接
 */
std::string receive_line(const socket_fd &sock, deadline_t deadline, std::size_t max_bytes);

}  // namespace grader

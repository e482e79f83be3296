#include "common/socket.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace grader {
using namespace std;

socket_fd::socket_fd() {}

socket_fd::socket_fd(int fd) : fd(fd) {}

socket_fd::socket_fd(socket_fd &&other) : fd(other.fd) {
    other.fd = -1;
}

socket_fd::~socket_fd() {
    close();
}

socket_fd &socket_fd::operator=(socket_fd &&other) {
    if (this != &other) {
        close();
        fd = other.fd;
        other.fd = -1;
    }
    return *this;
}

int socket_fd::get() const {
    return fd;
}

bool socket_fd::valid() const {
    return fd >= 0;
}

void socket_fd::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

deadline_t deadline_after(chrono::milliseconds timeout) {
    return chrono::steady_clock::now() + timeout;
}

static int remaining_ms(deadline_t deadline) {
    auto left = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
    return left < 0 ? 0 : (int)left;
}

/**
 * @brief 等待 fd 可读或可写
 * @throw std::system_error 超时或者 poll 失败
 */
static void wait_for(int fd, short events, deadline_t deadline, const char *what) {
    while (true) {
        struct pollfd pfd = {fd, events, 0};
        int ret = poll(&pfd, 1, remaining_ms(deadline));
        if (ret > 0) return;
        if (ret == 0) throw system_error(make_error_code(errc::timed_out), what);
        if (errno != EINTR) throw system_error(errno, system_category(), what);
    }
}

/**
 * @brief 解析回环地址
 * @return 地址族为 AF_INET 或 AF_INET6 的 sockaddr
 */
static sockaddr_storage resolve_loopback(const string &host, int port, socklen_t &len) {
    if (!is_loopback_address(host))
        throw invalid_argument("refusing non-loopback address " + host);
    if (port < 0 || port > 65535)
        throw invalid_argument("invalid port " + to_string(port));

    sockaddr_storage storage;
    memset(&storage, 0, sizeof(storage));
    string address = host == "localhost" ? "127.0.0.1" : host;

    auto *v4 = reinterpret_cast<sockaddr_in *>(&storage);
    if (inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(port);
        len = sizeof(sockaddr_in);
        return storage;
    }

    auto *v6 = reinterpret_cast<sockaddr_in6 *>(&storage);
    if (inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(port);
        len = sizeof(sockaddr_in6);
        return storage;
    }
    throw invalid_argument("invalid address " + host);
}

bool is_loopback_address(const string &host) {
    if (host == "localhost") return true;
    in_addr v4;
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1)
        return (ntohl(v4.s_addr) >> 24) == 127;
    in6_addr v6;
    if (inet_pton(AF_INET6, host.c_str(), &v6) == 1)
        return IN6_IS_ADDR_LOOPBACK(&v6) || (IN6_IS_ADDR_V4MAPPED(&v6) && v6.s6_addr[12] == 127);
    return false;
}

socket_fd listen_loopback(const string &host, int port) {
    socklen_t len;
    sockaddr_storage addr = resolve_loopback(host, port, len);

    socket_fd sock(socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP));
    if (!sock.valid())
        throw system_error(errno, system_category(), "unable to create socket");

    int true_ = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &true_, sizeof(int)))
        throw system_error(errno, system_category(), "unable to set SO_REUSEADDR");

    if (::bind(sock.get(), reinterpret_cast<sockaddr *>(&addr), len))
        throw system_error(errno, system_category(), "unable to bind " + host + ":" + to_string(port));

    if (listen(sock.get(), 16))
        throw system_error(errno, system_category(), "unable to listen");
    return sock;
}

int local_port(const socket_fd &sock) {
    sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr *>(&addr), &len))
        throw system_error(errno, system_category(), "getsockname");
    if (addr.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port);
    return ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
}

socket_fd accept_connection(const socket_fd &listener, chrono::milliseconds timeout, string *peer) {
    struct pollfd pfd = {listener.get(), POLLIN, 0};
    int ret = poll(&pfd, 1, (int)timeout.count());
    if (ret == 0 || (ret < 0 && errno == EINTR)) return socket_fd();
    if (ret < 0) throw system_error(errno, system_category(), "polling listener");

    sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    socket_fd client(accept4(listener.get(), reinterpret_cast<sockaddr *>(&addr), &len, SOCK_CLOEXEC));
    if (!client.valid()) {
        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) return socket_fd();
        throw system_error(errno, system_category(), "accepting connection");
    }

    if (peer) {
        char ip[INET6_ADDRSTRLEN] = {0};
        if (addr.ss_family == AF_INET6)
            inet_ntop(AF_INET6, &reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_addr, ip, sizeof(ip));
        else
            inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in *>(&addr)->sin_addr, ip, sizeof(ip));
        *peer = ip;
    }
    return client;
}

socket_fd connect_loopback(const string &host, int port, deadline_t deadline) {
    socklen_t len;
    sockaddr_storage addr = resolve_loopback(host, port, len);

    socket_fd sock(socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, IPPROTO_TCP));
    if (!sock.valid())
        throw system_error(errno, system_category(), "unable to create socket");

    if (connect(sock.get(), reinterpret_cast<sockaddr *>(&addr), len) != 0) {
        if (errno != EINPROGRESS)
            throw system_error(errno, system_category(), "unable to connect to " + host + ":" + to_string(port));
        wait_for(sock.get(), POLLOUT, deadline, "connecting");

        int err = 0;
        socklen_t err_len = sizeof(err);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &err_len))
            throw system_error(errno, system_category(), "getsockopt");
        if (err)
            throw system_error(err, system_category(), "unable to connect to " + host + ":" + to_string(port));
    }
    return sock;
}

void send_all(const socket_fd &sock, const string &data, deadline_t deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        wait_for(sock.get(), POLLOUT, deadline, "sending");
        ssize_t n = send(sock.get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw system_error(errno, system_category(), "sending");
        }
        sent += n;
    }
}

string receive_line(const socket_fd &sock, deadline_t deadline, size_t max_bytes) {
    string line;
    char buf[4096];
    while (true) {
        wait_for(sock.get(), POLLIN, deadline, "receiving");
        ssize_t n = recv(sock.get(), buf, sizeof(buf), MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw system_error(errno, system_category(), "receiving");
        }
        if (n == 0)
            throw system_error(make_error_code(errc::connection_reset), "connection closed before end of line");

        const char *newline = static_cast<const char *>(memchr(buf, '\n', n));
        line.append(buf, newline ? newline - buf : n);
        if (line.size() > max_bytes)
            throw system_error(make_error_code(errc::message_size), "line too long");
        if (newline) return line;
    }
}

}  // namespace grader

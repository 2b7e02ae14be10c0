/**
 * ripcord TCP Socket - Implementation
 */

#include "tcp_socket.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace ripcord {
namespace net {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void TcpSocket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void TcpSocket::shutdown() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

int TcpSocket::set_nodelay() noexcept {
    int val = 1;
    if (setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val)) < 0) {
        return -1;
    }
    return 0;
}

core::result<TcpSocket> TcpSocket::listen_on(const std::string& host, uint16_t port, int backlog) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (host == "0.0.0.0" || host.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        return core::err<TcpSocket>(core::error_code::invalid_address,
                                    "not an IPv4 address: " + host);
    }

    TcpSocket sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.is_valid()) {
        return core::err<TcpSocket>(core::error_code::bind_failed, errno_message("socket"));
    }

    int reuse = 1;
    if (setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        return core::err<TcpSocket>(core::error_code::bind_failed, errno_message("setsockopt"));
    }

    if (::bind(sock.fd(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        return core::err<TcpSocket>(core::error_code::bind_failed, errno_message("bind"));
    }

    if (::listen(sock.fd(), backlog) < 0) {
        return core::err<TcpSocket>(core::error_code::bind_failed, errno_message("listen"));
    }

    return core::ok(std::move(sock));
}

core::result<TcpSocket> TcpSocket::connect_to(const std::string& host, uint16_t port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        return core::err<TcpSocket>(core::error_code::invalid_address,
                                    "not an IPv4 address: " + host);
    }

    TcpSocket sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.is_valid()) {
        return core::err<TcpSocket>(core::error_code::io_error, errno_message("socket"));
    }

    int rc;
    do {
        rc = ::connect(sock.fd(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        return core::err<TcpSocket>(core::error_code::io_error, errno_message("connect"));
    }

    return core::ok(std::move(sock));
}

core::result<TcpSocket> TcpSocket::accept(std::string* peer_ip) const {
    if (fd_ < 0) {
        return core::err<TcpSocket>(core::error_code::io_error, "accept on closed socket");
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);

    int client_fd;
    do {
        client_fd = ::accept4(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len, SOCK_CLOEXEC);
    } while (client_fd < 0 && errno == EINTR);

    if (client_fd < 0) {
        return core::err<TcpSocket>(core::error_code::io_error, errno_message("accept"));
    }

    if (peer_ip) {
        char ip_str[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str)) != nullptr) {
            *peer_ip = ip_str;
        } else {
            peer_ip->clear();
        }
    }

    return core::ok(TcpSocket(client_fd));
}

core::result<size_t> TcpSocket::read_some(char* buffer, size_t len) {
    ssize_t n;
    do {
        n = ::recv(fd_, buffer, len, 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        return core::err<size_t>(core::error_code::io_error, errno_message("recv"));
    }
    return static_cast<size_t>(n);
}

core::result<void> TcpSocket::write_all(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return core::err(core::error_code::io_error, errno_message("send"));
        }
        sent += static_cast<size_t>(n);
    }
    return core::ok();
}

core::result<uint16_t> TcpSocket::local_port() const {
    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);

    if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) < 0) {
        return core::err<uint16_t>(core::error_code::io_error, errno_message("getsockname"));
    }
    return static_cast<uint16_t>(ntohs(addr.sin_port));
}

} // namespace net
} // namespace ripcord

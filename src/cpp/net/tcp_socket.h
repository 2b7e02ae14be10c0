/**
 * ripcord TCP Socket - blocking RAII wrapper
 *
 * Features:
 * - Owns one file descriptor, closed on destruction
 * - Listener setup (SO_REUSEADDR, bind, listen) in one call
 * - EINTR-safe reads and full writes
 * - shutdown() to wake threads blocked in accept() or recv()
 */

#pragma once

#include "core/result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ripcord {
namespace net {

class TcpSocket {
public:
    /**
     * Take ownership of an existing file descriptor.
     */
    explicit TcpSocket(int fd) noexcept : fd_(fd) {}

    /**
     * Invalid socket (fd = -1).
     */
    TcpSocket() noexcept : fd_(-1) {}

    ~TcpSocket();

    // Non-copyable, movable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    /**
     * Create a listening IPv4 socket bound to host:port.
     *
     * @param host Dotted IPv4 address ("0.0.0.0" for any)
     * @param port Port number (0 picks an ephemeral port)
     * @param backlog Maximum pending connections
     * @return invalid_address if host is not an IPv4 address,
     *         bind_failed if socket/bind/listen fails
     */
    static core::result<TcpSocket> listen_on(const std::string& host, uint16_t port, int backlog);

    /**
     * Blocking connect to host:port (used by clients and tests).
     */
    static core::result<TcpSocket> connect_to(const std::string& host, uint16_t port);

    int fd() const noexcept { return fd_; }
    bool is_valid() const noexcept { return fd_ >= 0; }

    void close() noexcept;

    /**
     * Shut down both directions without closing the fd. Threads blocked
     * in accept() or recv() on this socket return.
     */
    void shutdown() noexcept;

    /**
     * Disable Nagle's algorithm (set TCP_NODELAY)
     */
    int set_nodelay() noexcept;

    /**
     * Accept a new connection.
     *
     * @param peer_ip Filled with the client's dotted address when non-null
     * @return the connection, or io_error
     */
    core::result<TcpSocket> accept(std::string* peer_ip = nullptr) const;

    /**
     * Read up to len bytes. 0 means the peer closed the connection.
     */
    core::result<size_t> read_some(char* buffer, size_t len);

    /**
     * Write all of data, retrying short writes.
     */
    core::result<void> write_all(std::string_view data);

    /**
     * Port the socket is bound to (useful after binding port 0).
     */
    core::result<uint16_t> local_port() const;

private:
    int fd_;
};

} // namespace net
} // namespace ripcord

/**
 * ripcord HTTP/1.1 transport - blocking, thread-per-worker server
 *
 * Features:
 * - Fixed pool of worker threads accepting on one shared listening socket
 * - Request heads parsed by Http1Parser, bodies streamed by Content-Length
 * - Keep-alive and pipelined requests on one connection
 * - stop() wakes every worker, including ones blocked on idle connections
 */

#pragma once

#include "http1_parser.h"
#include "tcp_socket.h"
#include "http/transport.h"
#include "core/result.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace ripcord {
namespace net {

/**
 * Transport configuration
 */
struct Http1TransportConfig {
    uint16_t num_workers = 0;          // 0 = hardware concurrency
    int backlog = 1024;                // Listen backlog
    size_t max_header_bytes = 16384;   // Largest accepted request head
    bool keep_alive = true;            // Allow persistent connections
};

class Http1Transport : public http::TransportServer {
public:
    explicit Http1Transport(const Http1TransportConfig& config = {});
    ~Http1Transport() override;

    // Non-copyable, non-movable
    Http1Transport(const Http1Transport&) = delete;
    Http1Transport& operator=(const Http1Transport&) = delete;
    Http1Transport(Http1Transport&&) = delete;
    Http1Transport& operator=(Http1Transport&&) = delete;

    core::result<void> bind(const std::string& host, uint16_t port) override;

    /**
     * Start the workers and block until stop().
     */
    core::result<void> serve(RequestCallback callback) override;

    /**
     * Thread-safe. Can be called from any thread, before or during serve().
     */
    void stop() noexcept override;

    /**
     * Port actually bound (0 before bind()).
     */
    uint16_t bound_port() const noexcept { return bound_port_.load(); }

    uint16_t num_workers() const noexcept { return config_.num_workers; }

    const Http1TransportConfig& config() const noexcept { return config_; }

private:
    void worker_loop(int worker_id, const RequestCallback& callback);
    void serve_connection(TcpSocket& conn, const std::string& peer, const RequestCallback& callback);

    void track(int fd);
    void untrack(int fd);

    Http1TransportConfig config_;
    Http1Parser parser_;
    TcpSocket listener_;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> stop_requested_{false};

    std::mutex connections_mutex_;  // Protects connections_
    std::unordered_set<int> connections_;
};

/**
 * Serialize a response as an HTTP/1.1 message.
 */
std::string serialize_response(const http::TransportResponse& response, bool keep_alive);

} // namespace net
} // namespace ripcord

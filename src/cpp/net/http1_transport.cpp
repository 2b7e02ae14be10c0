/**
 * ripcord HTTP/1.1 transport - Implementation
 */

#include "http1_transport.h"
#include "core/logger.h"

#include <sys/socket.h>
#include <algorithm>
#include <exception>
#include <functional>

namespace ripcord {
namespace net {

namespace {

constexpr size_t kReadBufferSize = 16384;

/**
 * TransportRequest view over one parsed head plus the connection it
 * arrived on. Body bytes come first from the connection buffer (whatever
 * was read together with the head) and then from the socket.
 */
class Http1Request : public http::TransportRequest {
public:
    Http1Request(const Http1RequestHead& head, TcpSocket& conn, std::string& buffer,
                 const std::string& peer)
        : head_(head), conn_(conn), buffer_(buffer), peer_(peer),
          remaining_(head.content_length) {}

    std::string method() const override { return head_.method; }
    std::string path() const override { return head_.path; }
    std::string query_string() const override { return head_.query; }
    http::HeaderList headers() const override { return head_.headers; }

    http::HeaderList cookies() const override {
        http::HeaderList cookies;
        for (const auto& [name, value] : head_.headers) {
            if (Http1Parser::str_eq_ci(name, "cookie")) {
                auto parsed = parse_cookie_header(value);
                cookies.insert(cookies.end(), parsed.begin(), parsed.end());
            }
        }
        return cookies;
    }

    std::unordered_map<std::string, std::string> params() const override {
        return {};
    }

    core::result<bool> read_chunk(std::string& chunk) override {
        if (remaining_ == 0) {
            return false;
        }

        if (buffer_.empty()) {
            char tmp[kReadBufferSize];
            size_t want = static_cast<size_t>(std::min<uint64_t>(sizeof(tmp), remaining_));
            auto n = conn_.read_some(tmp, want);
            if (!n) {
                return core::result<bool>(n.get_error());
            }
            if (n.value() == 0) {
                return core::err<bool>(core::error_code::io_error, "connection closed mid-body");
            }
            buffer_.append(tmp, n.value());
        }

        size_t take = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining_));
        chunk.assign(buffer_, 0, take);
        buffer_.erase(0, take);
        remaining_ -= take;
        return true;
    }

    std::optional<std::string> peer_address() const override {
        if (peer_.empty()) {
            return std::nullopt;
        }
        return peer_;
    }

    bool body_complete() const noexcept { return remaining_ == 0; }

private:
    const Http1RequestHead& head_;
    TcpSocket& conn_;
    std::string& buffer_;
    const std::string& peer_;
    uint64_t remaining_;
};

http::TransportResponse transport_error(uint16_t status) {
    http::TransportResponse response;
    response.status = status;
    response.content_type = "application/json";
    response.body = std::string("{\"error\":\"") + status_reason(status) + "\"}";
    return response;
}

} // namespace

std::string serialize_response(const http::TransportResponse& response, bool keep_alive) {
    std::string out;
    out.reserve(256 + response.body.size());

    // Status line: "HTTP/1.1 200 OK\r\n"
    out += "HTTP/1.1 ";
    out += std::to_string(response.status);
    out += " ";
    out += status_reason(response.status);
    out += "\r\n";

    if (!response.content_type.empty()) {
        out += "Content-Type: ";
        out += response.content_type;
        out += "\r\n";
    }

    out += "Content-Length: ";
    out += std::to_string(response.body.size());
    out += "\r\n";

    for (const auto& [name, value] : response.headers) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }

    for (const auto& cookie : response.set_cookies) {
        out += "Set-Cookie: ";
        out += cookie;
        out += "\r\n";
    }

    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    out += response.body;
    return out;
}

namespace {

/**
 * Answer with a transport-level error and give up on the connection.
 */
void reject(TcpSocket& conn, uint16_t status, const std::string& peer) {
    auto written = conn.write_all(serialize_response(transport_error(status), false));
    if (!written) {
        LOG_DEBUG("Transport", "Failed to send %u to %s: %s", status, peer.c_str(),
                  written.get_error().describe().c_str());
    }
}

} // namespace

Http1Transport::Http1Transport(const Http1TransportConfig& config)
    : config_(config), parser_(config.max_header_bytes) {
    if (config_.num_workers == 0) {
        unsigned int hw = std::thread::hardware_concurrency();
        config_.num_workers = static_cast<uint16_t>(hw == 0 ? 1 : std::min(hw, 256u));
    }
}

Http1Transport::~Http1Transport() {
    stop();
}

core::result<void> Http1Transport::bind(const std::string& host, uint16_t port) {
    auto sock = TcpSocket::listen_on(host, port, config_.backlog);
    if (!sock) {
        LOG_ERROR("Transport", "Failed to bind %s:%u: %s", host.c_str(), port,
                  sock.get_error().describe().c_str());
        return core::err(sock.error(), sock.get_error().message);
    }
    listener_ = std::move(sock).value();

    auto local = listener_.local_port();
    bound_port_.store(local ? local.value() : port);
    stop_requested_.store(false);

    LOG_INFO("Transport", "Bound %s:%u", host.c_str(), bound_port_.load());
    return core::ok();
}

core::result<void> Http1Transport::serve(RequestCallback callback) {
    if (!listener_.is_valid()) {
        return core::err(core::error_code::bind_failed, "serve() called before bind()");
    }
    if (stop_requested_.load()) {
        return core::ok();
    }

    LOG_INFO("Transport", "Serving on port %u with %u workers", bound_port_.load(), config_.num_workers);

    std::vector<std::thread> workers;
    workers.reserve(config_.num_workers);
    for (int i = 0; i < config_.num_workers; ++i) {
        workers.emplace_back(&Http1Transport::worker_loop, this, i, std::cref(callback));
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    LOG_INFO("Transport", "All workers stopped");
    return core::ok();
}

void Http1Transport::stop() noexcept {
    stop_requested_.store(true);
    listener_.shutdown();

    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (int fd : connections_) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void Http1Transport::track(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(fd);
}

void Http1Transport::untrack(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(fd);
}

void Http1Transport::worker_loop(int worker_id, const RequestCallback& callback) {
    LOG_DEBUG("Transport", "Worker %d started", worker_id);

    while (!stop_requested_.load()) {
        std::string peer;
        auto accepted = listener_.accept(&peer);
        if (!accepted) {
            if (stop_requested_.load()) {
                break;
            }
            LOG_WARN("Transport", "Worker %d: %s", worker_id, accepted.get_error().describe().c_str());
            std::this_thread::yield();
            continue;
        }

        TcpSocket conn = std::move(accepted).value();
        conn.set_nodelay();

        track(conn.fd());
        if (!stop_requested_.load()) {
            serve_connection(conn, peer, callback);
        }
        untrack(conn.fd());
    }

    LOG_DEBUG("Transport", "Worker %d exiting", worker_id);
}

void Http1Transport::serve_connection(TcpSocket& conn, const std::string& peer,
                                      const RequestCallback& callback) {
    std::string buffer;
    char tmp[kReadBufferSize];

    while (!stop_requested_.load()) {
        Http1RequestHead head;
        size_t consumed = 0;
        Http1ParseStatus status = parser_.parse(buffer, head, consumed);

        if (status == Http1ParseStatus::INCOMPLETE) {
            auto n = conn.read_some(tmp, sizeof(tmp));
            if (!n || n.value() == 0) {
                return;  // Peer closed or connection shut down
            }
            buffer.append(tmp, n.value());
            continue;
        }

        if (status == Http1ParseStatus::INVALID) {
            LOG_DEBUG("Transport", "Malformed request head from %s", peer.c_str());
            reject(conn, 400, peer);
            return;
        }

        if (status == Http1ParseStatus::TOO_LARGE) {
            LOG_DEBUG("Transport", "Request head too large from %s", peer.c_str());
            reject(conn, 431, peer);
            return;
        }

        buffer.erase(0, consumed);

        if (head.chunked) {
            reject(conn, 411, peer);
            return;
        }

        bool keep_alive = config_.keep_alive && head.keep_alive;
        Http1Request request(head, conn, buffer, peer);

        http::TransportResponse response;
        try {
            response = callback(request);
        } catch (const std::exception& e) {
            LOG_ERROR("Transport", "Request callback threw: %s", e.what());
            response = transport_error(500);
        }

        // Unread body bytes would be parsed as the next request head
        if (!request.body_complete()) {
            keep_alive = false;
        }

        auto written = conn.write_all(serialize_response(response, keep_alive));
        if (!written) {
            LOG_DEBUG("Transport", "Write to %s failed: %s", peer.c_str(),
                      written.get_error().describe().c_str());
            return;
        }

        if (!keep_alive) {
            return;
        }
    }
}

} // namespace net
} // namespace ripcord

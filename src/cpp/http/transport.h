#pragma once

#include "core/result.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ripcord {
namespace http {

/**
 * Ordered (name, value) pairs, case as received.
 */
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * One inbound request as the transport server hands it over.
 *
 * Everything except the body is available up front. The body is a stream
 * that read_chunk() consumes; the core stops reading as soon as the running
 * total crosses the body cap, so transports must not buffer the whole body
 * before the first chunk is requested.
 */
class TransportRequest {
public:
    virtual ~TransportRequest() = default;

    virtual std::string method() const = 0;
    virtual std::string path() const = 0;

    /**
     * Raw query string without the leading '?', empty if absent.
     */
    virtual std::string query_string() const = 0;

    virtual HeaderList headers() const = 0;
    virtual HeaderList cookies() const = 0;

    /**
     * Path captures resolved by the transport's own routing (may be empty).
     */
    virtual std::unordered_map<std::string, std::string> params() const = 0;

    /**
     * Read the next body chunk into chunk (replacing its contents).
     *
     * @return true if a chunk was produced, false at end of body, or an
     *         io_error if the stream failed
     */
    virtual core::result<bool> read_chunk(std::string& chunk) = 0;

    virtual std::optional<std::string> peer_address() const = 0;
};

/**
 * Finalized response handed back to the transport.
 */
struct TransportResponse {
    uint16_t status{200};
    std::string content_type;
    HeaderList headers;
    std::vector<std::string> set_cookies;  // Complete Set-Cookie values
    std::string body;
};

/**
 * Listener collaborator driven by App::listen().
 */
class TransportServer {
public:
    using RequestCallback = std::function<TransportResponse(TransportRequest&)>;

    virtual ~TransportServer() = default;

    /**
     * Bind the listening socket. Failure is reported, never thrown.
     */
    virtual core::result<void> bind(const std::string& host, uint16_t port) = 0;

    /**
     * Serve requests until stop() is called. Blocks the caller.
     * Each request is passed to callback, possibly from several threads at once.
     */
    virtual core::result<void> serve(RequestCallback callback) = 0;

    /**
     * Ask serve() to return. Safe to call from any thread.
     */
    virtual void stop() noexcept = 0;
};

} // namespace http
} // namespace ripcord

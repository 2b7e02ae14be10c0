/**
 * @file app.h
 * @brief Composition root: route and middleware registration, transport bridge
 *
 * Example:
 * @code
 * #include "http/app.h"
 *
 * int main() {
 *     ripcord::http::App app;
 *
 *     app.use(ripcord::middlewares::logger());
 *
 *     app.get("/", [](const auto& req, ResponseBuilder res) {
 *         return res.text("Hello World");
 *     });
 *
 *     app.get("/users/{id}", [](const auto& req, ResponseBuilder res) {
 *         return res.json(*req.get_param("id"));
 *     });
 *
 *     return app.listen("0.0.0.0:8000");
 * }
 * @endcode
 */

#pragma once

#include "http_method.h"
#include "middleware_chain.h"
#include "request_context.h"
#include "response_builder.h"
#include "route_registry.h"
#include "transport.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ripcord {
namespace http {

/**
 * Application: owns the route registry and the middleware registrations and
 * bridges a TransportServer to them.
 *
 * Registration happens during setup. Once listen() has started serving,
 * further registrations are rejected and logged; the registries are then
 * read concurrently by every worker without locking.
 */
class App {
public:
    /**
     * Application configuration.
     */
    struct Config {
        std::string name = "ripcord";

        // Transport settings (used by listen(address))
        uint16_t num_workers = 0;          // 0 = hardware concurrency
        int backlog = 1024;
        size_t max_header_bytes = 16384;
        bool keep_alive = true;
    };

    /**
     * Create a new application with default configuration.
     */
    App();

    explicit App(const Config& config);

    ~App();

    // Non-copyable, non-movable (workers hold a pointer while serving)
    App(const App&) = delete;
    App& operator=(const App&) = delete;
    App(App&&) = delete;
    App& operator=(App&&) = delete;

    // =========================================================================
    // Route Registration
    // =========================================================================

    /**
     * Register a GET route.
     *
     * @param path Route path (literal segments and {param} captures)
     * @param handler Terminal handler
     */
    App& get(const std::string& path, Handler handler);

    App& post(const std::string& path, Handler handler);
    App& put(const std::string& path, Handler handler);

    /**
     * Register a DELETE route.
     */
    App& del(const std::string& path, Handler handler);

    App& patch(const std::string& path, Handler handler);

    /**
     * Register a route for an arbitrary method.
     */
    App& route(HttpMethod method, const std::string& path, Handler handler);

    // =========================================================================
    // Middleware
    // =========================================================================

    /**
     * Add a middleware that runs for every request.
     */
    App& use(Middleware middleware);

    /**
     * Add a middleware that runs for paths starting with prefix.
     */
    App& use(const std::string& prefix, Middleware middleware);

    // =========================================================================
    // Serving
    // =========================================================================

    /**
     * Bind "host:port" with the built-in HTTP/1.1 transport and serve until
     * stop() is called.
     *
     * @return 0 after a clean stop, 1 if the address is invalid or cannot
     *         be bound
     */
    int listen(const std::string& address);

    /**
     * Same as listen(address) with a caller-supplied transport.
     */
    int listen(const std::string& address, TransportServer& transport);

    /**
     * Ask a running listen() to return. Thread-safe.
     */
    void stop() noexcept;

    bool is_running() const noexcept { return serving_.load(); }

    // =========================================================================
    // Request handling
    // =========================================================================

    /**
     * Adapter run by the transport for every request: build the
     * RequestContext, run the resolved chain and finalize the response.
     * Never throws; every failure becomes a response.
     */
    TransportResponse handle(TransportRequest& request) const noexcept;

    /**
     * Dispatch an already-built context through the middleware chain and
     * the matching route.
     */
    ResponseBuilder dispatch(const RequestContext& request) const;

    /**
     * Registered routes in registration order.
     */
    std::vector<RouteRegistry::RouteInfo> routes() const { return registry_.routes(); }

    const Config& config() const noexcept { return config_; }

private:
    bool registration_open(const char* what, const std::string& path) const;

    Config config_;
    RouteRegistry registry_;
    MiddlewareChain middlewares_;
    std::atomic<bool> serving_{false};

    // Guards the hand-off between listen() and stop(): transport_ is only
    // stopped while listen() still owns it.
    std::mutex transport_mutex_;
    TransportServer* transport_ = nullptr;
    bool starting_ = false;
    bool stop_requested_ = false;
};

} // namespace http
} // namespace ripcord

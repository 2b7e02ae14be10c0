/**
 * @file app.cpp
 * @brief Implementation of the application composition root
 */

#include "app.h"
#include "core/logger.h"
#include "net/http1_transport.h"
#include "net/listen_address.h"

#include <exception>

namespace ripcord {
namespace http {

namespace {

/**
 * Map a RequestContext construction failure to its response.
 */
ResponseBuilder construction_error(const core::error& error) {
    ResponseBuilder res;
    switch (error.code) {
        case core::error_code::not_found:
            return not_found_response(res);
        case core::error_code::body_too_large:
            return error_response(res, 413, "Body too large");
        case core::error_code::invalid_utf8:
            return error_response(res, 400, "Invalid UTF-8 sequence");
        default:
            // invalid_json carries "Invalid JSON: <parser message>"
            return error_response(res, 400, error.describe());
    }
}

} // namespace

App::App() : App(Config{}) {}

App::App(const Config& config) : config_(config) {}

App::~App() {
    stop();
}

bool App::registration_open(const char* what, const std::string& path) const {
    if (serving_.load()) {
        LOG_ERROR("App", "Cannot register %s %s while serving", what, path.c_str());
        return false;
    }
    return true;
}

App& App::route(HttpMethod method, const std::string& path, Handler handler) {
    if (!registration_open(to_string(method), path)) {
        return *this;
    }
    auto added = registry_.add_route(method, path, std::move(handler));
    if (!added) {
        LOG_ERROR("App", "Route %s %s rejected: %s", to_string(method), path.c_str(),
                  added.get_error().describe().c_str());
    }
    return *this;
}

App& App::get(const std::string& path, Handler handler) {
    return route(HttpMethod::GET, path, std::move(handler));
}

App& App::post(const std::string& path, Handler handler) {
    return route(HttpMethod::POST, path, std::move(handler));
}

App& App::put(const std::string& path, Handler handler) {
    return route(HttpMethod::PUT, path, std::move(handler));
}

App& App::del(const std::string& path, Handler handler) {
    return route(HttpMethod::DELETE, path, std::move(handler));
}

App& App::patch(const std::string& path, Handler handler) {
    return route(HttpMethod::PATCH, path, std::move(handler));
}

App& App::use(Middleware middleware) {
    return use("", std::move(middleware));
}

App& App::use(const std::string& prefix, Middleware middleware) {
    if (!registration_open("middleware", prefix)) {
        return *this;
    }
    auto added = middlewares_.add(prefix, std::move(middleware));
    if (!added) {
        LOG_ERROR("App", "Middleware for '%s' rejected: %s", prefix.c_str(),
                  added.get_error().describe().c_str());
    }
    return *this;
}

ResponseBuilder App::dispatch(const RequestContext& request) const {
    auto match = registry_.dispatch(request.method(), request.path());
    if (!match) {
        LOG_DEBUG("App", "No route for %s %s", request.method_name(), request.path().c_str());
        return middlewares_.resolve(request.path(), nullptr).run(request, ResponseBuilder());
    }

    const RouteMatch& found = match.value();
    ResolvedChain chain = middlewares_.resolve(request.path(), found.handler);
    if (found.params.empty()) {
        return chain.run(request, ResponseBuilder());
    }

    // Route captures join the transport-provided params
    RequestContext with_params = request;
    for (const auto& [name, value] : found.params) {
        with_params.set_param(name, value);
    }
    return chain.run(with_params, ResponseBuilder());
}

TransportResponse App::handle(TransportRequest& request) const noexcept {
    try {
        auto ctx = RequestContext::from_transport(request);
        if (!ctx) {
            return construction_error(ctx.get_error()).finalize();
        }
        return dispatch(ctx.value()).finalize();
    } catch (const std::exception& e) {
        LOG_ERROR("App", "Unhandled exception: %s", e.what());
    } catch (...) {
        LOG_ERROR("App", "Unhandled non-standard exception");
    }

    try {
        return error_response(ResponseBuilder(), 500, "Internal Server Error").finalize();
    } catch (const std::exception& e) {
        // Allocation failure while building the error body
        LOG_ERROR("App", "Failed to build error response: %s", e.what());
        TransportResponse fallback;
        fallback.status = 500;
        return fallback;
    }
}

int App::listen(const std::string& address) {
    net::Http1TransportConfig transport_config;
    transport_config.num_workers = config_.num_workers;
    transport_config.backlog = config_.backlog;
    transport_config.max_header_bytes = config_.max_header_bytes;
    transport_config.keep_alive = config_.keep_alive;

    net::Http1Transport transport(transport_config);
    return listen(address, transport);
}

int App::listen(const std::string& address, TransportServer& transport) {
    auto parsed = net::parse_listen_address(address);
    if (!parsed) {
        LOG_ERROR("App", "%s: %s", config_.name.c_str(), parsed.get_error().describe().c_str());
        return 1;
    }

    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        starting_ = true;
        stop_requested_ = false;
    }

    auto bound = transport.bind(parsed.value().host, parsed.value().port);
    if (!bound) {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        starting_ = false;
        LOG_ERROR("App", "%s: failed to bind %s: %s", config_.name.c_str(), address.c_str(),
                  bound.get_error().describe().c_str());
        return 1;
    }

    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        starting_ = false;
        if (stop_requested_) {
            stop_requested_ = false;
            LOG_INFO("App", "%s stopped before serving", config_.name.c_str());
            return 0;
        }
        transport_ = &transport;
        serving_.store(true);
    }
    LOG_INFO("App", "%s listening on %s (%zu routes, %zu middlewares)", config_.name.c_str(),
             address.c_str(), registry_.size(), middlewares_.size());

    auto served = transport.serve([this](TransportRequest& request) {
        return handle(request);
    });

    {
        // Waits out a concurrent stop() before the transport can go away
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport_ = nullptr;
        serving_.store(false);
    }

    if (!served) {
        LOG_ERROR("App", "%s: %s", config_.name.c_str(), served.get_error().describe().c_str());
        return 1;
    }
    LOG_INFO("App", "%s stopped", config_.name.c_str());
    return 0;
}

void App::stop() noexcept {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    if (transport_) {
        transport_->stop();
    } else if (starting_) {
        stop_requested_ = true;
    }
}

} // namespace http
} // namespace ripcord

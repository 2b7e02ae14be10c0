#pragma once

#include "http_method.h"
#include "request_context.h"
#include "response_builder.h"
#include "core/result.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ripcord {
namespace http {

/**
 * Terminal route handler. Receives the request and the response produced so
 * far, returns the final response.
 */
using Handler = std::function<ResponseBuilder(const RequestContext&, ResponseBuilder)>;

/**
 * Successful dispatch: the chosen handler plus any {name} captures.
 */
struct RouteMatch {
    const Handler* handler{nullptr};
    std::unordered_map<std::string, std::string> params;
};

/**
 * Ordered, append-only list of (method, path, handler) registrations.
 *
 * Paths are matched segment by segment. A literal segment must match
 * exactly (case-sensitive); a segment written as {name} matches any single
 * non-empty segment and captures it under name. Entries are scanned in
 * registration order and the first match wins, so registering the same
 * (method, path) twice leaves the second entry unreachable.
 *
 * Populated during setup only; dispatch() is safe to call concurrently once
 * registration has finished.
 */
class RouteRegistry {
public:
    struct RouteInfo {
        HttpMethod method;
        std::string path;
    };

    RouteRegistry() = default;

    /**
     * Append a route.
     *
     * @return bad_request if path does not start with '/', contains an
     *         unterminated "{", or handler is empty
     */
    core::result<void> add_route(HttpMethod method, const std::string& path, Handler handler);

    /**
     * Resolve (method, path) to the first matching registration.
     *
     * @return the match, or not_found
     */
    core::result<RouteMatch> dispatch(HttpMethod method, const std::string& path) const;

    /**
     * Registered routes in registration order.
     */
    std::vector<RouteInfo> routes() const;

    size_t size() const noexcept { return routes_.size(); }

private:
    struct Segment {
        std::string text;   // Literal text, or the parameter name
        bool is_param{false};
    };

    struct Route {
        HttpMethod method;
        std::string path;
        std::vector<Segment> segments;
        bool has_params{false};
        Handler handler;
    };

    static bool match(const Route& route, const std::string& path,
                      std::unordered_map<std::string, std::string>& params);

    std::vector<Route> routes_;
};

} // namespace http
} // namespace ripcord

#include "route_registry.h"
#include "core/logger.h"

#include <string_view>

namespace ripcord {
namespace http {

namespace {

/**
 * Split "/a/b/" into {"a", "b", ""}. The leading '/' is dropped; a trailing
 * '/' yields an empty last segment so "/a" and "/a/" stay distinct.
 */
std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> parts;
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    size_t pos = 0;
    while (true) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            parts.push_back(path.substr(pos));
            break;
        }
        parts.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return parts;
}

} // namespace

core::result<void> RouteRegistry::add_route(HttpMethod method, const std::string& path, Handler handler) {
    if (path.empty() || path.front() != '/') {
        LOG_ERROR("Router", "Route path must start with '/': %s", path.c_str());
        return core::err(core::error_code::bad_request, "route path must start with '/': " + path);
    }
    if (!handler) {
        LOG_ERROR("Router", "Empty handler for %s %s", to_string(method), path.c_str());
        return core::err(core::error_code::bad_request, "empty handler for " + path);
    }

    Route route;
    route.method = method;
    route.path = path;
    route.handler = std::move(handler);

    for (std::string_view part : split_path(path)) {
        Segment segment;
        if (!part.empty() && part.front() == '{') {
            if (part.size() < 3 || part.back() != '}') {
                LOG_ERROR("Router", "Malformed parameter segment in %s", path.c_str());
                return core::err(core::error_code::bad_request, "malformed parameter in " + path);
            }
            segment.text = std::string(part.substr(1, part.size() - 2));
            segment.is_param = true;
            route.has_params = true;
        } else {
            segment.text = std::string(part);
        }
        route.segments.push_back(std::move(segment));
    }

    LOG_DEBUG("Router", "Registered %s %s", to_string(method), path.c_str());
    routes_.push_back(std::move(route));
    return core::ok();
}

bool RouteRegistry::match(const Route& route, const std::string& path,
                          std::unordered_map<std::string, std::string>& params) {
    if (!route.has_params) {
        return route.path == path;
    }

    auto parts = split_path(path);
    if (parts.size() != route.segments.size()) {
        return false;
    }

    std::unordered_map<std::string, std::string> captured;
    for (size_t i = 0; i < parts.size(); ++i) {
        const Segment& segment = route.segments[i];
        if (segment.is_param) {
            if (parts[i].empty()) {
                return false;
            }
            captured.insert_or_assign(segment.text, std::string(parts[i]));
        } else if (segment.text != parts[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

core::result<RouteMatch> RouteRegistry::dispatch(HttpMethod method, const std::string& path) const {
    if (path.empty() || path.front() != '/') {
        return core::err<RouteMatch>(core::error_code::not_found, "Not Found");
    }

    for (const auto& route : routes_) {
        if (route.method != method) {
            continue;
        }
        RouteMatch found;
        if (match(route, path, found.params)) {
            found.handler = &route.handler;
            return found;
        }
    }
    return core::err<RouteMatch>(core::error_code::not_found, "Not Found");
}

std::vector<RouteRegistry::RouteInfo> RouteRegistry::routes() const {
    std::vector<RouteInfo> out;
    out.reserve(routes_.size());
    for (const auto& route : routes_) {
        out.push_back(RouteInfo{route.method, route.path});
    }
    return out;
}

} // namespace http
} // namespace ripcord

#pragma once

#include "request_context.h"
#include "response_builder.h"
#include "route_registry.h"
#include "core/result.h"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ripcord {
namespace http {

class ResolvedChain;

/**
 * Single-use continuation: "the rest of the chain plus the handler".
 *
 * A middleware either returns without calling run() (short-circuit) or calls
 * it once and returns the downstream response, optionally post-processed.
 * A second call, or a call on a moved-from Next, runs nothing and hands the
 * given response straight back.
 *
 * @code
 * app.use([](const RequestContext& req, ResponseBuilder res, Next next) {
 *     if (!req.get_header("Authorization")) {
 *         return res.status(401).text("Unauthorized");
 *     }
 *     return next.run(req, res);
 * });
 * @endcode
 */
class Next {
public:
    Next(const Next&) = delete;
    Next& operator=(const Next&) = delete;

    Next(Next&& other) noexcept;
    Next& operator=(Next&& other) noexcept;

    ResponseBuilder run(const RequestContext& request, ResponseBuilder response);

    /**
     * True once run() has been called (or the continuation was moved away).
     */
    bool consumed() const noexcept { return chain_ == nullptr; }

private:
    friend class ResolvedChain;

    Next(const ResolvedChain* chain, size_t cursor) noexcept
        : chain_(chain), cursor_(cursor) {}

    const ResolvedChain* chain_;
    size_t cursor_;
};

/**
 * Middleware: sees every request whose path starts with its prefix.
 */
using Middleware = std::function<ResponseBuilder(const RequestContext&, ResponseBuilder, Next)>;

/**
 * Chain resolved for one request: the matching middlewares in registration
 * order, then the dispatched handler (or the built-in 404 when there is
 * none). Holds pointers into the registries, which must outlive it.
 */
class ResolvedChain {
public:
    ResolvedChain(std::vector<const Middleware*> middlewares, const Handler* handler)
        : middlewares_(std::move(middlewares)), handler_(handler) {}

    /**
     * Execute from the first middleware.
     */
    ResponseBuilder run(const RequestContext& request, ResponseBuilder response) const;

    size_t size() const noexcept { return middlewares_.size(); }
    bool has_handler() const noexcept { return handler_ != nullptr; }

private:
    friend class Next;

    ResponseBuilder invoke(size_t cursor, const RequestContext& request,
                           ResponseBuilder response) const;

    std::vector<const Middleware*> middlewares_;
    const Handler* handler_;
};

/**
 * Ordered (prefix, middleware) registrations.
 */
class MiddlewareChain {
public:
    /**
     * Register a middleware for paths starting with prefix ("" or "/" for
     * every path).
     *
     * @return bad_request if middleware is empty
     */
    core::result<void> add(std::string prefix, Middleware middleware);

    /**
     * Collect the middlewares whose prefix matches path and terminate the
     * chain with handler (nullptr selects the built-in not-found response).
     */
    ResolvedChain resolve(const std::string& path, const Handler* handler) const;

    size_t size() const noexcept { return entries_.size(); }

private:
    struct Entry {
        std::string prefix;
        Middleware middleware;
    };

    std::vector<Entry> entries_;
};

/**
 * JSON error response: res.status(status).json({"error": message}).
 */
ResponseBuilder error_response(ResponseBuilder response, uint16_t status, const std::string& message);

/**
 * Built-in terminal response when no route matched: 404 {"error":"Not Found"}.
 */
ResponseBuilder not_found_response(ResponseBuilder response);

} // namespace http
} // namespace ripcord

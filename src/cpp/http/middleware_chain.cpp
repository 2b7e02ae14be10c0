#include "middleware_chain.h"
#include "core/logger.h"

namespace ripcord {
namespace http {

Next::Next(Next&& other) noexcept
    : chain_(other.chain_), cursor_(other.cursor_) {
    other.chain_ = nullptr;
}

Next& Next::operator=(Next&& other) noexcept {
    if (this != &other) {
        chain_ = other.chain_;
        cursor_ = other.cursor_;
        other.chain_ = nullptr;
    }
    return *this;
}

ResponseBuilder Next::run(const RequestContext& request, ResponseBuilder response) {
    if (!chain_) {
        LOG_WARN("Chain", "next() called more than once for %s", request.path().c_str());
        return response;
    }
    const ResolvedChain* chain = chain_;
    chain_ = nullptr;
    return chain->invoke(cursor_, request, std::move(response));
}

ResponseBuilder ResolvedChain::run(const RequestContext& request, ResponseBuilder response) const {
    return invoke(0, request, std::move(response));
}

ResponseBuilder ResolvedChain::invoke(size_t cursor, const RequestContext& request,
                                      ResponseBuilder response) const {
    if (cursor < middlewares_.size()) {
        LOG_DEBUG("Chain", "middleware %zu/%zu for %s", cursor + 1, middlewares_.size(),
                  request.path().c_str());
        return (*middlewares_[cursor])(request, std::move(response), Next(this, cursor + 1));
    }
    if (handler_) {
        return (*handler_)(request, std::move(response));
    }
    return not_found_response(std::move(response));
}

core::result<void> MiddlewareChain::add(std::string prefix, Middleware middleware) {
    if (!middleware) {
        LOG_ERROR("Chain", "Empty middleware for prefix '%s'", prefix.c_str());
        return core::err(core::error_code::bad_request, "empty middleware");
    }
    entries_.push_back(Entry{std::move(prefix), std::move(middleware)});
    return core::ok();
}

ResolvedChain MiddlewareChain::resolve(const std::string& path, const Handler* handler) const {
    std::vector<const Middleware*> matched;
    for (const auto& entry : entries_) {
        if (path.rfind(entry.prefix, 0) == 0) {
            matched.push_back(&entry.middleware);
        }
    }
    return ResolvedChain(std::move(matched), handler);
}

ResponseBuilder error_response(ResponseBuilder response, uint16_t status, const std::string& message) {
    JsonValue body = JsonValue::object();
    body["error"] = message;
    return response.status(status).json(body);
}

ResponseBuilder not_found_response(ResponseBuilder response) {
    return error_response(std::move(response), 404, "Not Found");
}

} // namespace http
} // namespace ripcord

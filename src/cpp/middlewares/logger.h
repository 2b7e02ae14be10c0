#pragma once

#include "http/middleware_chain.h"

#include <cstdint>
#include <string>

namespace ripcord {
namespace middlewares {

/**
 * Parts of the access line to emit.
 */
struct LoggerConfig {
    bool method = true;
    bool path = true;
    bool duration = true;
};

/**
 * Request logger middleware.
 *
 * Forwards to the rest of the chain, then writes one line tagged "Access"
 * through core::Logger and returns the downstream response unchanged:
 *
 *   path: /users, Time taken: 3ms, method: GET
 *
 * Usage:
 *   app.use(middlewares::logger());
 *   app.use("/api", middlewares::logger({.method = true, .path = true, .duration = false}));
 */
http::Middleware logger(LoggerConfig config = {});

/**
 * Build the access line for one request.
 */
std::string format_access_line(const LoggerConfig& config, const std::string& path,
                               int64_t duration_ms, const char* method);

} // namespace middlewares
} // namespace ripcord

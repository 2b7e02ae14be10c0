#include "logger.h"
#include "core/logger.h"

#include <chrono>

namespace ripcord {
namespace middlewares {

std::string format_access_line(const LoggerConfig& config, const std::string& path,
                               int64_t duration_ms, const char* method) {
    std::string line;
    if (config.path) {
        line += "path: " + path + ", ";
    }
    if (config.duration) {
        line += "Time taken: " + std::to_string(duration_ms) + "ms, ";
    }
    if (config.method) {
        line += "method: ";
        line += method;
    }
    return line;
}

http::Middleware logger(LoggerConfig config) {
    return [config](const http::RequestContext& req, http::ResponseBuilder res, http::Next next) {
        auto start = std::chrono::steady_clock::now();

        http::ResponseBuilder out = next.run(req, std::move(res));

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        core::Logger::instance().write(
            core::LogLevel::INFO, "Access",
            format_access_line(config, req.path(), elapsed.count(), req.method_name()));
        return out;
    };
}

} // namespace middlewares
} // namespace ripcord

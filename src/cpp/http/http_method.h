#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#ifdef DELETE
    #undef DELETE
#endif

namespace ripcord {
namespace http {

/**
 * Methods a route can be registered for.
 */
enum class HttpMethod : uint8_t {
    GET,
    PUT,
    POST,
    DELETE,
    PATCH
};

/**
 * Upper-case method name ("GET", "POST", ...).
 */
const char* to_string(HttpMethod method) noexcept;

/**
 * Parse an upper-case method token. Other methods (HEAD, OPTIONS, ...)
 * have no HttpMethod counterpart and yield nullopt.
 */
std::optional<HttpMethod> parse_method(std::string_view token) noexcept;

} // namespace http
} // namespace ripcord

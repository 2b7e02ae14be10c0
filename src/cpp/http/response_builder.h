#pragma once

#include "json_value.h"
#include "transport.h"
#include "core/result.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ripcord {
namespace http {

/**
 * Content type implied by the last body setter.
 */
enum class ResponseContentType : uint8_t {
    JSON,
    TEXT
};

/**
 * Value-semantics response accumulator.
 *
 * Every setter returns a new builder and leaves the receiver untouched, so a
 * middleware can hold on to the value it was given while downstream code
 * produces a different one:
 *
 * @code
 * return res.status(201).json(user).set_header("Location", "/users/7");
 * @endcode
 */
class ResponseBuilder {
public:
    ResponseBuilder() = default;

    ResponseBuilder status(uint16_t code) const;

    /**
     * Serialize value through to_json() and mark the body as JSON.
     */
    template<typename T>
    ResponseBuilder json(const T& value) const {
        return with_body(to_json(value).dump(), ResponseContentType::JSON);
    }

    ResponseBuilder text(std::string value) const;

    // Common statuses
    ResponseBuilder ok() const { return status(200); }
    ResponseBuilder bad_request() const { return status(400); }
    ResponseBuilder not_found() const { return status(404); }
    ResponseBuilder internal_server_error() const { return status(500); }

    /**
     * 302 with a Location header.
     */
    ResponseBuilder redirect(const std::string& location) const;

    /**
     * Set a header, replacing an existing one with the same (exact) name.
     */
    ResponseBuilder set_header(const std::string& name, const std::string& value) const;

    /**
     * Header previously set on this builder; missing_header otherwise.
     */
    core::result<std::string> get_header(const std::string& name) const;

    ResponseBuilder set_cookie(const std::string& name, const std::string& value) const;

    /**
     * Emit an expiring cookie (Max-Age=0) so the client drops it.
     */
    ResponseBuilder clear_cookie(const std::string& name) const;

    uint16_t status_code() const noexcept { return status_; }
    ResponseContentType content_type() const noexcept { return content_type_; }
    const std::string& body() const noexcept { return body_; }
    const HeaderList& headers() const noexcept { return headers_; }

    /**
     * Map status, body and implied content type onto a transport response.
     */
    TransportResponse finalize() const;

    bool operator==(const ResponseBuilder& other) const;
    bool operator!=(const ResponseBuilder& other) const { return !(*this == other); }

private:
    struct Cookie {
        std::string name;
        std::string value;
        bool expire{false};

        bool operator==(const Cookie& other) const {
            return name == other.name && value == other.value && expire == other.expire;
        }
    };

    ResponseBuilder with_body(std::string body, ResponseContentType type) const;
    ResponseBuilder with_cookie(Cookie cookie) const;

    uint16_t status_{200};
    ResponseContentType content_type_{ResponseContentType::TEXT};
    std::string body_;
    HeaderList headers_;
    std::vector<Cookie> cookies_;
};

const char* content_type_header(ResponseContentType type) noexcept;

} // namespace http
} // namespace ripcord

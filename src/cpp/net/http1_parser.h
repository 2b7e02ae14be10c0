#pragma once

#include "http/transport.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ripcord {
namespace net {

/**
 * HTTP version.
 */
enum class Http1Version : uint8_t {
    HTTP_1_0 = 0,
    HTTP_1_1 = 1
};

/**
 * Parsed HTTP/1.x request head (request line + headers).
 *
 * The body is not part of the head: the transport streams it to the core
 * chunk by chunk using content_length.
 */
struct Http1RequestHead {
    std::string method;
    std::string target;   // Request target as sent ("/a?b=c")
    std::string path;     // Target up to '?' or '#'
    std::string query;    // Between '?' and '#', without the '?'
    Http1Version version{Http1Version::HTTP_1_1};

    http::HeaderList headers;  // Case as received

    uint64_t content_length{0};
    bool has_content_length{false};
    bool chunked{false};
    bool keep_alive{false};

    /**
     * Header value by name (case-insensitive), empty if absent.
     */
    std::string_view get_header(std::string_view name) const noexcept;

    bool has_header(std::string_view name) const noexcept;
};

/**
 * Outcome of Http1Parser::parse().
 */
enum class Http1ParseStatus : uint8_t {
    COMPLETE,    // Head parsed; consumed bytes belong to it
    INCOMPLETE,  // Need more data
    INVALID,     // Malformed request line or header
    TOO_LARGE    // Head exceeds the configured limit
};

/**
 * HTTP/1.0 and HTTP/1.1 request-head parser.
 *
 * Stateless between calls: the connection loop appends to its buffer and
 * calls parse() again until the head is complete.
 */
class Http1Parser {
public:
    explicit Http1Parser(size_t max_head_bytes = 16384) noexcept
        : max_head_bytes_(max_head_bytes) {}

    /**
     * Parse a request head from the start of buffer.
     *
     * @param buffer Received bytes
     * @param out Filled on COMPLETE
     * @param consumed Bytes of buffer that make up the head (incl. the blank line)
     */
    Http1ParseStatus parse(std::string_view buffer, Http1RequestHead& out, size_t& consumed) const;

    static bool str_eq_ci(std::string_view a, std::string_view b) noexcept;

private:
    static bool is_token_char(unsigned char c) noexcept;
    static Http1ParseStatus parse_request_line(std::string_view line, Http1RequestHead& out);
    static void split_target(Http1RequestHead& out);

    size_t max_head_bytes_;
};

/**
 * Split a Cookie header value ("a=1; b=2") into (name, value) pairs.
 * Entries without '=' are skipped.
 */
http::HeaderList parse_cookie_header(std::string_view value);

/**
 * Reason phrase for a status code ("OK", "Not Found", ...).
 */
const char* status_reason(uint16_t status) noexcept;

} // namespace net
} // namespace ripcord

#include "http1_parser.h"

#include <cctype>
#include <charconv>

namespace ripcord {
namespace net {

namespace {

constexpr size_t kMaxHeaders = 100;

std::string_view trim_ows(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool contains_ci(std::string_view haystack, std::string_view needle) noexcept {
    if (needle.size() > haystack.size()) {
        return false;
    }
    for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        if (Http1Parser::str_eq_ci(haystack.substr(i, needle.size()), needle)) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Http1RequestHead
// ============================================================================

std::string_view Http1RequestHead::get_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (Http1Parser::str_eq_ci(header.first, name)) {
            return header.second;
        }
    }
    return {};
}

bool Http1RequestHead::has_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (Http1Parser::str_eq_ci(header.first, name)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Http1Parser
// ============================================================================

Http1ParseStatus Http1Parser::parse(std::string_view buffer, Http1RequestHead& out,
                                    size_t& consumed) const {
    size_t end = buffer.find("\r\n\r\n");
    if (end == std::string_view::npos) {
        return buffer.size() > max_head_bytes_ ? Http1ParseStatus::TOO_LARGE
                                               : Http1ParseStatus::INCOMPLETE;
    }
    size_t head_len = end + 4;
    if (head_len > max_head_bytes_) {
        return Http1ParseStatus::TOO_LARGE;
    }

    std::string_view text = buffer.substr(0, end);
    size_t line_end = text.find("\r\n");
    if (line_end == std::string_view::npos) {
        line_end = text.size();
    }

    Http1RequestHead head;
    auto status = parse_request_line(text.substr(0, line_end), head);
    if (status != Http1ParseStatus::COMPLETE) {
        return status;
    }

    // Header lines: "Name: value"
    size_t pos = line_end + 2;
    while (pos < text.size()) {
        size_t next = text.find("\r\n", pos);
        if (next == std::string_view::npos) {
            next = text.size();
        }
        std::string_view line = text.substr(pos, next - pos);
        pos = next + 2;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return Http1ParseStatus::INVALID;
        }
        std::string_view name = line.substr(0, colon);
        for (char c : name) {
            if (!is_token_char(static_cast<unsigned char>(c))) {
                return Http1ParseStatus::INVALID;
            }
        }
        if (head.headers.size() >= kMaxHeaders) {
            return Http1ParseStatus::INVALID;
        }
        head.headers.emplace_back(std::string(name), std::string(trim_ows(line.substr(colon + 1))));
    }

    if (head.has_header("content-length")) {
        std::string_view value = head.get_header("content-length");
        uint64_t length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
            return Http1ParseStatus::INVALID;
        }
        head.content_length = length;
        head.has_content_length = true;
    }

    head.chunked = contains_ci(head.get_header("transfer-encoding"), "chunked");

    std::string_view connection = head.get_header("connection");
    if (head.version == Http1Version::HTTP_1_1) {
        head.keep_alive = !contains_ci(connection, "close");
    } else {
        head.keep_alive = contains_ci(connection, "keep-alive");
    }

    out = std::move(head);
    consumed = head_len;
    return Http1ParseStatus::COMPLETE;
}

Http1ParseStatus Http1Parser::parse_request_line(std::string_view line, Http1RequestHead& out) {
    // METHOD SP target SP HTTP/1.x
    size_t first_space = line.find(' ');
    if (first_space == std::string_view::npos || first_space == 0) {
        return Http1ParseStatus::INVALID;
    }
    size_t second_space = line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos || second_space == first_space + 1) {
        return Http1ParseStatus::INVALID;
    }

    std::string_view method = line.substr(0, first_space);
    for (char c : method) {
        if (!is_token_char(static_cast<unsigned char>(c))) {
            return Http1ParseStatus::INVALID;
        }
    }

    std::string_view version = line.substr(second_space + 1);
    if (version == "HTTP/1.1") {
        out.version = Http1Version::HTTP_1_1;
    } else if (version == "HTTP/1.0") {
        out.version = Http1Version::HTTP_1_0;
    } else {
        return Http1ParseStatus::INVALID;
    }

    out.method = std::string(method);
    out.target = std::string(line.substr(first_space + 1, second_space - first_space - 1));
    split_target(out);
    return Http1ParseStatus::COMPLETE;
}

void Http1Parser::split_target(Http1RequestHead& out) {
    std::string_view target(out.target);

    size_t fragment_pos = target.find('#');
    if (fragment_pos != std::string_view::npos) {
        target = target.substr(0, fragment_pos);
    }

    size_t query_pos = target.find('?');
    if (query_pos != std::string_view::npos) {
        out.path = std::string(target.substr(0, query_pos));
        out.query = std::string(target.substr(query_pos + 1));
    } else {
        out.path = std::string(target);
        out.query.clear();
    }
}

bool Http1Parser::is_token_char(unsigned char c) noexcept {
    // RFC 7230 tchar
    return std::isalnum(c) || c == '!' || c == '#' || c == '$' || c == '%' ||
           c == '&' || c == '\'' || c == '*' || c == '+' || c == '-' ||
           c == '.' || c == '^' || c == '_' || c == '`' || c == '|' || c == '~';
}

bool Http1Parser::str_eq_ci(std::string_view a, std::string_view b) noexcept {
    if (a.length() != b.length()) {
        return false;
    }
    for (size_t i = 0; i < a.length(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

http::HeaderList parse_cookie_header(std::string_view value) {
    http::HeaderList cookies;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t semi = value.find(';', pos);
        if (semi == std::string_view::npos) {
            semi = value.size();
        }
        std::string_view entry = trim_ows(value.substr(pos, semi - pos));
        size_t eq = entry.find('=');
        if (eq != std::string_view::npos && eq > 0) {
            cookies.emplace_back(std::string(trim_ows(entry.substr(0, eq))),
                                 std::string(trim_ows(entry.substr(eq + 1))));
        }
        pos = semi + 1;
    }
    return cookies;
}

const char* status_reason(uint16_t status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

} // namespace net
} // namespace ripcord

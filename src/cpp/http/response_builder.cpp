#include "response_builder.h"

namespace ripcord {
namespace http {

const char* content_type_header(ResponseContentType type) noexcept {
    switch (type) {
        case ResponseContentType::JSON: return "application/json";
        case ResponseContentType::TEXT: return "text/plain; charset=utf-8";
    }
    return "application/octet-stream";
}

ResponseBuilder ResponseBuilder::status(uint16_t code) const {
    ResponseBuilder next = *this;
    next.status_ = code;
    return next;
}

ResponseBuilder ResponseBuilder::text(std::string value) const {
    return with_body(std::move(value), ResponseContentType::TEXT);
}

ResponseBuilder ResponseBuilder::with_body(std::string body, ResponseContentType type) const {
    ResponseBuilder next = *this;
    next.body_ = std::move(body);
    next.content_type_ = type;
    return next;
}

ResponseBuilder ResponseBuilder::redirect(const std::string& location) const {
    return status(302).set_header("Location", location);
}

ResponseBuilder ResponseBuilder::set_header(const std::string& name, const std::string& value) const {
    ResponseBuilder next = *this;
    for (auto& header : next.headers_) {
        if (header.first == name) {
            header.second = value;
            return next;
        }
    }
    next.headers_.emplace_back(name, value);
    return next;
}

core::result<std::string> ResponseBuilder::get_header(const std::string& name) const {
    for (const auto& header : headers_) {
        if (header.first == name) {
            return header.second;
        }
    }
    return core::err<std::string>(core::error_code::missing_header, "Missing header: " + name);
}

ResponseBuilder ResponseBuilder::set_cookie(const std::string& name, const std::string& value) const {
    return with_cookie(Cookie{name, value, false});
}

ResponseBuilder ResponseBuilder::clear_cookie(const std::string& name) const {
    return with_cookie(Cookie{name, "", true});
}

ResponseBuilder ResponseBuilder::with_cookie(Cookie cookie) const {
    ResponseBuilder next = *this;
    for (auto& existing : next.cookies_) {
        if (existing.name == cookie.name) {
            existing = std::move(cookie);
            return next;
        }
    }
    next.cookies_.push_back(std::move(cookie));
    return next;
}

TransportResponse ResponseBuilder::finalize() const {
    TransportResponse out;
    out.status = status_;
    out.content_type = content_type_header(content_type_);
    out.headers = headers_;
    out.body = body_;
    out.set_cookies.reserve(cookies_.size());
    for (const auto& cookie : cookies_) {
        std::string line = cookie.name + "=" + cookie.value + "; Path=/";
        if (cookie.expire) {
            line += "; Max-Age=0";
        }
        out.set_cookies.push_back(std::move(line));
    }
    return out;
}

bool ResponseBuilder::operator==(const ResponseBuilder& other) const {
    return status_ == other.status_ &&
           content_type_ == other.content_type_ &&
           body_ == other.body_ &&
           headers_ == other.headers_ &&
           cookies_ == other.cookies_;
}

} // namespace http
} // namespace ripcord

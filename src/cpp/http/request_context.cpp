#include "request_context.h"
#include "core/logger.h"

#include <cctype>
#include <string_view>

namespace ripcord {
namespace http {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> lookup(const RequestContext::StringMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> find_header(const RequestContext::StringMap& headers,
                                       const std::string& name) {
    auto exact = headers.find(name);
    if (exact != headers.end()) {
        return exact->second;
    }
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view trim(std::string_view s) noexcept {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string resolve_ip(const RequestContext::StringMap& headers,
                       const std::optional<std::string>& peer) {
    auto forwarded = find_header(headers, "X-Forwarded-For");
    if (forwarded) {
        std::string_view value(*forwarded);
        std::string_view first = trim(value.substr(0, value.find(',')));
        if (!first.empty()) {
            return std::string(first);
        }
    }
    if (peer && !peer->empty()) {
        return *peer;
    }
    return "unknown";
}

core::result<std::string> read_body(TransportRequest& request) {
    std::string body;
    std::string chunk;
    for (;;) {
        auto more = request.read_chunk(chunk);
        if (!more) {
            return core::err<std::string>(core::error_code::io_error,
                                          "Failed to read body: " + more.get_error().describe());
        }
        if (!more.value()) {
            break;
        }
        if (body.size() + chunk.size() > kMaxBodySize) {
            return core::err<std::string>(core::error_code::body_too_large, "Body too large");
        }
        body += chunk;
    }
    return core::ok(std::move(body));
}

core::result<BodyContent> parse_body(BodyType type, std::string bytes) {
    switch (type) {
        case BodyType::JSON: {
            auto parsed = JsonValue::parse(bytes);
            if (!parsed) {
                return core::result<BodyContent>(parsed.get_error());
            }
            return core::ok(BodyContent(std::move(parsed).value()));
        }
        case BodyType::FORM:
        case BodyType::TEXT:
            if (!is_valid_utf8(bytes)) {
                return core::err<BodyContent>(core::error_code::invalid_utf8, "Invalid UTF-8 sequence");
            }
            if (type == BodyType::FORM) {
                return core::ok(BodyContent(FormBody{std::move(bytes)}));
            }
            return core::ok(BodyContent(TextBody{std::move(bytes)}));
    }
    return core::err<BodyContent>(core::error_code::bad_request, "Unknown body type");
}

} // namespace

RequestContext::StringMap parse_pairs(std::string_view raw) {
    RequestContext::StringMap pairs;
    size_t pos = 0;
    while (pos <= raw.size()) {
        size_t amp = raw.find('&', pos);
        if (amp == std::string_view::npos) {
            amp = raw.size();
        }
        std::string_view segment = raw.substr(pos, amp - pos);
        size_t eq = segment.find('=');
        if (eq != std::string_view::npos) {
            pairs.insert_or_assign(std::string(segment.substr(0, eq)),
                                   std::string(segment.substr(eq + 1)));
        }
        pos = amp + 1;
    }
    return pairs;
}

BodyType classify_content_type(const std::optional<std::string>& content_type) noexcept {
    if (!content_type) {
        return BodyType::TEXT;
    }
    if (content_type->find("application/json") != std::string::npos) {
        return BodyType::JSON;
    }
    if (content_type->find("application/x-www-form-urlencoded") != std::string::npos) {
        return BodyType::FORM;
    }
    return BodyType::TEXT;
}

RequestContext::RequestContext()
    : path_("/"), origin_url_("/"), ip_("unknown"), body_(TextBody{}) {}

core::result<RequestContext> RequestContext::from_transport(TransportRequest& request) {
    std::string method_token = request.method();
    auto method = parse_method(method_token);
    if (!method) {
        LOG_DEBUG("Request", "Unsupported method: %s", method_token.c_str());
        return core::err<RequestContext>(core::error_code::not_found,
                                         "Unsupported method: " + method_token);
    }

    RequestContext ctx;
    ctx.method_ = *method;
    ctx.path_ = request.path();

    std::string query = request.query_string();
    ctx.origin_url_ = query.empty() ? ctx.path_ : ctx.path_ + "?" + query;
    ctx.queries_ = parse_pairs(query);

    for (auto& [name, value] : request.headers()) {
        ctx.headers_.insert_or_assign(name, value);
    }
    for (auto& [name, value] : request.cookies()) {
        ctx.cookies_.insert_or_assign(name, value);
    }
    ctx.params_ = request.params();
    ctx.ip_ = resolve_ip(ctx.headers_, request.peer_address());

    BodyType type = classify_content_type(find_header(ctx.headers_, "content-type"));

    auto bytes = read_body(request);
    if (!bytes) {
        LOG_DEBUG("Request", "%s %s: %s", method_token.c_str(), ctx.path_.c_str(),
                  bytes.get_error().describe().c_str());
        return core::result<RequestContext>(bytes.get_error());
    }

    auto body = parse_body(type, std::move(bytes).value());
    if (!body) {
        LOG_DEBUG("Request", "%s %s: %s", method_token.c_str(), ctx.path_.c_str(),
                  body.get_error().describe().c_str());
        return core::result<RequestContext>(body.get_error());
    }
    ctx.body_ = std::move(body).value();

    return core::ok(std::move(ctx));
}

std::optional<std::string> RequestContext::get_param(const std::string& name) const {
    return lookup(params_, name);
}

std::optional<std::string> RequestContext::get_query(const std::string& name) const {
    return lookup(queries_, name);
}

std::optional<std::string> RequestContext::get_header(const std::string& name) const {
    return find_header(headers_, name);
}

std::optional<std::string> RequestContext::get_cookie(const std::string& name) const {
    return lookup(cookies_, name);
}

core::result<std::string> RequestContext::text() const {
    const TextBody* body = std::get_if<TextBody>(&body_);
    if (!body) {
        return core::err<std::string>(core::error_code::wrong_body_type, "Wrong body type");
    }
    return body->text;
}

core::result<RequestContext::StringMap> RequestContext::form_data() const {
    const FormBody* body = std::get_if<FormBody>(&body_);
    if (!body) {
        return core::err<StringMap>(core::error_code::wrong_body_type, "Wrong body type");
    }
    return parse_pairs(body->raw);
}

void RequestContext::set_param(const std::string& name, const std::string& value) {
    params_.insert_or_assign(name, value);
}

void RequestContext::set_query(const std::string& name, const std::string& value) {
    queries_.insert_or_assign(name, value);
}

void RequestContext::set_header(const std::string& name, const std::string& value) {
    headers_.insert_or_assign(name, value);
}

void RequestContext::set_cookie(const std::string& name, const std::string& value) {
    cookies_.insert_or_assign(name, value);
}

void RequestContext::set_path(const std::string& path) {
    path_ = path;
    origin_url_ = path;
}

void RequestContext::set_json(JsonValue value) {
    body_ = std::move(value);
}

void RequestContext::set_text(const std::string& text) {
    body_ = TextBody{text};
}

void RequestContext::set_form(const std::string& key, const std::string& value) {
    FormBody* form = std::get_if<FormBody>(&body_);
    if (!form) {
        body_ = FormBody{};
        form = std::get_if<FormBody>(&body_);
    }
    if (!form->raw.empty()) {
        form->raw += '&';
    }
    form->raw += key;
    form->raw += '=';
    form->raw += value;
}

} // namespace http
} // namespace ripcord

#pragma once

#include "http_method.h"
#include "json_value.h"
#include "transport.h"
#include "core/result.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace ripcord {
namespace http {

/**
 * Hard cap on accumulated request body bytes.
 */
inline constexpr size_t kMaxBodySize = 262144;

/**
 * Content-type classification of a request body.
 */
enum class BodyType : uint8_t {
    JSON,
    TEXT,
    FORM
};

struct TextBody {
    std::string text;
};

/**
 * Raw "key=value&key=value" string; split on access by form_data().
 */
struct FormBody {
    std::string raw;
};

/**
 * Parsed body. The alternative index is the classification, so the two can
 * never disagree.
 */
using BodyContent = std::variant<JsonValue, TextBody, FormBody>;

/**
 * Read-only snapshot of one inbound request.
 *
 * Built once per request by from_transport(). Handlers and middlewares
 * receive it by const reference; the set_* mutators exist for test fixtures
 * and for middlewares that forward a modified copy downstream.
 *
 * Header names are stored exactly as received. get_header() tries the exact
 * name first and falls back to a case-insensitive match. Query strings and
 * form bodies are split but never percent-decoded.
 */
class RequestContext {
public:
    using StringMap = std::unordered_map<std::string, std::string>;

    /**
     * Empty GET / request with a text body and ip "unknown".
     */
    RequestContext();

    /**
     * Build a context from transport primitives.
     *
     * Reads the whole body (up to kMaxBodySize) and parses it according to
     * the content-type classification.
     *
     * Errors:
     *   not_found       method outside GET/PUT/POST/DELETE/PATCH
     *   body_too_large  body exceeded kMaxBodySize
     *   invalid_utf8    body bytes are not UTF-8
     *   invalid_json    JSON-classified body failed to parse
     *   io_error        the body stream failed
     */
    static core::result<RequestContext> from_transport(TransportRequest& request);

    // ========================================================================
    // Accessors
    // ========================================================================

    std::optional<std::string> get_param(const std::string& name) const;
    std::optional<std::string> get_query(const std::string& name) const;
    std::optional<std::string> get_header(const std::string& name) const;
    std::optional<std::string> get_cookie(const std::string& name) const;

    bool is(BodyType type) const noexcept { return body_type() == type; }
    BodyType body_type() const noexcept { return static_cast<BodyType>(body_.index()); }

    /**
     * Deserialize a JSON body into T through from_json(const JsonValue&, T&).
     *
     * Fails with wrong_body_type unless the body is JSON, and with
     * deserialize_failed if the document does not fit T.
     */
    template<typename T>
    core::result<T> json() const {
        const JsonValue* value = std::get_if<JsonValue>(&body_);
        if (!value) {
            return core::err<T>(core::error_code::wrong_body_type, "Wrong body type");
        }
        T out{};
        auto converted = from_json(*value, out);
        if (!converted) {
            return core::err<T>(core::error_code::deserialize_failed,
                                "Failed to deserialize JSON: " + converted.get_error().describe());
        }
        return core::ok(std::move(out));
    }

    core::result<std::string> text() const;

    /**
     * Split a form body on '&' then on the first '='. Pairs without '='
     * are dropped.
     */
    core::result<StringMap> form_data() const;

    HttpMethod method() const noexcept { return method_; }
    const char* method_name() const noexcept { return to_string(method_); }
    const std::string& path() const noexcept { return path_; }

    /**
     * Path plus "?query" when a query string was present.
     */
    const std::string& origin_url() const noexcept { return origin_url_; }

    /**
     * First X-Forwarded-For entry, else the peer address, else "unknown".
     */
    const std::string& ip() const noexcept { return ip_; }

    const StringMap& params() const noexcept { return params_; }
    const StringMap& queries() const noexcept { return queries_; }
    const StringMap& headers() const noexcept { return headers_; }
    const StringMap& cookies() const noexcept { return cookies_; }
    const BodyContent& body() const noexcept { return body_; }

    // ========================================================================
    // Fixture mutators
    // ========================================================================

    void set_param(const std::string& name, const std::string& value);
    void set_query(const std::string& name, const std::string& value);
    void set_header(const std::string& name, const std::string& value);
    void set_cookie(const std::string& name, const std::string& value);
    void set_method(HttpMethod method) noexcept { method_ = method; }

    /**
     * Replace the path; origin_url becomes the bare path.
     */
    void set_path(const std::string& path);
    void set_ip(const std::string& ip) { ip_ = ip; }

    /**
     * Replace the body with a JSON document.
     */
    void set_json(JsonValue value);

    template<typename T>
    void set_json(const T& value) {
        set_json(to_json(value));
    }

    void set_text(const std::string& text);

    /**
     * Append key=value to the form body, switching the body to a form first
     * if it was something else.
     */
    void set_form(const std::string& key, const std::string& value);

private:
    HttpMethod method_{HttpMethod::GET};
    std::string path_;
    std::string origin_url_;
    std::string ip_;
    StringMap params_;
    StringMap queries_;
    StringMap headers_;
    StringMap cookies_;
    BodyContent body_;
};

/**
 * Split "a=1&b=2" into a map. Pairs without '=' are dropped; a repeated key
 * keeps its last value. No percent-decoding.
 */
RequestContext::StringMap parse_pairs(std::string_view raw);

/**
 * Classify a content-type value: application/json, then
 * application/x-www-form-urlencoded, else text. Case-sensitive substring
 * match; a missing header is text.
 */
BodyType classify_content_type(const std::optional<std::string>& content_type) noexcept;

} // namespace http
} // namespace ripcord

#include "http_method.h"

namespace ripcord {
namespace http {

const char* to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::POST:   return "POST";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PATCH:  return "PATCH";
    }
    return "UNKNOWN";
}

std::optional<HttpMethod> parse_method(std::string_view token) noexcept {
    if (token == "GET")    return HttpMethod::GET;
    if (token == "PUT")    return HttpMethod::PUT;
    if (token == "POST")   return HttpMethod::POST;
    if (token == "DELETE") return HttpMethod::DELETE;
    if (token == "PATCH")  return HttpMethod::PATCH;
    return std::nullopt;
}

} // namespace http
} // namespace ripcord

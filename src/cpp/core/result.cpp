#include "result.h"

namespace ripcord {
namespace core {

const char* to_string(error_code code) noexcept {
    switch (code) {
        case error_code::success:            return "success";
        case error_code::body_too_large:     return "Body too large";
        case error_code::invalid_utf8:       return "Invalid UTF-8 sequence";
        case error_code::invalid_json:       return "Invalid JSON";
        case error_code::wrong_body_type:    return "Wrong body type";
        case error_code::deserialize_failed: return "Failed to deserialize JSON";
        case error_code::missing_header:     return "Missing header";
        case error_code::not_found:          return "Not Found";
        case error_code::invalid_address:    return "Invalid listen address";
        case error_code::bind_failed:        return "Failed to bind";
        case error_code::io_error:           return "I/O error";
        case error_code::bad_request:        return "Bad Request";
    }
    return "unknown";
}

} // namespace core
} // namespace ripcord

#include "json_value.h"

#include <simdjson.h>

#include <charconv>
#include <cmath>
#include <cstdio>

namespace ripcord {
namespace http {

namespace {

/**
 * Copy a simdjson DOM element into an owned JsonValue.
 */
core::result<JsonValue> convert(simdjson::dom::element element) {
    switch (element.type()) {
        case simdjson::dom::element_type::NULL_VALUE:
            return JsonValue(nullptr);

        case simdjson::dom::element_type::BOOL: {
            bool b = false;
            if (element.get_bool().get(b)) break;
            return JsonValue(b);
        }

        case simdjson::dom::element_type::INT64: {
            int64_t v = 0;
            if (element.get_int64().get(v)) break;
            return JsonValue(v);
        }

        case simdjson::dom::element_type::UINT64: {
            // Only reached for values above INT64_MAX
            uint64_t v = 0;
            if (element.get_uint64().get(v)) break;
            return JsonValue(static_cast<double>(v));
        }

        case simdjson::dom::element_type::DOUBLE: {
            double v = 0.0;
            if (element.get_double().get(v)) break;
            return JsonValue(v);
        }

        case simdjson::dom::element_type::STRING: {
            std::string_view s;
            if (element.get_string().get(s)) break;
            return JsonValue(std::string(s));
        }

        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array arr;
            if (element.get_array().get(arr)) break;
            JsonValue::Array items;
            items.reserve(arr.size());
            for (simdjson::dom::element child : arr) {
                auto item = convert(child);
                if (!item) return item;
                items.push_back(std::move(item).value());
            }
            return JsonValue(std::move(items));
        }

        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object obj;
            if (element.get_object().get(obj)) break;
            JsonValue::Object members;
            for (simdjson::dom::key_value_pair field : obj) {
                auto member = convert(field.value);
                if (!member) return member;
                // Duplicate keys: last one wins
                members.insert_or_assign(std::string(field.key), std::move(member).value());
            }
            return JsonValue(std::move(members));
        }
    }
    return core::err<JsonValue>(core::error_code::invalid_json, "Invalid JSON: unexpected element");
}

void escape_string(std::string& out, const std::string& s) {
    out += '"';
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
}

void append_double(std::string& out, double v) {
    if (!std::isfinite(v)) {
        out += "null";
        return;
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) {
        out += "null";
        return;
    }
    std::string_view text(buf, static_cast<size_t>(end - buf));
    out += text;
    // Keep a float a float: 2.0 prints as "2" otherwise
    if (text.find_first_of(".eEn") == std::string_view::npos) {
        out += ".0";
    }
}

} // namespace

bool is_valid_utf8(std::string_view bytes) noexcept {
    return simdjson::validate_utf8(bytes.data(), bytes.size());
}

core::result<JsonValue> JsonValue::parse(std::string_view text) {
    if (!is_valid_utf8(text)) {
        return core::err<JsonValue>(core::error_code::invalid_utf8, "Invalid UTF-8 sequence");
    }

    thread_local simdjson::dom::parser parser;
    simdjson::padded_string padded(text.data(), text.size());

    simdjson::dom::element root;
    auto error = parser.parse(padded).get(root);
    if (error) {
        return core::err<JsonValue>(core::error_code::invalid_json,
                                    std::string("Invalid JSON: ") + simdjson::error_message(error));
    }
    return convert(root);
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto& members = std::get<Object>(data_);
    auto it = members.find(key);
    return it == members.end() ? nullptr : &it->second;
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (is_null()) {
        data_ = Object{};
    }
    return std::get<Object>(data_)[key];
}

void JsonValue::push_back(JsonValue value) {
    if (is_null()) {
        data_ = Array{};
    }
    std::get<Array>(data_).push_back(std::move(value));
}

size_t JsonValue::size() const noexcept {
    if (is_array()) return std::get<Array>(data_).size();
    if (is_object()) return std::get<Object>(data_).size();
    return 0;
}

std::string JsonValue::dump() const {
    std::string out;
    dump_to(out);
    return out;
}

void JsonValue::dump_to(std::string& out) const {
    switch (type()) {
        case Type::NULL_VALUE:
            out += "null";
            break;
        case Type::BOOL:
            out += std::get<bool>(data_) ? "true" : "false";
            break;
        case Type::INTEGER:
            out += std::to_string(std::get<int64_t>(data_));
            break;
        case Type::NUMBER:
            append_double(out, std::get<double>(data_));
            break;
        case Type::STRING:
            escape_string(out, std::get<std::string>(data_));
            break;
        case Type::ARRAY: {
            out += '[';
            bool first = true;
            for (const auto& item : std::get<Array>(data_)) {
                if (!first) out += ',';
                first = false;
                item.dump_to(out);
            }
            out += ']';
            break;
        }
        case Type::OBJECT: {
            out += '{';
            bool first = true;
            for (const auto& [key, member] : std::get<Object>(data_)) {
                if (!first) out += ',';
                first = false;
                escape_string(out, key);
                out += ':';
                member.dump_to(out);
            }
            out += '}';
            break;
        }
    }
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (is_number() && other.is_number()) {
        if (is_integer() && other.is_integer()) {
            return as_integer() == other.as_integer();
        }
        return as_number() == other.as_number();
    }
    return data_ == other.data_;
}

const char* type_name(JsonValue::Type type) noexcept {
    switch (type) {
        case JsonValue::Type::NULL_VALUE: return "null";
        case JsonValue::Type::BOOL:       return "boolean";
        case JsonValue::Type::INTEGER:    return "integer";
        case JsonValue::Type::NUMBER:     return "float";
        case JsonValue::Type::STRING:     return "string";
        case JsonValue::Type::ARRAY:      return "array";
        case JsonValue::Type::OBJECT:     return "object";
    }
    return "unknown";
}

core::result<void> from_json(const JsonValue& in, JsonValue& out) {
    out = in;
    return core::ok();
}

core::result<void> from_json(const JsonValue& in, std::string& out) {
    if (!in.is_string()) {
        return detail::type_mismatch(in, "string");
    }
    out = in.as_string();
    return core::ok();
}

core::result<void> from_json(const JsonValue& in, bool& out) {
    if (!in.is_bool()) {
        return detail::type_mismatch(in, "boolean");
    }
    out = in.as_bool();
    return core::ok();
}

} // namespace http
} // namespace ripcord

#pragma once

#include "core/result.h"

#include <cstdint>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace ripcord {
namespace http {

/**
 * Owned JSON document value.
 *
 * Request bodies are parsed with simdjson and copied into a JsonValue so the
 * tree outlives the (thread-local) parser. Objects keep their members sorted
 * by key, which makes dump() canonical: equal values always serialize to the
 * same text.
 *
 * Example:
 * @code
 * JsonValue user = JsonValue::object();
 * user["name"] = "ada";
 * user["age"] = 36;
 * user.dump();  // {"age":36,"name":"ada"}
 * @endcode
 */
class JsonValue {
public:
    enum class Type {
        NULL_VALUE,
        BOOL,
        INTEGER,
        NUMBER,
        STRING,
        ARRAY,
        OBJECT
    };

    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue() noexcept : data_(nullptr) {}
    JsonValue(std::nullptr_t) noexcept : data_(nullptr) {}
    JsonValue(bool b) noexcept : data_(b) {}

    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    JsonValue(T v) noexcept {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (v > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                data_ = static_cast<double>(v);
                return;
            }
        }
        data_ = static_cast<int64_t>(v);
    }

    template<typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    JsonValue(T v) noexcept : data_(static_cast<double>(v)) {}

    JsonValue(const char* s) : data_(std::string(s)) {}
    JsonValue(std::string_view s) : data_(std::string(s)) {}
    JsonValue(std::string s) : data_(std::move(s)) {}
    JsonValue(Array a) : data_(std::move(a)) {}
    JsonValue(Object o) : data_(std::move(o)) {}

    static JsonValue array() { return JsonValue(Array{}); }
    static JsonValue object() { return JsonValue(Object{}); }

    /**
     * Parse JSON text.
     *
     * Fails with invalid_utf8 if the bytes are not UTF-8 and with
     * invalid_json (carrying the parser's message) otherwise.
     */
    static core::result<JsonValue> parse(std::string_view text);

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept { return type() == Type::NULL_VALUE; }
    bool is_bool() const noexcept { return type() == Type::BOOL; }
    bool is_integer() const noexcept { return type() == Type::INTEGER; }
    bool is_number() const noexcept {
        return type() == Type::INTEGER || type() == Type::NUMBER;
    }
    bool is_string() const noexcept { return type() == Type::STRING; }
    bool is_array() const noexcept { return type() == Type::ARRAY; }
    bool is_object() const noexcept { return type() == Type::OBJECT; }

    // Unchecked accessors: callers test the type first.
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    double as_number() const {
        return is_integer() ? static_cast<double>(std::get<int64_t>(data_))
                            : std::get<double>(data_);
    }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }

    /**
     * Object member lookup; nullptr if not an object or key absent.
     */
    const JsonValue* find(const std::string& key) const;

    /**
     * Object member access for building values. A null value becomes an
     * empty object first.
     */
    JsonValue& operator[](const std::string& key);

    /**
     * Append to an array. A null value becomes an empty array first.
     */
    void push_back(JsonValue value);

    /**
     * Number of array elements or object members (0 for scalars).
     */
    size_t size() const noexcept;

    /**
     * Canonical compact encoding.
     */
    std::string dump() const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object> data_;

    void dump_to(std::string& out) const;
};

/**
 * Name of a JSON type, for error messages ("string", "object", ...).
 */
const char* type_name(JsonValue::Type type) noexcept;

/**
 * SIMD UTF-8 validation (simdjson), shared by every body classification.
 */
bool is_valid_utf8(std::string_view bytes) noexcept;

// ============================================================================
// Conversions
//
// json<T>() on a request and json(value) on a response go through two
// customization points found by argument-dependent lookup:
//
//   core::result<void> from_json(const JsonValue& in, T& out);
//   JsonValue to_json(const T& value);
//
// Overloads for strings, booleans, arithmetic types, JsonValue, std::vector,
// std::map<std::string, T> and std::optional are provided here. User types
// declare their own pair next to the type.
// ============================================================================

core::result<void> from_json(const JsonValue& in, JsonValue& out);
core::result<void> from_json(const JsonValue& in, std::string& out);
core::result<void> from_json(const JsonValue& in, bool& out);

template<typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
core::result<void> from_json(const JsonValue& in, T& out);

template<typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
core::result<void> from_json(const JsonValue& in, T& out);

template<typename T>
core::result<void> from_json(const JsonValue& in, std::vector<T>& out);

template<typename T>
core::result<void> from_json(const JsonValue& in, std::map<std::string, T>& out);

template<typename T>
core::result<void> from_json(const JsonValue& in, std::optional<T>& out);

inline JsonValue to_json(const JsonValue& value) { return value; }
inline JsonValue to_json(const std::string& value) { return JsonValue(value); }
inline JsonValue to_json(const char* value) { return JsonValue(value); }
inline JsonValue to_json(bool value) { return JsonValue(value); }

template<typename T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
JsonValue to_json(T value) { return JsonValue(value); }

template<typename T>
JsonValue to_json(const std::vector<T>& values);

template<typename T>
JsonValue to_json(const std::map<std::string, T>& values);

template<typename T>
JsonValue to_json(const std::optional<T>& value);

/**
 * Read a required object member into out.
 *
 * Errors name the field: "missing field `age`" or
 * "field `age`: invalid type: string, expected integer".
 */
template<typename T>
core::result<void> read_field(const JsonValue& object, const std::string& key, T& out);

/**
 * Read an optional object member; absent or null leaves out untouched.
 */
template<typename T>
core::result<void> read_optional_field(const JsonValue& object, const std::string& key, T& out);

namespace detail {

inline core::result<void> type_mismatch(const JsonValue& in, const char* expected) {
    return core::err(core::error_code::deserialize_failed,
                     std::string("invalid type: ") + type_name(in.type()) +
                     ", expected " + expected);
}

} // namespace detail

template<typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int>>
core::result<void> from_json(const JsonValue& in, T& out) {
    if (!in.is_integer()) {
        return detail::type_mismatch(in, "integer");
    }
    int64_t v = in.as_integer();
    bool fits;
    if constexpr (std::is_unsigned_v<T>) {
        fits = v >= 0 && static_cast<uint64_t>(v) <= std::numeric_limits<T>::max();
    } else {
        fits = v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
               v <= static_cast<int64_t>(std::numeric_limits<T>::max());
    }
    if (!fits) {
        return core::err(core::error_code::deserialize_failed,
                         "invalid value: integer " + std::to_string(v) + " out of range");
    }
    out = static_cast<T>(v);
    return core::ok();
}

template<typename T, std::enable_if_t<std::is_floating_point_v<T>, int>>
core::result<void> from_json(const JsonValue& in, T& out) {
    if (!in.is_number()) {
        return detail::type_mismatch(in, "number");
    }
    out = static_cast<T>(in.as_number());
    return core::ok();
}

template<typename T>
core::result<void> from_json(const JsonValue& in, std::vector<T>& out) {
    if (!in.is_array()) {
        return detail::type_mismatch(in, "array");
    }
    std::vector<T> values;
    values.reserve(in.as_array().size());
    for (size_t i = 0; i < in.as_array().size(); ++i) {
        T item{};
        auto r = from_json(in.as_array()[i], item);
        if (!r) {
            return core::err(core::error_code::deserialize_failed,
                             "element " + std::to_string(i) + ": " + r.get_error().describe());
        }
        values.push_back(std::move(item));
    }
    out = std::move(values);
    return core::ok();
}

template<typename T>
core::result<void> from_json(const JsonValue& in, std::map<std::string, T>& out) {
    if (!in.is_object()) {
        return detail::type_mismatch(in, "object");
    }
    std::map<std::string, T> values;
    for (const auto& [key, member] : in.as_object()) {
        T item{};
        auto r = from_json(member, item);
        if (!r) {
            return core::err(core::error_code::deserialize_failed,
                             "field `" + key + "`: " + r.get_error().describe());
        }
        values.emplace(key, std::move(item));
    }
    out = std::move(values);
    return core::ok();
}

template<typename T>
core::result<void> from_json(const JsonValue& in, std::optional<T>& out) {
    if (in.is_null()) {
        out.reset();
        return core::ok();
    }
    T item{};
    auto r = from_json(in, item);
    if (!r) {
        return r;
    }
    out = std::move(item);
    return core::ok();
}

template<typename T>
JsonValue to_json(const std::vector<T>& values) {
    JsonValue::Array items;
    items.reserve(values.size());
    for (const auto& v : values) {
        items.push_back(to_json(v));
    }
    return JsonValue(std::move(items));
}

template<typename T>
JsonValue to_json(const std::map<std::string, T>& values) {
    JsonValue::Object members;
    for (const auto& [key, v] : values) {
        members.emplace(key, to_json(v));
    }
    return JsonValue(std::move(members));
}

template<typename T>
JsonValue to_json(const std::optional<T>& value) {
    return value ? to_json(*value) : JsonValue(nullptr);
}

template<typename T>
core::result<void> read_field(const JsonValue& object, const std::string& key, T& out) {
    if (!object.is_object()) {
        return detail::type_mismatch(object, "object");
    }
    const JsonValue* member = object.find(key);
    if (!member) {
        return core::err(core::error_code::deserialize_failed, "missing field `" + key + "`");
    }
    auto r = from_json(*member, out);
    if (!r) {
        return core::err(core::error_code::deserialize_failed,
                         "field `" + key + "`: " + r.get_error().describe());
    }
    return core::ok();
}

template<typename T>
core::result<void> read_optional_field(const JsonValue& object, const std::string& key, T& out) {
    if (!object.is_object()) {
        return detail::type_mismatch(object, "object");
    }
    const JsonValue* member = object.find(key);
    if (!member || member->is_null()) {
        return core::ok();
    }
    auto r = from_json(*member, out);
    if (!r) {
        return core::err(core::error_code::deserialize_failed,
                         "field `" + key + "`: " + r.get_error().describe());
    }
    return core::ok();
}

} // namespace http
} // namespace ripcord

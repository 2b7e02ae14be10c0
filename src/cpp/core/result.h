#pragma once

#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace ripcord {
namespace core {

/**
 * Error codes for result<T>.
 */
enum class error_code : int {
    success = 0,
    body_too_large = 1,
    invalid_utf8 = 2,
    invalid_json = 3,
    wrong_body_type = 4,
    deserialize_failed = 5,
    missing_header = 6,
    not_found = 7,
    invalid_address = 8,
    bind_failed = 9,
    io_error = 10,
    bad_request = 11
};

/**
 * Stable name of an error code (used in logs and error bodies).
 */
const char* to_string(error_code code) noexcept;

/**
 * Error payload: a code plus an optional human-readable message.
 */
struct error {
    error_code code{error_code::success};
    std::string message;

    error() = default;
    error(error_code c) : code(c) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    /**
     * Message if one was attached, otherwise the code's name.
     */
    std::string describe() const {
        return message.empty() ? std::string(to_string(code)) : message;
    }
};

/**
 * Exception-free result type.
 *
 * Either contains a value T or an error. No exceptions on the error path.
 *
 * Usage:
 *   result<int> get_value() {
 *       if (failed) return error_code::io_error;
 *       return 42;
 *   }
 *
 *   auto r = get_value();
 *   if (r.is_ok()) {
 *       int value = r.value();
 *   } else {
 *       error_code err = r.error();
 *   }
 */
template<typename T>
class result {
public:
    /**
     * Default constructor creates an error result.
     */
    result() noexcept
        : has_value_(false), error_(error_code::bad_request) {}

    /**
     * Construct from value (success case).
     */
    result(const T& val) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(val);
    }

    result(T&& val) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(std::move(val));
    }

    /**
     * Construct from error (error case).
     */
    result(error_code err)
        : has_value_(false), error_(err) {}

    result(struct error err)
        : has_value_(false), error_(std::move(err)) {}

    result(const result& other)
        : has_value_(other.has_value_), error_(other.error_) {
        if (has_value_) {
            new (value_storage_) T(other.value());
        }
    }

    result(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(other.has_value_), error_(std::move(other.error_)) {
        if (has_value_) {
            new (value_storage_) T(std::move(other.value()));
        }
    }

    result& operator=(const result& other) {
        if (this != &other) {
            result copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    result& operator=(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            reset();
            has_value_ = other.has_value_;
            error_ = std::move(other.error_);
            if (has_value_) {
                new (value_storage_) T(std::move(other.value()));
            }
        }
        return *this;
    }

    ~result() {
        reset();
    }

    bool is_ok() const noexcept { return has_value_; }
    bool is_err() const noexcept { return !has_value_; }

    /**
     * Get the value (undefined behavior if is_err()).
     */
    T& value() & noexcept {
        return *std::launder(reinterpret_cast<T*>(value_storage_));
    }

    const T& value() const& noexcept {
        return *std::launder(reinterpret_cast<const T*>(value_storage_));
    }

    T&& value() && noexcept {
        return std::move(*std::launder(reinterpret_cast<T*>(value_storage_)));
    }

    /**
     * Get the error code (success if is_ok()).
     */
    error_code error() const noexcept {
        return has_value_ ? error_code::success : error_.code;
    }

    /**
     * Full error payload (code + message).
     */
    const struct error& get_error() const noexcept { return error_; }

    T value_or(T default_value) const& {
        return has_value_ ? value() : std::move(default_value);
    }

    explicit operator bool() const noexcept { return has_value_; }

private:
    void reset() noexcept {
        if (has_value_) {
            value().~T();
            has_value_ = false;
        }
    }

    alignas(T) unsigned char value_storage_[sizeof(T)];
    bool has_value_;
    struct error error_;
};

/**
 * Specialization for void (only indicates success/error).
 */
template<>
class result<void> {
public:
    result() noexcept = default;
    result(error_code err) : error_(err) {}
    result(struct error err) : error_(std::move(err)) {}

    bool is_ok() const noexcept { return error_.code == error_code::success; }
    bool is_err() const noexcept { return error_.code != error_code::success; }
    error_code error() const noexcept { return error_.code; }
    const struct error& get_error() const noexcept { return error_; }

    explicit operator bool() const noexcept { return is_ok(); }

private:
    struct error error_;
};

template<typename T>
result<T> ok(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
    return result<T>(std::move(value));
}

inline result<void> ok() noexcept {
    return result<void>();
}

template<typename T>
result<T> err(error_code code, std::string message = {}) {
    return result<T>(error(code, std::move(message)));
}

inline result<void> err(error_code code, std::string message = {}) {
    return result<void>(error(code, std::move(message)));
}

} // namespace core
} // namespace ripcord

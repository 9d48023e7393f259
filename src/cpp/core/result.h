#pragma once

#include <type_traits>
#include <utility>
#include <new>

namespace quicwire {
namespace core {

/**
 * Error codes for result<T>.
 *
 * Every failure the wire codec can report. None of them is fatal: the
 * datagram-receive layer decides whether to drop, close or log.
 */
enum class error_code : int {
    success = 0,
    truncated_input = 1,             // Field runs past the end of the buffer
    invalid_field_length = 2,        // Value type given a length outside its domain
    value_too_large = 3,             // VarInt above 2^62 - 1
    invalid_packet_number_width = 4, // Short header selector maps to no width
    unsupported_header_shape = 5,    // Header variant we do not know
    protocol_violation = 6,          // Strict short-header bit check failed
    internal_error = 7               // Local failure (e.g. RNG), never peer input
};

/**
 * Human-readable name of an error code (for logs and test output).
 */
inline const char* error_code_to_string(error_code code) noexcept {
    switch (code) {
        case error_code::success: return "success";
        case error_code::truncated_input: return "truncated_input";
        case error_code::invalid_field_length: return "invalid_field_length";
        case error_code::value_too_large: return "value_too_large";
        case error_code::invalid_packet_number_width: return "invalid_packet_number_width";
        case error_code::unsupported_header_shape: return "unsupported_header_shape";
        case error_code::protocol_violation: return "protocol_violation";
        case error_code::internal_error: return "internal_error";
    }
    return "unknown";
}

/**
 * Exception-free result type.
 *
 * Either contains a value T or an error code.
 *
 * Usage:
 *   result<uint64_t> read_length() {
 *       if (short_buffer) return error_code::truncated_input;
 *       return 42;
 *   }
 *
 *   auto r = read_length();
 *   if (r.is_ok()) {
 *       uint64_t value = r.value();
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
        : has_value_(false), error_(error_code::internal_error) {}

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
     * Construct from error code (error case).
     */
    result(error_code err) noexcept
        : has_value_(false), error_(err) {}

    result(const result& other) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : has_value_(other.has_value_), error_(other.error_) {
        if (has_value_) {
            new (value_storage_) T(other.value());
        }
    }

    result(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(other.has_value_), error_(other.error_) {
        if (has_value_) {
            new (value_storage_) T(std::move(other.value()));
        }
    }

    result& operator=(const result& other) {
        if (this != &other) {
            reset();
            has_value_ = other.has_value_;
            error_ = other.error_;
            if (has_value_) {
                new (value_storage_) T(other.value());
            }
        }
        return *this;
    }

    result& operator=(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            reset();
            has_value_ = other.has_value_;
            error_ = other.error_;
            if (has_value_) {
                new (value_storage_) T(std::move(other.value()));
            }
        }
        return *this;
    }

    ~result() {
        reset();
    }

    /**
     * Check if result contains a value.
     */
    bool is_ok() const noexcept { return has_value_; }

    /**
     * Check if result contains an error.
     */
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
        return has_value_ ? error_code::success : error_;
    }

    /**
     * Get value or default.
     */
    T value_or(T&& default_value) && noexcept(std::is_nothrow_move_constructible_v<T>) {
        return has_value_ ? std::move(value()) : std::move(default_value);
    }

    /**
     * Explicit conversion to bool (true if ok).
     */
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
    error_code error_{error_code::success};
};

/**
 * Specialization for void (only indicates success/error).
 */
template<>
class result<void> {
public:
    result() noexcept : error_(error_code::success) {}
    result(error_code err) noexcept : error_(err) {}

    bool is_ok() const noexcept { return error_ == error_code::success; }
    bool is_err() const noexcept { return error_ != error_code::success; }
    error_code error() const noexcept { return error_; }

    explicit operator bool() const noexcept { return is_ok(); }

private:
    error_code error_;
};

/**
 * Helper to create ok result.
 */
template<typename T>
result<T> ok(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
    return result<T>(std::move(value));
}

inline result<void> ok() noexcept {
    return result<void>();
}

/**
 * Helper to create error result.
 */
template<typename T>
result<T> err(error_code code) noexcept {
    return result<T>(code);
}

inline result<void> err(error_code code) noexcept {
    return result<void>(code);
}

} // namespace core
} // namespace quicwire

/**
 * @file types.h
 * @brief Core type definitions for aws_signer_system
 */

#ifndef KCENON_AWS_SIGNER_CORE_TYPES_H
#define KCENON_AWS_SIGNER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::aws_signer {

/**
 * @brief Error codes for signing and delivery operations (-300 to -399)
 *
 * Error code ranges:
 * - -300 to -319: Request/signing precondition errors
 * - -320 to -339: Payload stream errors
 * - -340 to -359: Transport errors
 * - -360 to -379: Service-reported errors
 * - -380 to -389: Configuration errors
 * - -390 to -399: Internal errors
 */
enum class error_code : int32_t {
    success = 0,

    // Request/signing precondition errors (-300 to -319)
    invalid_resource_path = -300,
    invalid_block_size = -301,
    missing_credentials = -302,
    invalid_timestamp = -303,
    invalid_header = -304,
    invalid_payload_hash = -305,
    chain_finished = -306,

    // Payload stream errors (-320 to -339)
    payload_read_error = -320,
    payload_size_mismatch = -321,
    payload_not_rewindable = -322,

    // Transport errors (-340 to -359)
    transport_failure = -340,
    transport_cancelled = -341,
    transport_unavailable = -342,

    // Service-reported errors (-360 to -379)
    service_error = -360,
    authorization_failed = -361,

    // Configuration errors (-380 to -389)
    invalid_configuration = -380,

    // Internal errors (-390 to -399)
    internal_error = -390,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_resource_path:
            return "resource path must start with '/'";
        case error_code::invalid_block_size:
            return "block size too small";
        case error_code::missing_credentials:
            return "credentials not available";
        case error_code::invalid_timestamp:
            return "invalid ISO 8601 timestamp";
        case error_code::invalid_header:
            return "invalid header";
        case error_code::invalid_payload_hash:
            return "invalid payload hash";
        case error_code::chain_finished:
            return "chunk signature chain already finished";
        case error_code::payload_read_error:
            return "payload read error";
        case error_code::payload_size_mismatch:
            return "payload shorter than declared size";
        case error_code::payload_not_rewindable:
            return "payload stream cannot be rewound";
        case error_code::transport_failure:
            return "transport failure";
        case error_code::transport_cancelled:
            return "transport cancelled";
        case error_code::transport_unavailable:
            return "transport not available";
        case error_code::service_error:
            return "service error";
        case error_code::authorization_failed:
            return "authorization failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is a precondition violation (-300 to -319)
 */
[[nodiscard]] constexpr auto is_precondition_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -300 && value >= -319;
}

/**
 * @brief Check if error code is a payload stream error (-320 to -339)
 */
[[nodiscard]] constexpr auto is_payload_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -320 && value >= -339;
}

/**
 * @brief Check if error code is a transport error (-340 to -359)
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -340 && value >= -359;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T, E>)
 */
template <typename E = error>
struct unexpected {
    E err;

    explicit unexpected(E e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error of type E.
 */
template <typename T, typename E = error>
class result {
public:
    using value_type = T;
    using error_type = E;

    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected<E> u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const E& { return error_; }

private:
    std::optional<T> value_;
    E error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <typename E>
class result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    result() : has_value_(true) {}

    result(unexpected<E> u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const E& { return error_; }

private:
    bool has_value_;
    E error_;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_CORE_TYPES_H

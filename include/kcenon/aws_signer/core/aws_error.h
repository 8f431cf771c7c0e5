/**
 * @file aws_error.h
 * @brief Failure taxonomy of a signed call
 * @version 0.1.0
 *
 * Every failed attempt is classified exactly once, where the response (or
 * the transport error) is received, into one of four kinds. The retry driver
 * looks only at the kind and the retriable flag.
 */

#ifndef KCENON_AWS_SIGNER_CORE_AWS_ERROR_H
#define KCENON_AWS_SIGNER_CORE_AWS_ERROR_H

#include "kcenon/aws_signer/auth/credentials.h"
#include "kcenon/aws_signer/core/types.h"

#include <string>
#include <string_view>
#include <variant>

namespace kcenon::aws_signer {

/**
 * @brief Namespace prefix of JSON-protocol error types
 */
inline constexpr std::string_view service_exception_prefix = "com.amazon.coral.service#";

/**
 * @brief Error type name after the last '#'
 *
 * "com.amazon.coral.service#UnrecognizedClientException" ->
 * "UnrecognizedClientException"; names without '#' are returned unchanged.
 */
[[nodiscard]] inline auto simple_type(std::string_view type) -> std::string_view {
    auto pos = type.rfind('#');
    return pos == std::string_view::npos ? type : type.substr(pos + 1);
}

/**
 * @brief Kind of failure
 */
enum class failure_kind {
    authorization,  ///< Credentials rejected by the service
    service,        ///< Any other service-reported error
    transport,      ///< Connection, TLS, timeout or cancellation
    precondition    ///< Invalid input, detected before any network call
};

/**
 * @brief Convert failure_kind to string
 */
[[nodiscard]] constexpr auto to_string(failure_kind kind) -> const char* {
    switch (kind) {
        case failure_kind::authorization: return "authorization";
        case failure_kind::service: return "service";
        case failure_kind::transport: return "transport";
        case failure_kind::precondition: return "precondition";
        default: return "unknown";
    }
}

/**
 * @brief The service rejected the credentials used by the attempt
 */
struct authorization_failure {
    std::string type;
    std::string message;
    std::string credential_scope;
    credentials_ptr credentials;
    int http_status = 0;
};

/**
 * @brief Service-reported error other than an authorization failure
 */
struct service_failure {
    std::string type;
    int http_status = 0;
    bool retriable = false;
    std::string message;
};

/**
 * @brief The request never produced a response
 */
struct transport_failure {
    error_code code = error_code::transport_failure;
    std::string message;
};

/**
 * @brief Input rejected before any network call
 */
struct precondition_violation {
    error_code code = error_code::internal_error;
    std::string message;
};

/**
 * @brief Tagged union of the four failure kinds
 */
class aws_error {
public:
    using variant_type = std::variant<precondition_violation,
                                      authorization_failure,
                                      service_failure,
                                      transport_failure>;

    aws_error() = default;
    aws_error(authorization_failure failure) : failure_(std::move(failure)) {}
    aws_error(service_failure failure) : failure_(std::move(failure)) {}
    aws_error(transport_failure failure) : failure_(std::move(failure)) {}
    aws_error(precondition_violation failure) : failure_(std::move(failure)) {}

    /**
     * @brief Wrap a library error as a precondition or transport failure
     *
     * Payload and precondition codes become precondition violations,
     * transport codes become transport failures.
     */
    [[nodiscard]] static auto from_error(const error& err) -> aws_error;

    [[nodiscard]] auto kind() const -> failure_kind;

    /**
     * @brief Retry hint: service flag, true for transport, false otherwise
     */
    [[nodiscard]] auto retriable() const -> bool;

    /**
     * @brief Full type name (service type, or the library code name)
     */
    [[nodiscard]] auto type() const -> std::string;

    [[nodiscard]] auto simple_type() const -> std::string;

    [[nodiscard]] auto message() const -> const std::string&;

    /**
     * @brief "type: message"
     */
    [[nodiscard]] auto what() const -> std::string;

    /**
     * @brief Library error code matching the failure
     */
    [[nodiscard]] auto code() const -> error_code;

    /**
     * @brief HTTP status for service and authorization failures, 0 otherwise
     */
    [[nodiscard]] auto http_status() const -> int;

    [[nodiscard]] auto is_authorization() const -> bool {
        return kind() == failure_kind::authorization;
    }

    [[nodiscard]] auto as_authorization() const -> const authorization_failure* {
        return std::get_if<authorization_failure>(&failure_);
    }

    [[nodiscard]] auto as_service() const -> const service_failure* {
        return std::get_if<service_failure>(&failure_);
    }

    [[nodiscard]] auto as_transport() const -> const transport_failure* {
        return std::get_if<transport_failure>(&failure_);
    }

    [[nodiscard]] auto as_precondition() const -> const precondition_violation* {
        return std::get_if<precondition_violation>(&failure_);
    }

    [[nodiscard]] auto variant() const -> const variant_type& { return failure_; }

private:
    variant_type failure_;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_CORE_AWS_ERROR_H

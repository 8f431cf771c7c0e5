/**
 * @file error_classifier.h
 * @brief Maps HTTP status and service error type to an aws_error
 * @version 0.1.0
 */

#ifndef KCENON_AWS_SIGNER_CORE_ERROR_CLASSIFIER_H
#define KCENON_AWS_SIGNER_CORE_ERROR_CLASSIFIER_H

#include "kcenon/aws_signer/client/http_transport.h"
#include "kcenon/aws_signer/core/aws_error.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::aws_signer {

/**
 * @brief Error types that mean the credentials were rejected
 */
[[nodiscard]] auto default_authorization_error_types() -> const std::vector<std::string>&;

/**
 * @brief Classifies failed responses
 *
 * - simple type in the authorization list -> authorization_failure
 * - anything else -> service_failure, retriable iff 5xx
 */
class error_classifier {
public:
    error_classifier();
    explicit error_classifier(std::vector<std::string> authorization_types);

    /**
     * @brief Classify a failed call
     * @param http_status Response status (>= 400)
     * @param type Full or simple error type
     * @param message Service message
     */
    [[nodiscard]] auto classify(int http_status,
                                std::string_view type,
                                std::string_view message) const -> aws_error;

    /**
     * @brief Classify a response
     *
     * The error type is read from the JSON "__type" field, the XML <Code>
     * element, or the x-amzn-ErrorType header, in that order; the fallback
     * type is "HttpStatus<code>".
     *
     * @return nullopt for status codes below 400
     */
    [[nodiscard]] auto classify_response(const http_response& response) const
        -> std::optional<aws_error>;

    [[nodiscard]] auto is_authorization_type(std::string_view type) const -> bool;

    [[nodiscard]] auto authorization_types() const -> const std::vector<std::string>& {
        return authorization_types_;
    }

private:
    std::vector<std::string> authorization_types_;
};

/**
 * @brief classify() with the default authorization types
 */
[[nodiscard]] auto classify(int http_status,
                            std::string_view type,
                            std::string_view message) -> aws_error;

/**
 * @brief classify_response() with the default authorization types
 */
[[nodiscard]] auto classify_response(const http_response& response)
    -> std::optional<aws_error>;

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_CORE_ERROR_CLASSIFIER_H

/**
 * @file error_classifier.cpp
 * @brief Maps HTTP status and service error type to an aws_error
 * @version 0.1.0
 */

#include "kcenon/aws_signer/core/error_classifier.h"

#include "kcenon/aws_signer/signing/sigv4_utils.h"

#include <algorithm>

namespace kcenon::aws_signer {

auto default_authorization_error_types() -> const std::vector<std::string>& {
    static const std::vector<std::string> types = {
        "UnrecognizedClientException",
        "InvalidSignatureException",
    };
    return types;
}

error_classifier::error_classifier()
    : authorization_types_(default_authorization_error_types()) {}

error_classifier::error_classifier(std::vector<std::string> authorization_types)
    : authorization_types_(std::move(authorization_types)) {}

auto error_classifier::is_authorization_type(std::string_view type) const -> bool {
    auto simple = simple_type(type);
    return std::any_of(authorization_types_.begin(), authorization_types_.end(),
                       [&](const std::string& candidate) {
                           return simple == simple_type(candidate);
                       });
}

auto error_classifier::classify(int http_status,
                                std::string_view type,
                                std::string_view message) const -> aws_error {
    if (is_authorization_type(type)) {
        authorization_failure failure;
        failure.type = std::string(type);
        failure.message = std::string(message);
        failure.http_status = http_status;
        return failure;
    }

    service_failure failure;
    failure.type = std::string(type);
    failure.http_status = http_status;
    failure.retriable = (http_status / 100 == 5);
    failure.message = std::string(message);
    return failure;
}

auto error_classifier::classify_response(const http_response& response) const
    -> std::optional<aws_error> {
    if (response.status_code < 400) {
        return std::nullopt;
    }

    auto body = response.body_string();
    std::optional<std::string> type;
    std::optional<std::string> message;

    if (auto json_type = sigv4_utils::extract_json_value(body, "__type")) {
        type = json_type;
        message = sigv4_utils::extract_json_value(body, "message");
        if (!message) {
            message = sigv4_utils::extract_json_value(body, "Message");
        }
    } else if (auto xml_code = sigv4_utils::extract_xml_element(body, "Code")) {
        type = xml_code;
        message = sigv4_utils::extract_xml_element(body, "Message");
    } else if (auto header = response.get_header("x-amzn-ErrorType")) {
        // "Type:http://internal.amazon.com/..." carries a trailing URL
        auto colon = header->find(':');
        type = colon == std::string::npos ? *header : header->substr(0, colon);
    }

    if (!type || type->empty()) {
        type = "HttpStatus" + std::to_string(response.status_code);
    }
    if (!message) {
        message = body;
    }

    return classify(response.status_code, *type, *message);
}

auto classify(int http_status,
              std::string_view type,
              std::string_view message) -> aws_error {
    static const error_classifier classifier;
    return classifier.classify(http_status, type, message);
}

auto classify_response(const http_response& response) -> std::optional<aws_error> {
    static const error_classifier classifier;
    return classifier.classify_response(response);
}

}  // namespace kcenon::aws_signer

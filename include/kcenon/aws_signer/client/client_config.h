/**
 * @file client_config.h
 * @brief Configuration of the signed AWS client
 * @version 0.1.0
 */

#ifndef KCENON_AWS_SIGNER_CLIENT_CLIENT_CONFIG_H
#define KCENON_AWS_SIGNER_CLIENT_CLIENT_CONFIG_H

#include "kcenon/aws_signer/core/error_classifier.h"
#include "kcenon/aws_signer/core/retry_policy.h"
#include "kcenon/aws_signer/core/types.h"
#include "kcenon/aws_signer/signing/chunk_signature_chain.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::aws_signer {

/**
 * @brief Client configuration
 */
struct client_configuration {
    /// Maximum number of retries (attempts = max_error_retry + 1)
    uint32_t max_error_retry = 3;

    /// Ceiling of the first backoff sleep
    std::chrono::milliseconds initial_backoff = exponential_backoff::default_initial_sleep;

    /// Upper bound of the backoff ceiling
    std::chrono::milliseconds max_backoff = exponential_backoff::default_max_sleep;

    /// Retry authorization failures after invalidating the credentials
    bool retry_authorization_failures = true;

    /// Block size used by do_rest_upload when none is given (512 KiB)
    std::size_t default_block_size = 512 * 1024;

    /// x-amz-storage-class sent when the caller sets none
    std::string default_storage_class = "STANDARD";

    /// Use https:// (http:// otherwise)
    bool use_ssl = true;

    /// Content type of JSON-protocol requests
    std::string json_content_type = "application/x-amz-json-1.1";

    /// Error types treated as credential rejection
    std::vector<std::string> authorization_error_types = default_authorization_error_types();

    /**
     * @brief Check the configuration
     * @return invalid_configuration describing the first problem found
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (initial_backoff.count() < 1) {
            return unexpected{error{error_code::invalid_configuration,
                "initial_backoff must be at least 1 ms"}};
        }
        if (max_backoff < initial_backoff) {
            return unexpected{error{error_code::invalid_configuration,
                "max_backoff must not be less than initial_backoff"}};
        }
        if (default_block_size <= minimum_block_size) {
            return unexpected{error{error_code::invalid_configuration,
                "default_block_size must be greater than 8 KiB"}};
        }
        if (default_storage_class.empty()) {
            return unexpected{error{error_code::invalid_configuration,
                "default_storage_class must not be empty"}};
        }
        if (json_content_type.empty()) {
            return unexpected{error{error_code::invalid_configuration,
                "json_content_type must not be empty"}};
        }
        return {};
    }
};

/**
 * @brief Client configuration builder
 */
class client_config_builder {
public:
    auto with_max_error_retry(uint32_t retries) -> client_config_builder& {
        config_.max_error_retry = retries;
        return *this;
    }

    auto with_initial_backoff(std::chrono::milliseconds backoff) -> client_config_builder& {
        config_.initial_backoff = backoff;
        return *this;
    }

    auto with_max_backoff(std::chrono::milliseconds backoff) -> client_config_builder& {
        config_.max_backoff = backoff;
        return *this;
    }

    auto with_retry_authorization_failures(bool enable) -> client_config_builder& {
        config_.retry_authorization_failures = enable;
        return *this;
    }

    auto with_default_block_size(std::size_t block_size) -> client_config_builder& {
        config_.default_block_size = block_size;
        return *this;
    }

    auto with_default_storage_class(const std::string& storage_class) -> client_config_builder& {
        config_.default_storage_class = storage_class;
        return *this;
    }

    auto with_ssl(bool enable) -> client_config_builder& {
        config_.use_ssl = enable;
        return *this;
    }

    auto with_json_content_type(const std::string& content_type) -> client_config_builder& {
        config_.json_content_type = content_type;
        return *this;
    }

    auto with_authorization_error_types(std::vector<std::string> types) -> client_config_builder& {
        config_.authorization_error_types = std::move(types);
        return *this;
    }

    /**
     * @brief Build the configuration
     * @return Configuration or invalid_configuration
     */
    [[nodiscard]] auto build() const -> result<client_configuration> {
        if (auto valid = config_.validate(); !valid) {
            return unexpected{valid.error()};
        }
        return config_;
    }

private:
    client_configuration config_;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_CLIENT_CLIENT_CONFIG_H

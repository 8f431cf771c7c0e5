/**
 * @file aws_signer.h
 * @brief Main header for aws_signer_system library
 * @version 0.1.0
 *
 * This is the primary include file for the aws_signer_system library.
 * Include this header to access request signing, streaming chunk signing
 * and the retrying AWS client.
 *
 * @code
 * #include <kcenon/aws_signer/aws_signer.h>
 *
 * using namespace kcenon::aws_signer;
 *
 * auto credentials = std::make_shared<credential_cache>(
 *     profile_credential_source::create("default"));
 *
 * auto client = aws_client::create("dynamodb.us-east-1.amazonaws.com",
 *                                  "us-east-1", "dynamodb",
 *                                  credentials, my_transport);
 * @endcode
 */

#ifndef KCENON_AWS_SIGNER_AWS_SIGNER_H
#define KCENON_AWS_SIGNER_AWS_SIGNER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/aws_signer/core/types.h"
#include "kcenon/aws_signer/core/aws_error.h"
#include "kcenon/aws_signer/core/error_classifier.h"
#include "kcenon/aws_signer/core/retry_policy.h"

// Credentials
#include "kcenon/aws_signer/auth/credentials.h"

// Signing
#include "kcenon/aws_signer/signing/canonical_request.h"
#include "kcenon/aws_signer/signing/signing_key.h"
#include "kcenon/aws_signer/signing/request_signer.h"
#include "kcenon/aws_signer/signing/chunk_signature_chain.h"

// Client
#include "kcenon/aws_signer/client/client_config.h"
#include "kcenon/aws_signer/client/http_transport.h"
#include "kcenon/aws_signer/client/aws_client.h"

namespace kcenon::aws_signer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_AWS_SIGNER_H

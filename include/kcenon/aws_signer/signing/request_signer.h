/**
 * @file request_signer.h
 * @brief SigV4 string-to-sign, signature and Authorization header
 * @version 0.1.0
 */

#ifndef KCENON_AWS_SIGNER_SIGNING_REQUEST_SIGNER_H
#define KCENON_AWS_SIGNER_SIGNING_REQUEST_SIGNER_H

#include "kcenon/aws_signer/auth/credentials.h"
#include "kcenon/aws_signer/core/types.h"
#include "kcenon/aws_signer/signing/canonical_request.h"
#include "kcenon/aws_signer/signing/signing_key.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::aws_signer {

/**
 * @brief Algorithm identifier of header-based SigV4
 */
inline constexpr std::string_view signing_algorithm = "AWS4-HMAC-SHA256";

/**
 * @brief A canonical request bound to a moment and a region/service
 */
struct signable_request {
    std::string date_stamp;      ///< YYYYMMDD
    std::string time_stamp_utc;  ///< HHMMSSZ
    std::string region;
    std::string service;
    canonical_request request;

    /**
     * @brief YYYYMMDD'T'HHMMSS'Z'
     */
    [[nodiscard]] auto timestamp() const -> std::string {
        return date_stamp + "T" + time_stamp_utc;
    }

    [[nodiscard]] auto scope() const -> signing_scope {
        return signing_scope{date_stamp, region, service};
    }

    /**
     * @brief Split an x-amz-date value into date and time stamps
     * @return invalid_timestamp unless the value is YYYYMMDD'T'HHMMSS'Z'
     */
    [[nodiscard]] static auto from_iso8601(std::string_view amz_date,
                                           std::string region,
                                           std::string service,
                                           canonical_request request)
        -> result<signable_request>;
};

/**
 * @brief String to sign and raw signature of one request or chunk
 */
struct signature_result {
    std::string string_to_sign;
    std::vector<uint8_t> signature;

    [[nodiscard]] auto signature_hex() const -> std::string;
};

/**
 * @brief Everything a caller needs to attach a signature
 */
struct signed_request {
    std::string authorization;
    std::string signature_hex;
    std::string credential_scope;
    std::vector<std::string> signed_header_names;
};

/**
 * @brief "AWS4-HMAC-SHA256\n" + timestamp + "\n" + scope + "\n" + hex(SHA256(canonical))
 */
[[nodiscard]] auto string_to_sign(const signable_request& request) -> std::string;

/**
 * @brief Sign a request with a derived signing key
 *
 * Deterministic: identical inputs always produce identical output.
 */
[[nodiscard]] auto sign(const signable_request& request,
                        const std::vector<uint8_t>& signing_key) -> signature_result;

/**
 * @brief Build the Authorization header value
 *
 * Header names are lowercased, sorted and joined with ';'.
 */
[[nodiscard]] auto format_authorization_header(std::string_view access_key_id,
                                               std::string_view credential_scope,
                                               std::vector<std::string> signed_header_names,
                                               std::string_view signature_hex) -> std::string;

/**
 * @brief Derive (or look up) the key, sign and format in one step
 * @param cache Optional signing key cache, may be nullptr
 * @return missing_credentials if creds is null or incomplete
 */
[[nodiscard]] auto sign_request(const signable_request& request,
                                const credentials_ptr& creds,
                                signing_key_cache* cache = nullptr) -> result<signed_request>;

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_SIGNING_REQUEST_SIGNER_H

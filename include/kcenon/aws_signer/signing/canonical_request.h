/**
 * @file canonical_request.h
 * @brief Canonical request construction for AWS Signature Version 4
 * @version 0.1.0
 *
 * A canonical request is the fixed-format serialization of an HTTP request
 * that is hashed and signed:
 *
 * @code
 * METHOD\n
 * URI\n
 * QUERY\n
 * name1:value1\n ... nameN:valueN\n
 * \n
 * name1;...;nameN\n
 * PAYLOAD_HASH
 * @endcode
 */

#ifndef KCENON_AWS_SIGNER_SIGNING_CANONICAL_REQUEST_H
#define KCENON_AWS_SIGNER_SIGNING_CANONICAL_REQUEST_H

#include "kcenon/aws_signer/core/types.h"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::aws_signer {

/**
 * @brief Payload hash placeholder announcing a chunk-signed body
 */
inline constexpr std::string_view streaming_payload_sentinel =
    "STREAMING-AWS4-HMAC-SHA256-PAYLOAD";

/**
 * @brief Header list as supplied by callers (names in any case)
 */
using header_list = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Canonical form of a request
 *
 * Header names are lowercase and unique; std::map keeps them in the
 * lexicographic order required by the canonical serialization.
 */
struct canonical_request {
    std::string method;
    std::string uri;
    std::map<std::string, std::string> query_params;
    std::map<std::string, std::string> headers;
    std::string payload_hash;

    /**
     * @brief RFC 3986 encoded query, sorted by encoded key then value
     */
    [[nodiscard]] auto canonical_query_string() const -> std::string;

    /**
     * @brief "name:value\n" for every header in key order
     */
    [[nodiscard]] auto canonical_headers() const -> std::string;

    /**
     * @brief Header names joined with ';'
     */
    [[nodiscard]] auto signed_headers() const -> std::string;

    [[nodiscard]] auto signed_header_names() const -> std::vector<std::string>;

    /**
     * @brief Full canonical serialization
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Lowercase hex SHA-256 of to_string()
     */
    [[nodiscard]] auto hash_hex() const -> std::string;

    [[nodiscard]] auto is_streaming() const -> bool {
        return payload_hash == streaming_payload_sentinel;
    }
};

/**
 * @brief Validate inputs and build a canonical request
 *
 * @param method HTTP method (e.g. "GET", "PUT")
 * @param uri Already-encoded path, must start with '/'
 * @param query_params Raw (unencoded) query parameters, may be empty
 * @param headers Headers to sign; names are lowercased, values kept verbatim
 * @param payload_hash Hex SHA-256 of the body or the streaming sentinel
 * @return Canonical request, or invalid_resource_path / invalid_header /
 *         invalid_payload_hash
 */
[[nodiscard]] auto build_canonical_request(
    std::string_view method,
    std::string_view uri,
    const std::map<std::string, std::string>& query_params,
    const header_list& headers,
    std::string_view payload_hash) -> result<canonical_request>;

/**
 * @brief Fluent builder for canonical requests
 *
 * Example:
 * @code
 * auto req = canonical_request_builder()
 *     .with_method("GET")
 *     .with_uri("/test.txt")
 *     .add_header("Host", "examplebucket.s3.amazonaws.com")
 *     .with_payload_hash(sigv4_utils::empty_payload_hash())
 *     .build();
 * @endcode
 */
class canonical_request_builder {
public:
    auto with_method(std::string method) -> canonical_request_builder&;
    auto with_uri(std::string uri) -> canonical_request_builder&;
    auto add_query_param(std::string name, std::string value) -> canonical_request_builder&;
    auto add_header(std::string name, std::string value) -> canonical_request_builder&;
    auto with_payload_hash(std::string hash) -> canonical_request_builder&;

    [[nodiscard]] auto build() const -> result<canonical_request>;

private:
    std::string method_ = "GET";
    std::string uri_ = "/";
    std::map<std::string, std::string> query_params_;
    header_list headers_;
    std::string payload_hash_;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_SIGNING_CANONICAL_REQUEST_H

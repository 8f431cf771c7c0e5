/**
 * @file request_signer.cpp
 * @brief SigV4 string-to-sign, signature and Authorization header
 * @version 0.1.0
 */

#include "kcenon/aws_signer/signing/request_signer.h"

#include "kcenon/aws_signer/core/logging.h"
#include "kcenon/aws_signer/signing/sigv4_utils.h"

#include <algorithm>
#include <sstream>

namespace kcenon::aws_signer {

auto signable_request::from_iso8601(std::string_view amz_date,
                                    std::string region,
                                    std::string service,
                                    canonical_request request)
    -> result<signable_request> {
    if (!sigv4_utils::is_iso8601_basic(amz_date)) {
        return unexpected{error{error_code::invalid_timestamp,
            "expected YYYYMMDDTHHMMSSZ, got '" + std::string(amz_date) + "'"}};
    }

    signable_request signable;
    signable.date_stamp = std::string(amz_date.substr(0, 8));
    signable.time_stamp_utc = std::string(amz_date.substr(9));
    signable.region = std::move(region);
    signable.service = std::move(service);
    signable.request = std::move(request);
    return signable;
}

auto signature_result::signature_hex() const -> std::string {
    return sigv4_utils::bytes_to_hex(signature);
}

auto string_to_sign(const signable_request& request) -> std::string {
    std::ostringstream oss;
    oss << signing_algorithm << '\n'
        << request.timestamp() << '\n'
        << request.scope().to_string() << '\n'
        << request.request.hash_hex();
    return oss.str();
}

auto sign(const signable_request& request,
          const std::vector<uint8_t>& signing_key) -> signature_result {
    signature_result out;
    out.string_to_sign = string_to_sign(request);
    out.signature = sigv4_utils::hmac_sha256(signing_key, out.string_to_sign);
    return out;
}

auto format_authorization_header(std::string_view access_key_id,
                                 std::string_view credential_scope,
                                 std::vector<std::string> signed_header_names,
                                 std::string_view signature_hex) -> std::string {
    for (auto& name : signed_header_names) {
        name = sigv4_utils::to_lower(name);
    }
    std::sort(signed_header_names.begin(), signed_header_names.end());

    std::ostringstream oss;
    oss << signing_algorithm
        << " Credential=" << access_key_id << '/' << credential_scope
        << ", SignedHeaders=";
    for (std::size_t i = 0; i < signed_header_names.size(); ++i) {
        if (i > 0) oss << ';';
        oss << signed_header_names[i];
    }
    oss << ", Signature=" << signature_hex;
    return oss.str();
}

auto sign_request(const signable_request& request,
                  const credentials_ptr& creds,
                  signing_key_cache* cache) -> result<signed_request> {
    if (!creds || !creds->is_complete()) {
        return unexpected{error{error_code::missing_credentials}};
    }

    auto scope = request.scope();
    auto key = cache ? cache->get_or_derive(creds->secret_access_key, scope)
                     : derive_signing_key(creds->secret_access_key, scope);
    auto signature = sign(request, key);

    signed_request out;
    out.signature_hex = signature.signature_hex();
    out.credential_scope = scope.to_string();
    out.signed_header_names = request.request.signed_header_names();
    out.authorization = format_authorization_header(
        creds->access_key_id, out.credential_scope, out.signed_header_names, out.signature_hex);

    AWS_LOG_TRACE(log_category::signer,
                  "Signed " + request.request.method + " " + request.request.uri +
                  " scope=" + out.credential_scope);
    return out;
}

}  // namespace kcenon::aws_signer

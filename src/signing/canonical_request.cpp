/**
 * @file canonical_request.cpp
 * @brief Canonical request construction for AWS Signature Version 4
 * @version 0.1.0
 */

#include "kcenon/aws_signer/signing/canonical_request.h"

#include "kcenon/aws_signer/signing/sigv4_utils.h"

#include <algorithm>
#include <sstream>

namespace kcenon::aws_signer {

// ============================================================================
// canonical_request
// ============================================================================

auto canonical_request::canonical_query_string() const -> std::string {
    if (query_params.empty()) {
        return {};
    }

    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(query_params.size());
    for (const auto& [key, value] : query_params) {
        encoded.emplace_back(sigv4_utils::url_encode(key),
                             sigv4_utils::url_encode(value));
    }
    std::sort(encoded.begin(), encoded.end());

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : encoded) {
        if (!first) oss << '&';
        oss << key << '=' << value;
        first = false;
    }
    return oss.str();
}

auto canonical_request::canonical_headers() const -> std::string {
    std::ostringstream oss;
    for (const auto& [name, value] : headers) {
        oss << name << ':' << value << '\n';
    }
    return oss.str();
}

auto canonical_request::signed_headers() const -> std::string {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [name, value] : headers) {
        if (!first) oss << ';';
        oss << name;
        first = false;
    }
    return oss.str();
}

auto canonical_request::signed_header_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        names.push_back(name);
    }
    return names;
}

auto canonical_request::to_string() const -> std::string {
    std::ostringstream oss;
    oss << method << '\n'
        << uri << '\n'
        << canonical_query_string() << '\n'
        << canonical_headers() << '\n'
        << signed_headers() << '\n'
        << payload_hash;
    return oss.str();
}

auto canonical_request::hash_hex() const -> std::string {
    return sigv4_utils::sha256_hex(to_string());
}

// ============================================================================
// Construction
// ============================================================================

auto build_canonical_request(
    std::string_view method,
    std::string_view uri,
    const std::map<std::string, std::string>& query_params,
    const header_list& headers,
    std::string_view payload_hash) -> result<canonical_request> {

    if (uri.empty() || uri.front() != '/') {
        return unexpected{error{error_code::invalid_resource_path,
            "resource path must start with '/': '" + std::string(uri) + "'"}};
    }

    if (payload_hash.empty()) {
        return unexpected{error{error_code::invalid_payload_hash,
            "payload hash must not be empty"}};
    }

    canonical_request request;
    request.method = std::string(method);
    request.uri = std::string(uri);
    request.query_params = query_params;
    request.payload_hash = std::string(payload_hash);

    for (const auto& [name, value] : headers) {
        if (name.empty()) {
            return unexpected{error{error_code::invalid_header,
                "header name must not be empty"}};
        }
        auto lowered = sigv4_utils::to_lower(name);
        auto [it, inserted] = request.headers.emplace(lowered, value);
        if (!inserted) {
            return unexpected{error{error_code::invalid_header,
                "duplicate header: " + lowered}};
        }
    }

    return request;
}

// ============================================================================
// canonical_request_builder
// ============================================================================

auto canonical_request_builder::with_method(std::string method) -> canonical_request_builder& {
    method_ = std::move(method);
    return *this;
}

auto canonical_request_builder::with_uri(std::string uri) -> canonical_request_builder& {
    uri_ = std::move(uri);
    return *this;
}

auto canonical_request_builder::add_query_param(std::string name,
                                                std::string value) -> canonical_request_builder& {
    query_params_[std::move(name)] = std::move(value);
    return *this;
}

auto canonical_request_builder::add_header(std::string name,
                                           std::string value) -> canonical_request_builder& {
    headers_.emplace_back(std::move(name), std::move(value));
    return *this;
}

auto canonical_request_builder::with_payload_hash(std::string hash) -> canonical_request_builder& {
    payload_hash_ = std::move(hash);
    return *this;
}

auto canonical_request_builder::build() const -> result<canonical_request> {
    return build_canonical_request(method_, uri_, query_params_, headers_, payload_hash_);
}

}  // namespace kcenon::aws_signer

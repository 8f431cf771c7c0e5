/**
 * @file signing_key.h
 * @brief SigV4 signing key derivation and memoization
 * @version 0.1.0
 */

#ifndef KCENON_AWS_SIGNER_SIGNING_SIGNING_KEY_H
#define KCENON_AWS_SIGNER_SIGNING_SIGNING_KEY_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::aws_signer {

/**
 * @brief Terminator of every SigV4 credential scope
 */
inline constexpr std::string_view scope_terminator = "aws4_request";

/**
 * @brief date/region/service triple bounding a signing key
 */
struct signing_scope {
    std::string date_stamp;  ///< YYYYMMDD
    std::string region;
    std::string service;

    /**
     * @brief "date/region/service/aws4_request"
     */
    [[nodiscard]] auto to_string() const -> std::string {
        return date_stamp + "/" + region + "/" + service + "/" + std::string(scope_terminator);
    }

    [[nodiscard]] auto operator==(const signing_scope& other) const -> bool = default;
};

/**
 * @brief Derive the signing key for a scope
 *
 * kDate = HMAC("AWS4" + secret, date), kRegion = HMAC(kDate, region),
 * kService = HMAC(kRegion, service), kSigning = HMAC(kService, "aws4_request").
 *
 * @return 32-byte signing key
 */
[[nodiscard]] auto derive_signing_key(std::string_view secret_access_key,
                                      const signing_scope& scope) -> std::vector<uint8_t>;

[[nodiscard]] auto derive_signing_key(std::string_view secret_access_key,
                                      std::string_view date_stamp,
                                      std::string_view region,
                                      std::string_view service) -> std::vector<uint8_t>;

/**
 * @brief Thread-safe bounded memo of derived signing keys
 *
 * Entries are keyed by a SHA-256 fingerprint of the secret plus the scope,
 * so the secret itself is never stored. The oldest entry is dropped when the
 * capacity is reached.
 */
class signing_key_cache {
public:
    static constexpr std::size_t default_capacity = 64;

    explicit signing_key_cache(std::size_t capacity = default_capacity);
    ~signing_key_cache();

    signing_key_cache(const signing_key_cache&) = delete;
    auto operator=(const signing_key_cache&) -> signing_key_cache& = delete;

    /**
     * @brief Return the cached key or derive and remember it
     */
    [[nodiscard]] auto get_or_derive(std::string_view secret_access_key,
                                     const signing_scope& scope) -> std::vector<uint8_t>;

    /**
     * @brief Drop every key derived from the given secret
     */
    void evict_secret(std::string_view secret_access_key);

    void clear();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t;
    [[nodiscard]] auto hits() const -> uint64_t;
    [[nodiscard]] auto misses() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_SIGNING_SIGNING_KEY_H

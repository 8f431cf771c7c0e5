/**
 * @file credentials.h
 * @brief AWS credentials, credential sources and the shared credential cache
 * @version 0.1.0
 *
 * Credentials are handed out as immutable snapshots
 * (std::shared_ptr<const aws_credentials>). A snapshot is borrowed by one
 * signing attempt; when the service rejects it, the attempt reports the very
 * same snapshot back through credentials_invalid().
 */

#ifndef KCENON_AWS_SIGNER_AUTH_CREDENTIALS_H
#define KCENON_AWS_SIGNER_AUTH_CREDENTIALS_H

#include "kcenon/aws_signer/core/types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::aws_signer {

/**
 * @brief Credential source type enumeration
 */
enum class credential_type {
    static_credentials,  ///< Fixed access key and secret
    environment,         ///< AWS_* environment variables
    profile,             ///< Shared credentials file profile
    cached               ///< Caching decorator over another source
};

/**
 * @brief Convert credential_type to string
 */
[[nodiscard]] constexpr auto to_string(credential_type type) -> const char* {
    switch (type) {
        case credential_type::static_credentials: return "static-credentials";
        case credential_type::environment: return "environment";
        case credential_type::profile: return "profile";
        case credential_type::cached: return "cached";
        default: return "unknown";
    }
}

/**
 * @brief Access key, secret and optional session token
 */
struct aws_credentials {
    /// Access key ID
    std::string access_key_id;

    /// Secret access key
    std::string secret_access_key;

    /// Optional session token (for temporary credentials)
    std::optional<std::string> session_token;

    /// Credential expiration time (for temporary credentials)
    std::optional<std::chrono::system_clock::time_point> expiration;

    /**
     * @brief Check if credentials have expired
     * @return true if expired, false otherwise
     */
    [[nodiscard]] auto is_expired() const -> bool {
        if (!expiration.has_value()) {
            return false;
        }
        return std::chrono::system_clock::now() >= expiration.value();
    }

    [[nodiscard]] auto is_complete() const -> bool {
        return !access_key_id.empty() && !secret_access_key.empty();
    }
};

using credentials_ptr = std::shared_ptr<const aws_credentials>;

/**
 * @brief Abstract credential source
 *
 * The scope argument identifies the credential set ("region/service").
 * Implementations must be safe to call from several threads.
 */
class credential_source {
public:
    virtual ~credential_source() = default;

    /**
     * @brief Get the current credentials for a scope
     * @return Snapshot, or missing_credentials
     */
    [[nodiscard]] virtual auto credentials(const std::string& scope)
        -> result<credentials_ptr> = 0;

    /**
     * @brief Report that a snapshot was rejected by the service
     * @param scope Scope the snapshot was obtained for
     * @param creds The rejected snapshot
     * @param reason Service message
     */
    virtual void credentials_invalid(const std::string& scope,
                                     const credentials_ptr& creds,
                                     const std::string& reason) = 0;

    [[nodiscard]] virtual auto type() const -> credential_type = 0;
};

// ============================================================================
// Static Credentials
// ============================================================================

/**
 * @brief Source returning a fixed credential triple
 *
 * Invalidation cannot repair fixed credentials; it is logged and counted.
 */
class static_credential_source : public credential_source {
public:
    /**
     * @brief Create a static source
     * @return nullptr if the access key or secret is empty
     */
    [[nodiscard]] static auto create(const aws_credentials& creds)
        -> std::unique_ptr<static_credential_source>;

    ~static_credential_source() override;

    [[nodiscard]] auto credentials(const std::string& scope)
        -> result<credentials_ptr> override;

    void credentials_invalid(const std::string& scope,
                             const credentials_ptr& creds,
                             const std::string& reason) override;

    [[nodiscard]] auto type() const -> credential_type override;

    [[nodiscard]] auto invalidation_count() const -> uint64_t;

private:
    explicit static_credential_source(const aws_credentials& creds);

    struct impl;
    std::unique_ptr<impl> impl_;
};

// ============================================================================
// Environment Credentials
// ============================================================================

/**
 * @brief Source reading AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and
 *        AWS_SESSION_TOKEN
 *
 * The environment is read at creation and again after every invalidation.
 */
class environment_credential_source : public credential_source {
public:
    /**
     * @brief Create from the process environment
     * @return nullptr if AWS_ACCESS_KEY_ID or AWS_SECRET_ACCESS_KEY is unset
     */
    [[nodiscard]] static auto create() -> std::unique_ptr<environment_credential_source>;

    ~environment_credential_source() override;

    [[nodiscard]] auto credentials(const std::string& scope)
        -> result<credentials_ptr> override;

    void credentials_invalid(const std::string& scope,
                             const credentials_ptr& creds,
                             const std::string& reason) override;

    [[nodiscard]] auto type() const -> credential_type override;

private:
    environment_credential_source();

    struct impl;
    std::unique_ptr<impl> impl_;
};

// ============================================================================
// Profile Credentials
// ============================================================================

/**
 * @brief Source reading a profile of the shared credentials file
 *
 * Keys: aws_access_key_id, aws_secret_access_key, aws_session_token.
 * The file is re-read after every invalidation.
 */
class profile_credential_source : public credential_source {
public:
    /**
     * @brief Create from a credentials file
     * @param profile_name Profile section name
     * @param credentials_file Explicit path (default: ~/.aws/credentials)
     * @return nullptr if the file or profile cannot be read
     */
    [[nodiscard]] static auto create(
        const std::string& profile_name = "default",
        const std::optional<std::string>& credentials_file = std::nullopt)
        -> std::unique_ptr<profile_credential_source>;

    ~profile_credential_source() override;

    [[nodiscard]] auto credentials(const std::string& scope)
        -> result<credentials_ptr> override;

    void credentials_invalid(const std::string& scope,
                             const credentials_ptr& creds,
                             const std::string& reason) override;

    [[nodiscard]] auto type() const -> credential_type override;

    [[nodiscard]] auto profile_name() const -> const std::string&;

private:
    profile_credential_source(std::string profile_name, std::string path);

    struct impl;
    std::unique_ptr<impl> impl_;
};

// ============================================================================
// Credential Cache
// ============================================================================

/**
 * @brief Shared, versioned per-scope cache in front of another source
 *
 * Each scope holds one snapshot and a generation counter. An invalidation
 * evicts the cached snapshot only when it reports that exact snapshot, so a
 * late report from a slow operation never evicts credentials fetched after
 * it. Expired snapshots are refetched transparently.
 */
class credential_cache : public credential_source {
public:
    explicit credential_cache(std::shared_ptr<credential_source> upstream);
    ~credential_cache() override;

    credential_cache(const credential_cache&) = delete;
    auto operator=(const credential_cache&) -> credential_cache& = delete;

    [[nodiscard]] auto credentials(const std::string& scope)
        -> result<credentials_ptr> override;

    void credentials_invalid(const std::string& scope,
                             const credentials_ptr& creds,
                             const std::string& reason) override;

    [[nodiscard]] auto type() const -> credential_type override;

    /**
     * @brief Generation of a scope (0 = never fetched)
     */
    [[nodiscard]] auto generation(const std::string& scope) const -> uint64_t;

    /**
     * @brief Number of invalidations that evicted a snapshot
     */
    [[nodiscard]] auto invalidation_count() const -> uint64_t;

    /**
     * @brief Number of invalidations ignored because they were stale
     */
    [[nodiscard]] auto stale_invalidation_count() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_AUTH_CREDENTIALS_H

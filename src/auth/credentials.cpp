/**
 * @file credentials.cpp
 * @brief AWS credential sources and the shared credential cache
 * @version 0.1.0
 */

#include "kcenon/aws_signer/auth/credentials.h"

#include "kcenon/aws_signer/core/logging.h"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <unordered_map>

namespace kcenon::aws_signer {

namespace {

auto describe(const credentials_ptr& creds) -> std::string {
    if (!creds) {
        return "<none>";
    }
    return secret_masker(get_logger().get_masking_config()).mask_access_key(creds->access_key_id);
}

auto read_environment() -> std::optional<aws_credentials> {
    const char* access_key = std::getenv("AWS_ACCESS_KEY_ID");
    const char* secret_key = std::getenv("AWS_SECRET_ACCESS_KEY");

    if (!access_key || !secret_key || !*access_key || !*secret_key) {
        return std::nullopt;
    }

    aws_credentials creds;
    creds.access_key_id = access_key;
    creds.secret_access_key = secret_key;

    const char* session_token = std::getenv("AWS_SESSION_TOKEN");
    if (session_token && *session_token) {
        creds.session_token = session_token;
    }
    return creds;
}

auto default_credentials_path() -> std::optional<std::filesystem::path> {
    const char* home = std::getenv("HOME");
    if (!home) {
#ifdef _WIN32
        home = std::getenv("USERPROFILE");
#endif
    }
    if (!home) {
        return std::nullopt;
    }
    return std::filesystem::path(home) / ".aws" / "credentials";
}

// Parse one profile section of an INI credentials file
auto read_profile(const std::filesystem::path& path,
                  const std::string& profile_name) -> std::optional<aws_credentials> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    std::string line;
    std::string current_profile;
    aws_credentials creds;
    bool found_profile = false;

    while (std::getline(file, line)) {
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        auto end = line.find_last_not_of(" \t\r\n");
        line = line.substr(start, end - start + 1);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_profile = line.substr(1, line.size() - 2);
            continue;
        }

        if (current_profile != profile_name) {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));

        if (key == "aws_access_key_id") {
            creds.access_key_id = value;
            found_profile = true;
        } else if (key == "aws_secret_access_key") {
            creds.secret_access_key = value;
        } else if (key == "aws_session_token" && !value.empty()) {
            creds.session_token = value;
        }
    }

    if (!found_profile || !creds.is_complete()) {
        return std::nullopt;
    }
    return creds;
}

}  // namespace

// ============================================================================
// static_credential_source
// ============================================================================

struct static_credential_source::impl {
    credentials_ptr credentials_;
    std::atomic<uint64_t> invalidations_{0};
};

static_credential_source::static_credential_source(const aws_credentials& creds)
    : impl_(std::make_unique<impl>()) {
    impl_->credentials_ = std::make_shared<const aws_credentials>(creds);
}

static_credential_source::~static_credential_source() = default;

auto static_credential_source::create(const aws_credentials& creds)
    -> std::unique_ptr<static_credential_source> {
    if (!creds.is_complete()) {
        return nullptr;
    }
    return std::unique_ptr<static_credential_source>(new static_credential_source(creds));
}

auto static_credential_source::credentials(const std::string& /*scope*/)
    -> result<credentials_ptr> {
    return impl_->credentials_;
}

void static_credential_source::credentials_invalid(const std::string& scope,
                                                   const credentials_ptr& creds,
                                                   const std::string& reason) {
    ++impl_->invalidations_;
    AWS_LOG_WARN(log_category::credentials,
                 "Static credentials " + describe(creds) + " rejected for scope " +
                 scope + ": " + reason);
}

auto static_credential_source::type() const -> credential_type {
    return credential_type::static_credentials;
}

auto static_credential_source::invalidation_count() const -> uint64_t {
    return impl_->invalidations_.load();
}

// ============================================================================
// environment_credential_source
// ============================================================================

struct environment_credential_source::impl {
    credentials_ptr credentials_;
    bool stale_ = false;
    std::mutex mutex_;
};

environment_credential_source::environment_credential_source()
    : impl_(std::make_unique<impl>()) {}

environment_credential_source::~environment_credential_source() = default;

auto environment_credential_source::create()
    -> std::unique_ptr<environment_credential_source> {
    auto creds = read_environment();
    if (!creds) {
        return nullptr;
    }

    auto source = std::unique_ptr<environment_credential_source>(
        new environment_credential_source());
    source->impl_->credentials_ = std::make_shared<const aws_credentials>(std::move(*creds));
    return source;
}

auto environment_credential_source::credentials(const std::string& /*scope*/)
    -> result<credentials_ptr> {
    std::lock_guard lock(impl_->mutex_);
    if (impl_->stale_) {
        auto creds = read_environment();
        if (!creds) {
            return unexpected{error{error_code::missing_credentials,
                "AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY not set"}};
        }
        impl_->credentials_ = std::make_shared<const aws_credentials>(std::move(*creds));
        impl_->stale_ = false;
        AWS_LOG_DEBUG(log_category::credentials, "Reloaded credentials from environment");
    }
    return impl_->credentials_;
}

void environment_credential_source::credentials_invalid(const std::string& scope,
                                                        const credentials_ptr& creds,
                                                        const std::string& reason) {
    std::lock_guard lock(impl_->mutex_);
    if (creds == impl_->credentials_) {
        impl_->stale_ = true;
    }
    AWS_LOG_WARN(log_category::credentials,
                 "Environment credentials " + describe(creds) + " rejected for scope " +
                 scope + ": " + reason);
}

auto environment_credential_source::type() const -> credential_type {
    return credential_type::environment;
}

// ============================================================================
// profile_credential_source
// ============================================================================

struct profile_credential_source::impl {
    std::string profile_name_;
    std::string path_;
    credentials_ptr credentials_;
    bool stale_ = false;
    std::mutex mutex_;
};

profile_credential_source::profile_credential_source(std::string profile_name,
                                                     std::string path)
    : impl_(std::make_unique<impl>()) {
    impl_->profile_name_ = std::move(profile_name);
    impl_->path_ = std::move(path);
}

profile_credential_source::~profile_credential_source() = default;

auto profile_credential_source::create(
    const std::string& profile_name,
    const std::optional<std::string>& credentials_file)
    -> std::unique_ptr<profile_credential_source> {
    std::filesystem::path creds_path;
    if (credentials_file.has_value()) {
        creds_path = credentials_file.value();
    } else {
        auto default_path = default_credentials_path();
        if (!default_path) {
            return nullptr;
        }
        creds_path = *default_path;
    }

    auto creds = read_profile(creds_path, profile_name);
    if (!creds) {
        return nullptr;
    }

    auto source = std::unique_ptr<profile_credential_source>(
        new profile_credential_source(profile_name, creds_path.string()));
    source->impl_->credentials_ = std::make_shared<const aws_credentials>(std::move(*creds));
    return source;
}

auto profile_credential_source::credentials(const std::string& /*scope*/)
    -> result<credentials_ptr> {
    std::lock_guard lock(impl_->mutex_);
    if (impl_->stale_) {
        auto creds = read_profile(impl_->path_, impl_->profile_name_);
        if (!creds) {
            return unexpected{error{error_code::missing_credentials,
                "profile '" + impl_->profile_name_ + "' not found in " + impl_->path_}};
        }
        impl_->credentials_ = std::make_shared<const aws_credentials>(std::move(*creds));
        impl_->stale_ = false;
        AWS_LOG_DEBUG(log_category::credentials,
                      "Reloaded profile '" + impl_->profile_name_ + "'");
    }
    return impl_->credentials_;
}

void profile_credential_source::credentials_invalid(const std::string& scope,
                                                    const credentials_ptr& creds,
                                                    const std::string& reason) {
    std::lock_guard lock(impl_->mutex_);
    if (creds == impl_->credentials_) {
        impl_->stale_ = true;
    }
    AWS_LOG_WARN(log_category::credentials,
                 "Profile '" + impl_->profile_name_ + "' credentials " + describe(creds) +
                 " rejected for scope " + scope + ": " + reason);
}

auto profile_credential_source::type() const -> credential_type {
    return credential_type::profile;
}

auto profile_credential_source::profile_name() const -> const std::string& {
    return impl_->profile_name_;
}

// ============================================================================
// credential_cache
// ============================================================================

struct credential_cache::impl {
    struct entry {
        credentials_ptr snapshot;
        uint64_t generation = 0;
    };

    std::shared_ptr<credential_source> upstream_;
    std::unordered_map<std::string, entry> entries_;
    uint64_t invalidations_ = 0;
    uint64_t stale_invalidations_ = 0;
    mutable std::mutex mutex_;
};

credential_cache::credential_cache(std::shared_ptr<credential_source> upstream)
    : impl_(std::make_unique<impl>()) {
    impl_->upstream_ = std::move(upstream);
}

credential_cache::~credential_cache() = default;

auto credential_cache::credentials(const std::string& scope) -> result<credentials_ptr> {
    std::lock_guard lock(impl_->mutex_);

    if (!impl_->upstream_) {
        return unexpected{error{error_code::missing_credentials,
            "credential cache has no upstream source"}};
    }

    auto& slot = impl_->entries_[scope];
    if (slot.snapshot && !slot.snapshot->is_expired()) {
        return slot.snapshot;
    }

    auto fetched = impl_->upstream_->credentials(scope);
    if (!fetched) {
        return unexpected{fetched.error()};
    }

    slot.snapshot = fetched.value();
    ++slot.generation;
    AWS_LOG_DEBUG(log_category::credentials,
                  "Cached credentials " + describe(slot.snapshot) + " for scope " + scope +
                  " (generation " + std::to_string(slot.generation) + ")");
    return slot.snapshot;
}

void credential_cache::credentials_invalid(const std::string& scope,
                                           const credentials_ptr& creds,
                                           const std::string& reason) {
    std::shared_ptr<credential_source> upstream;
    {
        std::lock_guard lock(impl_->mutex_);
        auto it = impl_->entries_.find(scope);
        if (it == impl_->entries_.end() || !it->second.snapshot ||
            it->second.snapshot != creds) {
            ++impl_->stale_invalidations_;
            AWS_LOG_DEBUG(log_category::credentials,
                          "Ignoring stale invalidation for scope " + scope);
            return;
        }
        it->second.snapshot.reset();
        ++impl_->invalidations_;
        upstream = impl_->upstream_;
    }

    if (upstream) {
        upstream->credentials_invalid(scope, creds, reason);
    }
}

auto credential_cache::type() const -> credential_type {
    return credential_type::cached;
}

auto credential_cache::generation(const std::string& scope) const -> uint64_t {
    std::lock_guard lock(impl_->mutex_);
    auto it = impl_->entries_.find(scope);
    return it == impl_->entries_.end() ? 0 : it->second.generation;
}

auto credential_cache::invalidation_count() const -> uint64_t {
    std::lock_guard lock(impl_->mutex_);
    return impl_->invalidations_;
}

auto credential_cache::stale_invalidation_count() const -> uint64_t {
    std::lock_guard lock(impl_->mutex_);
    return impl_->stale_invalidations_;
}

}  // namespace kcenon::aws_signer

/**
 * @file signing_key.cpp
 * @brief SigV4 signing key derivation and memoization
 * @version 0.1.0
 */

#include "kcenon/aws_signer/signing/signing_key.h"

#include "kcenon/aws_signer/core/logging.h"
#include "kcenon/aws_signer/signing/sigv4_utils.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace kcenon::aws_signer {

// ============================================================================
// Key derivation
// ============================================================================

auto derive_signing_key(std::string_view secret_access_key,
                        std::string_view date_stamp,
                        std::string_view region,
                        std::string_view service) -> std::vector<uint8_t> {
    auto k_date = sigv4_utils::hmac_sha256("AWS4" + std::string(secret_access_key), date_stamp);
    auto k_region = sigv4_utils::hmac_sha256(k_date, region);
    auto k_service = sigv4_utils::hmac_sha256(k_region, service);
    return sigv4_utils::hmac_sha256(k_service, scope_terminator);
}

auto derive_signing_key(std::string_view secret_access_key,
                        const signing_scope& scope) -> std::vector<uint8_t> {
    return derive_signing_key(secret_access_key, scope.date_stamp, scope.region, scope.service);
}

// ============================================================================
// signing_key_cache
// ============================================================================

struct signing_key_cache::impl {
    std::size_t capacity;
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::vector<uint8_t>> keys;
    std::deque<std::string> insertion_order;
    uint64_t hits = 0;
    uint64_t misses = 0;

    explicit impl(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

    static auto fingerprint(std::string_view secret) -> std::string {
        return sigv4_utils::sha256_hex(secret);
    }

    static auto make_key(const std::string& secret_fingerprint,
                         const signing_scope& scope) -> std::string {
        return secret_fingerprint + "|" + scope.to_string();
    }
};

signing_key_cache::signing_key_cache(std::size_t capacity)
    : impl_(std::make_unique<impl>(capacity)) {}

signing_key_cache::~signing_key_cache() = default;

auto signing_key_cache::get_or_derive(std::string_view secret_access_key,
                                      const signing_scope& scope) -> std::vector<uint8_t> {
    auto cache_key = impl::make_key(impl::fingerprint(secret_access_key), scope);

    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->keys.find(cache_key);
        if (it != impl_->keys.end()) {
            ++impl_->hits;
            return it->second;
        }
        ++impl_->misses;
    }

    auto key = derive_signing_key(secret_access_key, scope);

    std::lock_guard lock(impl_->mutex);
    if (impl_->keys.find(cache_key) == impl_->keys.end()) {
        while (impl_->keys.size() >= impl_->capacity && !impl_->insertion_order.empty()) {
            impl_->keys.erase(impl_->insertion_order.front());
            impl_->insertion_order.pop_front();
        }
        impl_->keys.emplace(cache_key, key);
        impl_->insertion_order.push_back(cache_key);
        AWS_LOG_TRACE(log_category::signer, "Derived signing key for scope " + scope.to_string());
    }
    return key;
}

void signing_key_cache::evict_secret(std::string_view secret_access_key) {
    auto prefix = impl::fingerprint(secret_access_key) + "|";

    std::lock_guard lock(impl_->mutex);
    auto& order = impl_->insertion_order;
    order.erase(std::remove_if(order.begin(), order.end(),
                               [&](const std::string& key) {
                                   if (key.compare(0, prefix.size(), prefix) == 0) {
                                       impl_->keys.erase(key);
                                       return true;
                                   }
                                   return false;
                               }),
                order.end());
}

void signing_key_cache::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->keys.clear();
    impl_->insertion_order.clear();
}

auto signing_key_cache::size() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->keys.size();
}

auto signing_key_cache::capacity() const -> std::size_t {
    return impl_->capacity;
}

auto signing_key_cache::hits() const -> uint64_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->hits;
}

auto signing_key_cache::misses() const -> uint64_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->misses;
}

}  // namespace kcenon::aws_signer

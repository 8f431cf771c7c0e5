/**
 * @file aws_client.cpp
 * @brief Signed AWS client with retry and credential invalidation
 * @version 0.1.0
 */

#include "kcenon/aws_signer/client/aws_client.h"

#include "kcenon/aws_signer/core/error_classifier.h"
#include "kcenon/aws_signer/core/logging.h"
#include "kcenon/aws_signer/signing/chunk_signature_chain.h"
#include "kcenon/aws_signer/signing/request_signer.h"
#include "kcenon/aws_signer/signing/sigv4_utils.h"

#include <exception>
#include <mutex>

namespace kcenon::aws_signer {

namespace {

constexpr const char* aws_chunked_encoding = "aws-chunked";

auto to_response(http_response&& response) -> aws_response {
    aws_response out;
    out.status_code = response.status_code;
    out.headers = std::move(response.headers);
    out.body = std::string(response.body.begin(), response.body.end());
    return out;
}

auto to_header_list(const std::map<std::string, std::string>& headers) -> header_list {
    return header_list(headers.begin(), headers.end());
}

auto precondition(const error& err) -> aws_error {
    return precondition_violation{err.code, err.message};
}

}  // namespace

// ============================================================================
// aws_response
// ============================================================================

auto aws_response::get_header(const std::string& key) const -> std::optional<std::string> {
    for (const auto& [name, value] : headers) {
        if (sigv4_utils::iequals(name, key)) {
            return value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// aws_client::impl
// ============================================================================

struct aws_client::impl {
    std::string endpoint_;
    std::string region_;
    std::string service_;
    std::shared_ptr<credential_source> credentials_;
    std::shared_ptr<http_transport> transport_;
    client_configuration config_;
    error_classifier classifier_;
    signing_key_cache key_cache_;

    time_source time_source_ = [] { return std::chrono::system_clock::now(); };
    sleep_function sleep_ = default_sleep_function();
    mutable std::mutex hooks_mutex_;

    [[nodiscard]] auto credential_scope() const -> std::string {
        return region_ + "/" + service_;
    }

    [[nodiscard]] auto url_for(const std::string& resource) const -> std::string {
        return (config_.use_ssl ? "https://" : "http://") + endpoint_ + resource;
    }

    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point {
        std::lock_guard lock(hooks_mutex_);
        return time_source_();
    }

    [[nodiscard]] auto make_driver(const std::string& operation) -> retry_driver {
        retry_options options;
        options.max_retries = config_.max_error_retry;
        options.initial_sleep = config_.initial_backoff;
        options.max_sleep = config_.max_backoff;
        options.retry_authorization_failures = config_.retry_authorization_failures;
        options.operation = operation;

        retry_hooks hooks;
        {
            std::lock_guard lock(hooks_mutex_);
            hooks.sleep = sleep_;
        }
        hooks.on_authorization_failure = [this](const authorization_failure& failure) {
            invalidate(failure);
        };
        return retry_driver(std::move(options), std::move(hooks));
    }

    [[nodiscard]] auto run_request(const std::string& operation,
                                   const std::string& body) -> result<aws_response, aws_error> {
        auto driver = make_driver(operation);
        return driver.run([&](uint32_t tries_left) {
            return json_attempt(operation, body, tries_left);
        });
    }

    void invalidate(const authorization_failure& failure) {
        if (failure.credentials) {
            key_cache_.evict_secret(failure.credentials->secret_access_key);
        }
        credentials_->credentials_invalid(failure.credential_scope, failure.credentials,
                                          failure.message);
    }

    [[nodiscard]] auto fetch_credentials() -> result<credentials_ptr, aws_error> {
        auto creds = credentials_->credentials(credential_scope());
        if (!creds) {
            return unexpected<aws_error>{precondition(creds.error())};
        }
        if (!creds.value() || !creds.value()->is_complete()) {
            return unexpected<aws_error>{precondition_violation{
                error_code::missing_credentials, "credential source returned no credentials"}};
        }
        return creds.value();
    }

    /**
     * @brief Turn a transport result into a response or a classified failure
     */
    [[nodiscard]] auto finish_attempt(result<http_response> sent,
                                      const credentials_ptr& creds,
                                      request_log_context& ctx)
        -> result<aws_response, aws_error> {
        if (!sent) {
            auto failure = aws_error::from_error(sent.error());
            ctx.error_message = failure.message();
            AWS_LOG_WARN_CTX(log_category::client, "Transport reported an error", ctx);
            return unexpected<aws_error>{std::move(failure)};
        }

        auto response = std::move(sent).value();
        ctx.http_status = response.status_code;

        if (auto failure = classifier_.classify_response(response)) {
            if (const auto* auth = failure->as_authorization()) {
                authorization_failure bound = *auth;
                bound.credential_scope = credential_scope();
                bound.credentials = creds;
                *failure = aws_error(std::move(bound));
            }
            ctx.error_type = failure->type();
            AWS_LOG_DEBUG_CTX(log_category::client, "Service returned an error", ctx);
            return unexpected<aws_error>{std::move(*failure)};
        }

        AWS_LOG_DEBUG_CTX(log_category::client, "Request completed", ctx);
        return to_response(std::move(response));
    }

    [[nodiscard]] auto json_attempt(const std::string& operation,
                                    const std::string& body,
                                    uint32_t tries_left) -> result<aws_response, aws_error>;

    [[nodiscard]] auto upload_attempt(http_method method,
                                      const std::string& resource,
                                      const std::map<std::string, std::string>& caller_headers,
                                      std::istream& payload,
                                      std::istream::pos_type start,
                                      uint64_t payload_size,
                                      std::size_t block_size,
                                      uint32_t attempt,
                                      uint32_t tries_left) -> result<aws_response, aws_error>;
};

// ============================================================================
// JSON protocol
// ============================================================================

auto aws_client::impl::json_attempt(const std::string& operation,
                                    const std::string& body,
                                    uint32_t tries_left) -> result<aws_response, aws_error> {
    auto creds = fetch_credentials();
    if (!creds) {
        return unexpected<aws_error>{creds.error()};
    }

    auto amz_date = sigv4_utils::format_iso8601_time(now());

    std::map<std::string, std::string> headers;
    headers["host"] = endpoint_;
    headers["x-amz-date"] = amz_date;
    headers["x-amz-target"] = operation;
    headers["content-type"] = config_.json_content_type;
    headers["x-amz-content-sha256"] = sigv4_utils::sha256_hex(body);
    if (creds.value()->session_token && !creds.value()->session_token->empty()) {
        headers["x-amz-security-token"] = *creds.value()->session_token;
    }

    auto canonical = build_canonical_request("POST", "/", {}, to_header_list(headers),
                                             headers["x-amz-content-sha256"]);
    if (!canonical) {
        return unexpected<aws_error>{precondition(canonical.error())};
    }

    auto signable = signable_request::from_iso8601(amz_date, region_, service_,
                                                   std::move(canonical).value());
    if (!signable) {
        return unexpected<aws_error>{precondition(signable.error())};
    }

    auto signed_req = sign_request(signable.value(), creds.value(), &key_cache_);
    if (!signed_req) {
        return unexpected<aws_error>{precondition(signed_req.error())};
    }

    http_request request;
    request.method = http_method::post;
    request.url = url_for("/");
    request.headers = std::move(headers);
    request.headers["authorization"] = signed_req.value().authorization;
    request.body = body;

    request_log_context ctx;
    ctx.operation = operation;
    ctx.credential_scope = credential_scope();
    ctx.endpoint = endpoint_;
    ctx.bytes_sent = body.size();
    AWS_LOG_DEBUG_CTX(log_category::client,
                      "Sending request (" + std::to_string(tries_left) + " retries left)", ctx);

    result<http_response> sent = unexpected{error{error_code::transport_failure}};
    try {
        sent = transport_->send(request);
    } catch (const std::exception& e) {
        sent = unexpected{error{error_code::transport_failure, e.what()}};
    }

    return finish_attempt(std::move(sent), creds.value(), ctx);
}

// ============================================================================
// Streaming upload
// ============================================================================

auto aws_client::impl::upload_attempt(http_method method,
                                      const std::string& resource,
                                      const std::map<std::string, std::string>& caller_headers,
                                      std::istream& payload,
                                      std::istream::pos_type start,
                                      uint64_t payload_size,
                                      std::size_t block_size,
                                      uint32_t attempt,
                                      uint32_t tries_left) -> result<aws_response, aws_error> {
    if (attempt > 1) {
        payload.clear();
        if (start == std::istream::pos_type(-1) || !payload.seekg(start)) {
            return unexpected<aws_error>{precondition_violation{
                error_code::payload_not_rewindable,
                "payload stream cannot be rewound for retry"}};
        }
    }

    auto creds = fetch_credentials();
    if (!creds) {
        return unexpected<aws_error>{creds.error()};
    }

    auto amz_date = sigv4_utils::format_iso8601_time(now());

    auto headers = caller_headers;
    std::string encoding = aws_chunked_encoding;
    if (auto it = headers.find("content-encoding"); it != headers.end() && !it->second.empty()) {
        encoding += "," + it->second;
    }
    headers.erase("content-length");
    headers.erase("authorization");
    headers["host"] = endpoint_;
    headers["x-amz-date"] = amz_date;
    headers["content-encoding"] = encoding;
    headers["transfer-encoding"] = "chunked";
    headers["x-amz-content-sha256"] = std::string(streaming_payload_sentinel);
    headers["x-amz-decoded-content-length"] = std::to_string(payload_size);
    if (headers.find("x-amz-storage-class") == headers.end()) {
        headers["x-amz-storage-class"] = config_.default_storage_class;
    }
    if (creds.value()->session_token && !creds.value()->session_token->empty()) {
        headers["x-amz-security-token"] = *creds.value()->session_token;
    }

    auto canonical = build_canonical_request(to_string(method), resource, {},
                                             to_header_list(headers),
                                             streaming_payload_sentinel);
    if (!canonical) {
        return unexpected<aws_error>{precondition(canonical.error())};
    }

    auto signable = signable_request::from_iso8601(amz_date, region_, service_,
                                                   std::move(canonical).value());
    if (!signable) {
        return unexpected<aws_error>{precondition(signable.error())};
    }

    auto scope = signable.value().scope();
    auto key = key_cache_.get_or_derive(creds.value()->secret_access_key, scope);
    auto chain = chunk_signature_chain::start(signable.value(), std::move(key));
    if (!chain) {
        return unexpected<aws_error>{precondition(chain.error())};
    }

    http_request request;
    request.method = method;
    request.url = url_for(resource);
    request.headers = std::move(headers);
    request.headers["authorization"] = format_authorization_header(
        creds.value()->access_key_id, scope.to_string(),
        signable.value().request.signed_header_names(), chain.value().seed_signature());

    request_log_context ctx;
    ctx.operation = std::string(to_string(method)) + " " + resource;
    ctx.credential_scope = credential_scope();
    ctx.endpoint = endpoint_;
    ctx.attempt = attempt;
    AWS_LOG_DEBUG_CTX(log_category::client,
                      "Starting streaming upload (" + std::to_string(tries_left) +
                      " retries left)", ctx);

    auto& signer_chain = chain.value();
    chunked_body_writer writer = [&](const chunk_sink& sink) -> result<void> {
        auto streamed = stream_signed_chunks(signer_chain, payload, payload_size,
                                             block_size, sink);
        if (!streamed) {
            return unexpected{streamed.error()};
        }
        ctx.bytes_sent = streamed.value();
        return {};
    };

    result<http_response> sent = unexpected{error{error_code::transport_failure}};
    try {
        sent = transport_->send_chunked(request, writer);
    } catch (const std::exception& e) {
        sent = unexpected{error{error_code::transport_failure, e.what()}};
    }

    return finish_attempt(std::move(sent), creds.value(), ctx);
}

// ============================================================================
// aws_client
// ============================================================================

aws_client::aws_client() : impl_(std::make_shared<impl>()) {}

aws_client::~aws_client() = default;

auto aws_client::create(std::string endpoint,
                        std::string region,
                        std::string service,
                        std::shared_ptr<credential_source> credentials,
                        std::shared_ptr<http_transport> transport,
                        client_configuration config) -> std::unique_ptr<aws_client> {
    if (endpoint.empty() || region.empty() || service.empty() || !credentials || !transport) {
        return nullptr;
    }
    if (auto valid = config.validate(); !valid) {
        AWS_LOG_ERROR(log_category::client, valid.error().message);
        return nullptr;
    }

    get_logger().initialize();

    auto client = std::unique_ptr<aws_client>(new aws_client());
    client->impl_->endpoint_ = std::move(endpoint);
    client->impl_->region_ = std::move(region);
    client->impl_->service_ = std::move(service);
    client->impl_->credentials_ = std::move(credentials);
    client->impl_->transport_ = std::move(transport);
    client->impl_->classifier_ = error_classifier(config.authorization_error_types);
    client->impl_->config_ = std::move(config);
    return client;
}

auto aws_client::do_request(const std::string& operation,
                            const std::string& body) -> result<aws_response, aws_error> {
    return impl_->run_request(operation, body);
}

auto aws_client::do_request_async(const std::string& operation,
                                  const std::string& body)
    -> std::future<result<aws_response, aws_error>> {
    // The task keeps the client state alive if the client is destroyed first
    return std::async(std::launch::async, [state = impl_, operation, body]() {
        return state->run_request(operation, body);
    });
}

auto aws_client::do_rest_upload(http_method method,
                                const std::string& resource,
                                const header_list& headers,
                                std::istream& payload,
                                uint64_t payload_size,
                                std::optional<std::size_t> block_size)
    -> result<aws_response, aws_error> {
    auto effective_block = block_size.value_or(impl_->config_.default_block_size);

    if (auto valid = validate_block_size(effective_block); !valid) {
        AWS_LOG_ERROR(log_category::client, valid.error().message);
        return unexpected<aws_error>{precondition(valid.error())};
    }
    if (resource.empty() || resource.front() != '/') {
        return unexpected<aws_error>{precondition_violation{
            error_code::invalid_resource_path,
            "resource path must start with '/': '" + resource + "'"}};
    }

    std::map<std::string, std::string> caller_headers;
    for (const auto& [name, value] : headers) {
        auto [it, inserted] = caller_headers.emplace(sigv4_utils::to_lower(name), value);
        if (!inserted) {
            return unexpected<aws_error>{precondition_violation{
                error_code::invalid_header, "duplicate header: " + it->first}};
        }
    }

    auto start = payload.tellg();
    auto driver = impl_->make_driver(std::string(to_string(method)) + " " + resource);
    return driver.run([&](uint32_t tries_left) {
        return impl_->upload_attempt(method, resource, caller_headers, payload, start,
                                     payload_size, effective_block,
                                     driver.attempts_made(), tries_left);
    });
}

void aws_client::set_time_source(time_source source) {
    std::lock_guard lock(impl_->hooks_mutex_);
    impl_->time_source_ = std::move(source);
}

void aws_client::set_sleep_function(sleep_function sleep) {
    std::lock_guard lock(impl_->hooks_mutex_);
    impl_->sleep_ = std::move(sleep);
}

auto aws_client::credential_scope() const -> std::string {
    return impl_->credential_scope();
}

auto aws_client::endpoint() const -> const std::string& {
    return impl_->endpoint_;
}

auto aws_client::region() const -> const std::string& {
    return impl_->region_;
}

auto aws_client::service() const -> const std::string& {
    return impl_->service_;
}

auto aws_client::config() const -> const client_configuration& {
    return impl_->config_;
}

auto aws_client::signing_keys() -> signing_key_cache& {
    return impl_->key_cache_;
}

}  // namespace kcenon::aws_signer

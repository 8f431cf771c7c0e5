// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/aws_signer/config/feature_flags.h"

#if AWS_SIGNER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::aws_signer {

/**
 * @brief Log categories for the signing and delivery layer
 */
struct log_category {
    static constexpr std::string_view signer = "aws_signer.signer";
    static constexpr std::string_view retry = "aws_signer.retry";
    static constexpr std::string_view credentials = "aws_signer.credentials";
    static constexpr std::string_view client = "aws_signer.client";
    static constexpr std::string_view stream = "aws_signer.stream";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for credential and signature masking
 */
struct masking_config {
    bool mask_access_keys = true;
    bool mask_signatures = true;
    bool mask_session_tokens = true;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    /**
     * @brief Create config with all masking enabled
     */
    static masking_config all_masked() {
        return {true, true, true, "*", 4};
    }

    /**
     * @brief Create config with no masking
     */
    static masking_config none() {
        return {false, false, false, "*", 4};
    }
};

/**
 * @brief Masks access key ids, signatures and session tokens in log text
 *
 * Secret access keys are never logged, so they have no masking rule.
 */
class secret_masker {
public:
    explicit secret_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    /**
     * @brief Mask sensitive values in a free-form string
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_access_keys && !config_.mask_signatures &&
            !config_.mask_session_tokens) {
            return input;
        }

        std::string result = input;

        if (config_.mask_access_keys) {
            static const std::regex access_key_pattern(R"(\b(AKIA|ASIA)[A-Z0-9]{12,}\b)");
            result = replace_matches(result, access_key_pattern,
                                     [this](const std::string& m) { return mask_access_key(m); });
        }

        if (config_.mask_signatures) {
            static const std::regex signature_pattern(R"(\b[0-9a-f]{64}\b)");
            result = replace_matches(result, signature_pattern,
                                     [this](const std::string& m) { return mask_signature(m); });
        }

        if (config_.mask_session_tokens) {
            static const std::regex token_pattern(R"(x-amz-security-token:\s*\S+)");
            result = replace_matches(result, token_pattern, [](const std::string&) {
                return std::string("x-amz-security-token:<redacted>");
            });
        }

        return result;
    }

    /**
     * @brief Mask an access key id, keeping the leading characters
     */
    [[nodiscard]] auto mask_access_key(const std::string& key_id) const -> std::string {
        if (!config_.mask_access_keys || key_id.size() <= config_.visible_chars) {
            return key_id;
        }
        return key_id.substr(0, config_.visible_chars) +
               std::string(key_id.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Mask a hex signature, keeping the leading characters
     */
    [[nodiscard]] auto mask_signature(const std::string& signature) const -> std::string {
        if (!config_.mask_signatures || signature.size() <= config_.visible_chars) {
            return signature;
        }
        return signature.substr(0, config_.visible_chars) + "...";
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    template <typename Replacer>
    [[nodiscard]] static auto replace_matches(const std::string& input,
                                              const std::regex& pattern,
                                              Replacer&& replacer) -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += replacer(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

[[nodiscard]] inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for a signed request attempt
 */
struct request_log_context {
    std::string operation;
    std::string credential_scope;
    std::optional<uint32_t> attempt;
    std::optional<uint32_t> max_attempts;
    std::optional<int> http_status;
    std::optional<std::string> error_type;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> bytes_sent;
    std::optional<uint64_t> delay_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> endpoint;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    /**
     * @brief Convert context to JSON string with optional masking
     */
    [[nodiscard]] auto to_json_with_masking(const secret_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!operation.empty()) add_field("operation", operation);
        if (!credential_scope.empty()) add_field("credential_scope", credential_scope);
        if (attempt) add_int("attempt", *attempt);
        if (max_attempts) add_int("max_attempts", *max_attempts);
        if (http_status) add_int("http_status", *http_status);
        if (error_type) add_field("error_type", *error_type);
        if (chunk_index) add_int("chunk_index", static_cast<int64_t>(*chunk_index));
        if (bytes_sent) add_int("bytes_sent", static_cast<int64_t>(*bytes_sent));
        if (delay_ms) add_int("delay_ms", static_cast<int64_t>(*delay_ms));
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        if (endpoint) add_field("endpoint", *endpoint);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<request_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const secret_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::warn)
 *     .with_category(log_category::retry)
 *     .with_message("retrying after service error")
 *     .with_operation("DynamoDB_20120810.GetItem")
 *     .with_attempt(2)
 *     .with_http_status(503)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_operation(std::string_view operation) -> log_entry_builder& {
        ensure_context();
        entry_.context->operation = std::string(operation);
        return *this;
    }

    auto with_credential_scope(std::string_view scope) -> log_entry_builder& {
        ensure_context();
        entry_.context->credential_scope = std::string(scope);
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        return *this;
    }

    auto with_http_status(int status) -> log_entry_builder& {
        ensure_context();
        entry_.context->http_status = status;
        return *this;
    }

    auto with_error_type(std::string_view type) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_type = std::string(type);
        return *this;
    }

    auto with_chunk_index(uint64_t index) -> log_entry_builder& {
        ensure_context();
        entry_.context->chunk_index = index;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const request_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = request_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Logger used by the signing and delivery layer
 */
class signer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const request_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    signer_logger() = default;
    ~signer_logger() = default;

    signer_logger(const signer_logger&) = delete;
    signer_logger& operator=(const signer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called by aws_client::create().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if AWS_SIGNER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if AWS_SIGNER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if AWS_SIGNER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Set custom log callback
     *
     * The callback receives the message after masking.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const request_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {

        if (!is_enabled(level)) return;

        log_output_format format;
        secret_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked = current_masker.mask(std::string(message));
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        if (format == log_output_format::json) {
            log_json(level, category, masked, context, file, line, function, current_masker);
        } else {
            log_text(level, category, masked, context, file, line, function, current_masker);
        }
    }

    void flush() {
#if AWS_SIGNER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  const std::string& message,
                  const request_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const secret_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        emit(level, json_str, file, line, function);
    }

    void log_text(log_level level,
                  std::string_view category,
                  const std::string& message,
                  const request_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const secret_masker& masker) {
        std::ostringstream oss;
#if !AWS_SIGNER_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

        emit(level, oss.str(), file, line, function);
    }

    void emit(log_level level,
              const std::string& text,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if AWS_SIGNER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#else
        (void)level;
#endif
        output_to_stderr(text);
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if AWS_SIGNER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    secret_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline signer_logger& get_logger() {
    static signer_logger instance;
    return instance;
}

// Logging macros for convenience
#define AWS_LOG(level, category, message) \
    kcenon::aws_signer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define AWS_LOG_CTX(level, category, message, context) \
    kcenon::aws_signer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define AWS_LOG_TRACE(category, message) \
    AWS_LOG(kcenon::aws_signer::log_level::trace, category, message)

#define AWS_LOG_DEBUG(category, message) \
    AWS_LOG(kcenon::aws_signer::log_level::debug, category, message)

#define AWS_LOG_INFO(category, message) \
    AWS_LOG(kcenon::aws_signer::log_level::info, category, message)

#define AWS_LOG_WARN(category, message) \
    AWS_LOG(kcenon::aws_signer::log_level::warn, category, message)

#define AWS_LOG_ERROR(category, message) \
    AWS_LOG(kcenon::aws_signer::log_level::error, category, message)

#define AWS_LOG_DEBUG_CTX(category, message, ctx) \
    AWS_LOG_CTX(kcenon::aws_signer::log_level::debug, category, message, ctx)

#define AWS_LOG_INFO_CTX(category, message, ctx) \
    AWS_LOG_CTX(kcenon::aws_signer::log_level::info, category, message, ctx)

#define AWS_LOG_WARN_CTX(category, message, ctx) \
    AWS_LOG_CTX(kcenon::aws_signer::log_level::warn, category, message, ctx)

#define AWS_LOG_ERROR_CTX(category, message, ctx) \
    AWS_LOG_CTX(kcenon::aws_signer::log_level::error, category, message, ctx)

}  // namespace kcenon::aws_signer

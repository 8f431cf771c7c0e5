/**
 * @file http_transport.h
 * @brief HTTP transport interface used by the signed client
 * @version 0.1.0
 *
 * The transport owns connections, TLS and chunked transfer-encoding framing.
 * It sends exactly the headers it is given; the client has already signed
 * them.
 */

#ifndef KCENON_AWS_SIGNER_CLIENT_HTTP_TRANSPORT_H
#define KCENON_AWS_SIGNER_CLIENT_HTTP_TRANSPORT_H

#include "kcenon/aws_signer/core/types.h"
#include "kcenon/aws_signer/signing/chunk_signature_chain.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::aws_signer {

/**
 * @brief HTTP method enumeration
 */
enum class http_method {
    get,
    put,
    post,
    del,
    head
};

/**
 * @brief Convert http_method to string
 */
[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::post: return "POST";
        case http_method::del: return "DELETE";
        case http_method::head: return "HEAD";
        default: return "GET";
    }
}

/**
 * @brief Outgoing request
 */
struct http_request {
    http_method method = http_method::get;

    /// Absolute URL (scheme://host/path[?query])
    std::string url;

    /// Lowercase header names
    std::map<std::string, std::string> headers;

    /// Body for non-chunked requests
    std::string body;
};

/**
 * @brief Received response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    /**
     * @brief Get body as string
     */
    [[nodiscard]] auto body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };

        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }

        return std::nullopt;
    }

    /**
     * @brief Check if response indicates success (2xx)
     */
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Produces a chunked body by pushing framed chunks into a sink
 *
 * The transport invokes the writer once per request. An error returned by
 * the writer aborts the request and is returned by send_chunked() unchanged.
 */
using chunked_body_writer = std::function<result<void>(const chunk_sink& sink)>;

/**
 * @brief Abstract HTTP transport
 *
 * Implementations report connection problems as transport errors
 * (-340 to -359). Exceptions escaping send() or send_chunked() are treated
 * by the client as transport failures.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    /**
     * @brief Send a request with an in-memory body
     */
    [[nodiscard]] virtual auto send(const http_request& request)
        -> result<http_response> = 0;

    /**
     * @brief Send a request with a chunked (Transfer-Encoding: chunked) body
     */
    [[nodiscard]] virtual auto send_chunked(const http_request& request,
                                            const chunked_body_writer& writer)
        -> result<http_response> = 0;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_CLIENT_HTTP_TRANSPORT_H

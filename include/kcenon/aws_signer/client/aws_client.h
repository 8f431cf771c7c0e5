/**
 * @file aws_client.h
 * @brief Signed AWS client with retry and credential invalidation
 * @version 0.1.0
 */

#ifndef KCENON_AWS_SIGNER_CLIENT_AWS_CLIENT_H
#define KCENON_AWS_SIGNER_CLIENT_AWS_CLIENT_H

#include "kcenon/aws_signer/auth/credentials.h"
#include "kcenon/aws_signer/client/client_config.h"
#include "kcenon/aws_signer/client/http_transport.h"
#include "kcenon/aws_signer/core/aws_error.h"
#include "kcenon/aws_signer/core/retry_policy.h"
#include "kcenon/aws_signer/core/types.h"
#include "kcenon/aws_signer/signing/canonical_request.h"
#include "kcenon/aws_signer/signing/signing_key.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::aws_signer {

/**
 * @brief Successful (status < 400) response of a signed call
 */
struct aws_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const -> std::optional<std::string>;
};

/**
 * @brief Time source used for x-amz-date
 */
using time_source = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Client for one endpoint/region/service
 *
 * Every attempt fetches credentials, stamps the request with the current
 * time, rebuilds the canonical request and signs it again.
 *
 * @code
 * auto creds = std::make_shared<credential_cache>(
 *     environment_credential_source::create());
 * auto client = aws_client::create("dynamodb.us-east-1.amazonaws.com",
 *                                  "us-east-1", "dynamodb", creds, transport);
 *
 * auto response = client->do_request("DynamoDB_20120810.ListTables", "{}");
 * if (!response) {
 *     std::cerr << response.error().what() << std::endl;
 * }
 * @endcode
 *
 * @note Thread-safe; concurrent operations share the credential source and
 *       the signing key cache.
 */
class aws_client {
public:
    /**
     * @brief Create a client
     * @param endpoint Host name (and optional port) of the service
     * @param region Region, e.g. "us-east-1"
     * @param service Service signing name, e.g. "dynamodb"
     * @param credentials Credential source shared with other clients
     * @param transport HTTP transport
     * @param config Client configuration
     * @return nullptr if an argument is empty or the configuration is invalid
     */
    [[nodiscard]] static auto create(std::string endpoint,
                                     std::string region,
                                     std::string service,
                                     std::shared_ptr<credential_source> credentials,
                                     std::shared_ptr<http_transport> transport,
                                     client_configuration config = {})
        -> std::unique_ptr<aws_client>;

    // Non-copyable, non-movable
    aws_client(const aws_client&) = delete;
    auto operator=(const aws_client&) -> aws_client& = delete;
    ~aws_client();

    /**
     * @brief JSON-protocol call: POST / with x-amz-target = operation
     * @param operation Target, e.g. "DynamoDB_20120810.GetItem"
     * @param body Serialized JSON request body
     * @return Response, or the last failure after retries
     */
    [[nodiscard]] auto do_request(const std::string& operation,
                                  const std::string& body)
        -> result<aws_response, aws_error>;

    /**
     * @brief do_request() on a separate task
     *
     * The returned future stays valid after the client is destroyed.
     */
    [[nodiscard]] auto do_request_async(const std::string& operation,
                                        const std::string& body)
        -> std::future<result<aws_response, aws_error>>;

    /**
     * @brief Streaming upload with aws-chunked chunk signatures
     *
     * Block size and resource path are checked before any transport call.
     * Retries rewind the payload to its position at the time of the call.
     *
     * @param method HTTP method (usually PUT)
     * @param resource Encoded path starting with '/'
     * @param headers Extra headers; content-length is dropped and
     *        content-encoding is appended to "aws-chunked"
     * @param payload Payload stream
     * @param payload_size Bytes to send from the stream
     * @param block_size Chunk size (> 8 KiB, default from the configuration)
     */
    [[nodiscard]] auto do_rest_upload(http_method method,
                                      const std::string& resource,
                                      const header_list& headers,
                                      std::istream& payload,
                                      uint64_t payload_size,
                                      std::optional<std::size_t> block_size = std::nullopt)
        -> result<aws_response, aws_error>;

    /**
     * @brief Replace the clock used for x-amz-date
     */
    void set_time_source(time_source source);

    /**
     * @brief Replace the sleep used between attempts
     */
    void set_sleep_function(sleep_function sleep);

    /**
     * @brief "region/service", the scope passed to the credential source
     */
    [[nodiscard]] auto credential_scope() const -> std::string;

    [[nodiscard]] auto endpoint() const -> const std::string&;
    [[nodiscard]] auto region() const -> const std::string&;
    [[nodiscard]] auto service() const -> const std::string&;
    [[nodiscard]] auto config() const -> const client_configuration&;

    /**
     * @brief Signing keys derived by this client
     */
    [[nodiscard]] auto signing_keys() -> signing_key_cache&;

private:
    aws_client();

    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_CLIENT_AWS_CLIENT_H

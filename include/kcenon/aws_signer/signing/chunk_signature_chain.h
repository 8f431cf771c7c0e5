/**
 * @file chunk_signature_chain.h
 * @brief Chained chunk signatures for aws-chunked streaming uploads
 * @version 0.1.0
 *
 * The seed signature is the signature of the request headers (payload hash
 * set to the streaming sentinel). Each chunk signature covers the previous
 * signature and the hash of the chunk bytes, so chunks cannot be reordered,
 * dropped or replayed. A zero-length chunk terminates the chain.
 */

#ifndef KCENON_AWS_SIGNER_SIGNING_CHUNK_SIGNATURE_CHAIN_H
#define KCENON_AWS_SIGNER_SIGNING_CHUNK_SIGNATURE_CHAIN_H

#include "kcenon/aws_signer/core/types.h"
#include "kcenon/aws_signer/signing/request_signer.h"
#include "kcenon/aws_signer/signing/signing_key.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::aws_signer {

/**
 * @brief Block sizes must be strictly greater than this (8 KiB)
 */
inline constexpr std::size_t minimum_block_size = 8 * 1024;

/**
 * @brief Algorithm identifier of chunk strings to sign
 */
inline constexpr std::string_view chunk_signing_algorithm = "AWS4-HMAC-SHA256-PAYLOAD";

/**
 * @brief Receives one framed chunk: its bytes and its chunk extension
 */
using chunk_sink = std::function<result<void>(std::span<const std::byte> data,
                                              const std::string& extension)>;

/**
 * @brief Reject block sizes of 8 KiB or less
 */
[[nodiscard]] auto validate_block_size(std::size_t block_size) -> result<void>;

/**
 * @brief "chunk-signature=<hex>"
 */
[[nodiscard]] auto chunk_extension(std::string_view signature_hex) -> std::string;

/**
 * @brief Size of the aws-chunked encoding of a payload
 *
 * Counts "<hex size>;chunk-signature=<64 hex>\r\n<data>\r\n" for every data
 * chunk plus the terminating zero-length chunk.
 */
[[nodiscard]] auto aws_chunked_encoded_length(uint64_t payload_size,
                                              std::size_t block_size) -> uint64_t;

/**
 * @brief Inputs of one chunk signature
 */
struct signable_chunk {
    std::string date_stamp;
    std::string time_stamp_utc;
    std::string region;
    std::string service;
    std::string previous_signature_hex;
    std::string chunk_payload_hash;  ///< hex SHA-256 of the chunk bytes

    /**
     * @brief "AWS4-HMAC-SHA256-PAYLOAD\n" + timestamp + "\n" + scope + "\n" +
     *        previous + "\n" + hex(SHA256("")) + "\n" + chunk hash
     */
    [[nodiscard]] auto string_to_sign() const -> std::string;
};

/**
 * @brief Signature state of one streaming upload attempt
 *
 * Holds only the previous signature; chunk bytes are never retained.
 */
class chunk_signature_chain {
public:
    /**
     * @brief Sign the seed request and start a chain
     * @param seed_request Request whose payload hash is the streaming sentinel
     * @param signing_key Key derived for the request scope
     * @return invalid_payload_hash if the request is not a streaming request
     */
    [[nodiscard]] static auto start(const signable_request& seed_request,
                                    std::vector<uint8_t> signing_key)
        -> result<chunk_signature_chain>;

    /**
     * @brief Sign the next chunk; an empty span signs the final chunk
     * @return Chunk signature hex, or chain_finished
     */
    [[nodiscard]] auto sign_chunk(std::span<const std::byte> data) -> result<std::string>;

    /**
     * @brief Sign a chunk given its precomputed hex SHA-256
     */
    [[nodiscard]] auto sign_chunk_hash(std::string_view chunk_hash_hex,
                                       bool final_chunk) -> result<std::string>;

    /**
     * @brief Sign the terminating zero-length chunk
     */
    [[nodiscard]] auto finish() -> result<std::string>;

    [[nodiscard]] auto seed_signature() const -> const std::string& { return seed_signature_; }
    [[nodiscard]] auto previous_signature() const -> const std::string& { return previous_signature_; }
    [[nodiscard]] auto seed_string_to_sign() const -> const std::string& { return seed_string_to_sign_; }
    [[nodiscard]] auto chunks_signed() const -> uint64_t { return chunks_signed_; }
    [[nodiscard]] auto finished() const -> bool { return finished_; }

private:
    chunk_signature_chain() = default;

    std::string date_stamp_;
    std::string time_stamp_utc_;
    std::string region_;
    std::string service_;
    std::vector<uint8_t> signing_key_;
    std::string seed_signature_;
    std::string seed_string_to_sign_;
    std::string previous_signature_;
    uint64_t chunks_signed_ = 0;
    bool finished_ = false;
};

/**
 * @brief Read a payload in block_size chunks, sign each and push it to a sink
 *
 * Emits ceil(payload_size / block_size) data chunks followed by the final
 * zero-length chunk. Uses a single reusable buffer of block_size bytes.
 *
 * @return Payload bytes delivered, or invalid_block_size, payload_read_error,
 *         payload_size_mismatch, or the sink's error
 */
[[nodiscard]] auto stream_signed_chunks(chunk_signature_chain& chain,
                                        std::istream& payload,
                                        uint64_t payload_size,
                                        std::size_t block_size,
                                        const chunk_sink& sink) -> result<uint64_t>;

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_SIGNING_CHUNK_SIGNATURE_CHAIN_H

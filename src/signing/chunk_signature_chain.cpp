/**
 * @file chunk_signature_chain.cpp
 * @brief Chained chunk signatures for aws-chunked streaming uploads
 * @version 0.1.0
 */

#include "kcenon/aws_signer/signing/chunk_signature_chain.h"

#include "kcenon/aws_signer/core/logging.h"
#include "kcenon/aws_signer/signing/sigv4_utils.h"

#include <algorithm>
#include <sstream>

namespace kcenon::aws_signer {

namespace {

constexpr std::size_t signature_hex_length = 64;
constexpr std::string_view chunk_extension_prefix = "chunk-signature=";
constexpr std::string_view crlf = "\r\n";

auto hex_digits(uint64_t value) -> uint64_t {
    uint64_t digits = 1;
    while (value >= 16) {
        value /= 16;
        ++digits;
    }
    return digits;
}

auto framed_chunk_length(uint64_t data_size) -> uint64_t {
    return hex_digits(data_size) + 1 + chunk_extension_prefix.size() +
           signature_hex_length + crlf.size() + data_size + crlf.size();
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

auto validate_block_size(std::size_t block_size) -> result<void> {
    if (block_size <= minimum_block_size) {
        return unexpected{error{error_code::invalid_block_size,
            "block size must be greater than " + std::to_string(minimum_block_size) +
            " bytes, got " + std::to_string(block_size)}};
    }
    return {};
}

auto chunk_extension(std::string_view signature_hex) -> std::string {
    return std::string(chunk_extension_prefix) + std::string(signature_hex);
}

auto aws_chunked_encoded_length(uint64_t payload_size,
                                std::size_t block_size) -> uint64_t {
    if (block_size == 0) {
        return 0;
    }
    uint64_t full_chunks = payload_size / block_size;
    uint64_t tail = payload_size % block_size;

    uint64_t length = full_chunks * framed_chunk_length(block_size);
    if (tail > 0) {
        length += framed_chunk_length(tail);
    }
    return length + framed_chunk_length(0);
}

// ============================================================================
// signable_chunk
// ============================================================================

auto signable_chunk::string_to_sign() const -> std::string {
    signing_scope scope{date_stamp, region, service};
    std::ostringstream oss;
    oss << chunk_signing_algorithm << '\n'
        << date_stamp << 'T' << time_stamp_utc << '\n'
        << scope.to_string() << '\n'
        << previous_signature_hex << '\n'
        << sigv4_utils::empty_payload_hash() << '\n'
        << chunk_payload_hash;
    return oss.str();
}

// ============================================================================
// chunk_signature_chain
// ============================================================================

auto chunk_signature_chain::start(const signable_request& seed_request,
                                  std::vector<uint8_t> signing_key)
    -> result<chunk_signature_chain> {
    if (!seed_request.request.is_streaming()) {
        return unexpected{error{error_code::invalid_payload_hash,
            "chunk signing requires payload hash " +
            std::string(streaming_payload_sentinel)}};
    }

    auto seed = sign(seed_request, signing_key);

    chunk_signature_chain chain;
    chain.date_stamp_ = seed_request.date_stamp;
    chain.time_stamp_utc_ = seed_request.time_stamp_utc;
    chain.region_ = seed_request.region;
    chain.service_ = seed_request.service;
    chain.signing_key_ = std::move(signing_key);
    chain.seed_signature_ = seed.signature_hex();
    chain.seed_string_to_sign_ = std::move(seed.string_to_sign);
    chain.previous_signature_ = chain.seed_signature_;
    return chain;
}

auto chunk_signature_chain::sign_chunk(std::span<const std::byte> data) -> result<std::string> {
    return sign_chunk_hash(sigv4_utils::bytes_to_hex(sigv4_utils::sha256_bytes(data)),
                           data.empty());
}

auto chunk_signature_chain::sign_chunk_hash(std::string_view chunk_hash_hex,
                                            bool final_chunk) -> result<std::string> {
    if (finished_) {
        return unexpected{error{error_code::chain_finished}};
    }

    signable_chunk chunk{date_stamp_, time_stamp_utc_, region_, service_,
                         previous_signature_, std::string(chunk_hash_hex)};
    auto signature = sigv4_utils::bytes_to_hex(
        sigv4_utils::hmac_sha256(signing_key_, chunk.string_to_sign()));

    previous_signature_ = signature;
    ++chunks_signed_;
    if (final_chunk) {
        finished_ = true;
    }
    return signature;
}

auto chunk_signature_chain::finish() -> result<std::string> {
    return sign_chunk_hash(sigv4_utils::empty_payload_hash(), true);
}

// ============================================================================
// Streaming
// ============================================================================

auto stream_signed_chunks(chunk_signature_chain& chain,
                          std::istream& payload,
                          uint64_t payload_size,
                          std::size_t block_size,
                          const chunk_sink& sink) -> result<uint64_t> {
    if (auto valid = validate_block_size(block_size); !valid) {
        return unexpected{valid.error()};
    }

    std::vector<std::byte> buffer(block_size);
    uint64_t remaining = payload_size;
    uint64_t delivered = 0;

    while (remaining > 0) {
        auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, block_size));
        payload.read(reinterpret_cast<char*>(buffer.data()),
                     static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(payload.gcount());

        if (payload.bad()) {
            return unexpected{error{error_code::payload_read_error,
                "payload stream failed after " + std::to_string(delivered) + " bytes"}};
        }
        if (got != want) {
            return unexpected{error{error_code::payload_size_mismatch,
                "payload ended after " + std::to_string(delivered + got) +
                " of " + std::to_string(payload_size) + " bytes"}};
        }

        std::span<const std::byte> data(buffer.data(), got);
        auto signature = chain.sign_chunk(data);
        if (!signature) {
            return unexpected{signature.error()};
        }

        if (auto sent = sink(data, chunk_extension(signature.value())); !sent) {
            return unexpected{sent.error()};
        }

        remaining -= got;
        delivered += got;

        if (get_logger().is_enabled(log_level::trace)) {
            request_log_context ctx;
            ctx.chunk_index = chain.chunks_signed() - 1;
            ctx.bytes_sent = delivered;
            AWS_LOG_CTX(log_level::trace, log_category::stream, "Chunk sent", ctx);
        }
    }

    auto final_signature = chain.finish();
    if (!final_signature) {
        return unexpected{final_signature.error()};
    }
    if (auto sent = sink({}, chunk_extension(final_signature.value())); !sent) {
        return unexpected{sent.error()};
    }

    AWS_LOG_DEBUG(log_category::stream,
                  "Streamed " + std::to_string(delivered) + " bytes in " +
                  std::to_string(chain.chunks_signed()) + " signed chunks");
    return delivered;
}

}  // namespace kcenon::aws_signer

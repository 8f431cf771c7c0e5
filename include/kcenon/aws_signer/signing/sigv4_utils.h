/**
 * @file sigv4_utils.h
 * @brief Hashing, encoding and time helpers shared by the SigV4 signer
 * @version 0.1.0
 *
 * This file provides the primitive building blocks used by canonical request
 * construction, key derivation, chunk signing and error body probing.
 */

#ifndef KCENON_AWS_SIGNER_SIGNING_SIGV4_UTILS_H
#define KCENON_AWS_SIGNER_SIGNING_SIGV4_UTILS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::aws_signer::sigv4_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to hexadecimal string
 * @param bytes Vector of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string, percent escapes in upper case
 */
auto url_encode(std::string_view value, bool encode_slash = true) -> std::string;

/**
 * @brief Lowercase ASCII letters of a string
 */
auto to_lower(std::string_view value) -> std::string;

/**
 * @brief Case-insensitive ASCII comparison
 */
auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief SHA256 hash function
 * @param data String to hash
 * @return SHA256 hash bytes (32 bytes)
 */
auto sha256(std::string_view data) -> std::vector<uint8_t>;

/**
 * @brief SHA256 hash of bytes
 * @param data Span of bytes to hash
 * @return SHA256 hash bytes (32 bytes)
 */
auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t>;

/**
 * @brief Lowercase hex SHA256 of a string
 */
auto sha256_hex(std::string_view data) -> std::string;

/**
 * @brief Lowercase hex SHA256 of the empty string
 */
auto empty_payload_hash() -> const std::string&;

/**
 * @brief HMAC-SHA256
 * @param key Key bytes
 * @param data Data to sign
 * @return HMAC-SHA256 result (32 bytes)
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 std::string_view data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256 with string key
 * @param key Key string
 * @param data Data to sign
 * @return HMAC-SHA256 result (32 bytes)
 */
auto hmac_sha256(std::string_view key,
                 std::string_view data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a time point as an ISO 8601 basic timestamp (YYYYMMDD'T'HHMMSS'Z')
 */
auto format_iso8601_time(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Get current UTC time as ISO 8601 string (YYYYMMDD'T'HHMMSS'Z')
 * @return ISO 8601 formatted timestamp
 */
auto get_iso8601_time() -> std::string;

/**
 * @brief Check that a string has the exact YYYYMMDD'T'HHMMSS'Z' shape
 */
auto is_iso8601_basic(std::string_view timestamp) -> bool;

// ============================================================================
// Error Body Probing
// ============================================================================

/**
 * @brief Extract XML element value
 * @param xml XML string to parse
 * @param tag Tag name to extract
 * @return Element value if found, nullopt otherwise
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Extract JSON string value (simple parser for known structure)
 * @param json JSON string to parse
 * @param key Key to extract
 * @return Value if found, nullopt otherwise
 */
auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string>;

}  // namespace kcenon::aws_signer::sigv4_utils

#endif  // KCENON_AWS_SIGNER_SIGNING_SIGV4_UTILS_H

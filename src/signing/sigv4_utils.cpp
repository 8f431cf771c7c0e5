/**
 * @file sigv4_utils.cpp
 * @brief Hashing, encoding and time helpers shared by the SigV4 signer
 * @version 0.1.0
 */

#include "kcenon/aws_signer/signing/sigv4_utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace kcenon::aws_signer::sigv4_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

auto url_encode(std::string_view value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto to_lower(std::string_view value) -> std::string {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(std::string_view data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
}

auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
}

auto sha256_hex(std::string_view data) -> std::string {
    return bytes_to_hex(sha256(data));
}

auto empty_payload_hash() -> const std::string& {
    static const std::string hash = sha256_hex("");
    return hash;
}

auto hmac_sha256(const std::vector<uint8_t>& key,
                 std::string_view data) -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

auto hmac_sha256(std::string_view key,
                 std::string_view data) -> std::vector<uint8_t> {
    std::vector<uint8_t> key_bytes(key.begin(), key.end());
    return hmac_sha256(key_bytes, data);
}

// ============================================================================
// Time Utilities
// ============================================================================

auto format_iso8601_time(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

auto get_iso8601_time() -> std::string {
    return format_iso8601_time(std::chrono::system_clock::now());
}

auto is_iso8601_basic(std::string_view timestamp) -> bool {
    if (timestamp.size() != 16 || timestamp[8] != 'T' || timestamp[15] != 'Z') {
        return false;
    }
    for (std::size_t i = 0; i < 15; ++i) {
        if (i == 8) continue;
        if (!std::isdigit(static_cast<unsigned char>(timestamp[i]))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Error Body Probing
// ============================================================================

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return xml.substr(start_pos, end_pos - start_pos);
}

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find(':', pos + search.length());
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    // Skip whitespace
    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        std::string value;
        auto end_pos = pos + 1;
        while (end_pos < json.size() && json[end_pos] != '"') {
            if (json[end_pos] == '\\' && end_pos + 1 < json.size()) {
                ++end_pos;
            }
            value += json[end_pos];
            ++end_pos;
        }
        if (end_pos >= json.size()) {
            return std::nullopt;
        }
        return value;
    }

    // Non-string value: number, literal or nested structure
    auto end_pos = json.find_first_of(",}\n", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    return json.substr(pos, end_pos - pos);
}

}  // namespace kcenon::aws_signer::sigv4_utils

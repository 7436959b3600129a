/**
 * @file encoding.h
 * @brief Hex and Base64 codecs for binary identifiers and payloads
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "utils/sha256.h"

namespace memex::utils {

/**
 * @brief Encode bytes as lowercase hex
 */
std::string HexEncode(std::string_view bytes);

/**
 * @brief Encode a digest as lowercase hex (64 characters)
 */
std::string HexEncode(const Digest& digest);

/**
 * @brief Decode a hex string (either case)
 * @return Decoded bytes, or std::nullopt if the length is odd or a character is not a hex digit
 */
std::optional<std::string> HexDecode(std::string_view hex);

/**
 * @brief Check whether a string is exactly one hex-encoded SHA-256 digest
 */
bool IsHexDigest(std::string_view str);

/**
 * @brief Encode bytes as standard Base64 with padding (RFC 4648)
 */
std::string Base64Encode(std::string_view bytes);

/**
 * @brief Decode standard Base64 with padding
 * @return Decoded bytes, or std::nullopt on malformed input
 */
std::optional<std::string> Base64Decode(std::string_view encoded);

}  // namespace memex::utils

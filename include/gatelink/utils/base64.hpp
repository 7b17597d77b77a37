/**
 * @file base64.hpp
 * @brief Base64 (RFC 4648 §4) and base64url (§5) codecs.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/utils/export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace utils {

/// Standard alphabet with '=' padding, no line wrapping.
GATELINK_UTILS_API std::string base64Encode(const uint8_t* data, size_t length);
GATELINK_UTILS_API std::string base64Encode(const std::vector<uint8_t>& data);

/// URL-safe alphabet, padding stripped.
GATELINK_UTILS_API std::string base64UrlEncode(const uint8_t* data, size_t length);
GATELINK_UTILS_API std::string base64UrlEncode(const std::vector<uint8_t>& data);

/**
 * @brief Decode standard base64. Padding is required; whitespace is rejected.
 * @return Decoded bytes, or nullopt on any malformed input.
 */
GATELINK_UTILS_API std::optional<std::vector<uint8_t>> base64Decode(const std::string& text);

/**
 * @brief Decode base64url with or without padding.
 * @return Decoded bytes, or nullopt on any malformed input.
 */
GATELINK_UTILS_API std::optional<std::vector<uint8_t>> base64UrlDecode(const std::string& text);

}  // namespace utils
}  // namespace gatelink

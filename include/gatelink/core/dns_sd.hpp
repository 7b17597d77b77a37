/**
 * @file dns_sd.hpp
 * @brief DNS-SD name and TXT record decoding.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace core {

/**
 * @brief Decode DNS label escapes: "\DDD" (decimal byte) and "\c" (literal c).
 *
 * Malformed escapes are kept verbatim.
 * "Living\032Room" -> "Living Room", "a\.b" -> "a.b".
 */
GATELINK_CORE_API std::string unescapeLabel(const std::string& escaped);

/// True when @p bytes is well-formed UTF-8 (no overlongs, no surrogates).
GATELINK_CORE_API bool isValidUtf8(const std::string& bytes);

/**
 * @brief Decode one TXT character-string.
 *
 * Valid UTF-8 is returned as-is; anything else is read as Latin-1 and
 * re-encoded, so the result is always valid UTF-8.
 */
GATELINK_CORE_API std::string decodeTxtString(const std::string& raw);

/**
 * @brief Value of "key=value" in a TXT record.
 *
 * Each segment is decoded and trimmed; the first segment starting with
 * "key=" wins. Empty values count as absent.
 */
GATELINK_CORE_API std::optional<std::string> txtValue(const std::vector<std::string>& segments,
                                                      const std::string& key);

/// txtValue parsed as a decimal int.
GATELINK_CORE_API std::optional<int> txtInt(const std::vector<std::string>& segments,
                                            const std::string& key);

/// txtValue in {1, true, yes} (case-insensitive).
GATELINK_CORE_API bool txtBool(const std::vector<std::string>& segments,
                               const std::string& key);

/**
 * @brief Instance label of a service instance FQDN, unescaped and normalized.
 *
 * "Office\032GW._openclaw-gw._tcp.example.com." with service type
 * "_openclaw-gw._tcp." and domain "example.com." gives "Office GW".
 */
GATELINK_CORE_API std::string instanceNameFromFqdn(const std::string& fqdn,
                                                   const std::string& serviceType,
                                                   const std::string& domain);

}  // namespace core
}  // namespace gatelink

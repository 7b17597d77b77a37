/**
 * @file string_utils.hpp
 * @brief String helpers shared by discovery and the token store.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/utils/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace utils {

/// Strip leading and trailing ASCII whitespace.
GATELINK_UTILS_API std::string trim(const std::string& s);

/// ASCII lower-case copy.
GATELINK_UTILS_API std::string toLower(const std::string& s);

/// Trim and collapse every internal whitespace run to a single space.
GATELINK_UTILS_API std::string collapseWhitespace(const std::string& s);

/// ASCII case-insensitive ordering (a < b).
GATELINK_UTILS_API bool lessIgnoreCase(const std::string& a, const std::string& b);

/**
 * @brief Split on a delimiter, producing at most @p limit fields.
 *
 * The last field keeps any remaining delimiters. A limit of 0 means no limit.
 * "a:b:c" split with limit 2 yields {"a", "b:c"}.
 */
GATELINK_UTILS_API std::vector<std::string> splitLimit(const std::string& s,
                                                       char delimiter,
                                                       size_t limit);

/// Strict decimal parse of a signed 64-bit integer (no sign-less garbage, no overflow).
GATELINK_UTILS_API std::optional<int64_t> parseInt64(const std::string& s);

/// Strict decimal parse of an int (surrounding whitespace allowed).
GATELINK_UTILS_API std::optional<int> parseInt(const std::string& s);

/// True when @p s ends with @p suffix.
GATELINK_UTILS_API bool endsWith(const std::string& s, const std::string& suffix);

/// Lower-case hex encoding.
GATELINK_UTILS_API std::string toHex(const unsigned char* data, size_t length);

}  // namespace utils
}  // namespace gatelink

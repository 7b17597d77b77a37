/**
 * @file private_file.hpp
 * @brief Owner-only file helpers for key and token persistence.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/security/export.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace gatelink {
namespace security {

/**
 * @brief Create @p dir (and parents) with owner-only permissions.
 * @return False when the directory cannot be created.
 */
GATELINK_SECURITY_API bool ensurePrivateDirectory(const std::filesystem::path& dir);

/**
 * @brief Replace @p path atomically with @p contents, mode 0600.
 *
 * Writes a temporary file beside the target and renames it over.
 * @return False on any I/O error; the previous contents are left intact.
 */
GATELINK_SECURITY_API bool writePrivateFile(const std::filesystem::path& path,
                                            const std::string& contents);

/// Whole-file read. nullopt when the file is missing or unreadable.
GATELINK_SECURITY_API std::optional<std::string> readPrivateFile(const std::filesystem::path& path);

}  // namespace security
}  // namespace gatelink

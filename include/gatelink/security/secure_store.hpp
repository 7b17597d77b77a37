/**
 * @file secure_store.hpp
 * @brief Key-value storage for sealed token records.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/security/export.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace gatelink {
namespace security {

/**
 * @class SecureStore
 * @brief String key to string value storage.
 *
 * Values are already sealed by the caller; the store only has to keep
 * them private to the current user.
 */
class GATELINK_SECURITY_API SecureStore {
public:
    virtual ~SecureStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    /// @return False when the value could not be persisted.
    virtual bool put(const std::string& key, const std::string& value) = 0;

    /// @return False when an existing value could not be removed.
    virtual bool remove(const std::string& key) = 0;
};

/**
 * @class FileSecureStore
 * @brief One 0600 file per key inside a private directory.
 *
 * Keys are limited to [A-Za-z0-9._-], at most 128 characters, and may
 * not be "." or "..".
 */
class GATELINK_SECURITY_API FileSecureStore : public SecureStore {
public:
    explicit FileSecureStore(std::filesystem::path directory);

    std::optional<std::string> get(const std::string& key) override;
    bool put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    const std::filesystem::path& directory() const { return directory_; }

    static bool isValidKey(const std::string& key);

private:
    std::filesystem::path directory_;
};

/**
 * @class InMemorySecureStore
 * @brief Process-local store, used by tests.
 */
class GATELINK_SECURITY_API InMemorySecureStore : public SecureStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    bool put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

}  // namespace security
}  // namespace gatelink

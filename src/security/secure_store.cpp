/**
 * @file secure_store.cpp
 * @brief File-backed and in-memory SecureStore.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/security/secure_store.hpp"
#include "gatelink/security/private_file.hpp"
#include "gatelink/utils/logger.hpp"

#include <system_error>

namespace gatelink {
namespace security {

namespace fs = std::filesystem;

// =============================================================================
// FileSecureStore
// =============================================================================

FileSecureStore::FileSecureStore(fs::path directory)
    : directory_(std::move(directory))
{
}

bool FileSecureStore::isValidKey(const std::string& key) {
    if (key.empty() || key.size() > 128 || key == "." || key == "..") {
        return false;
    }
    for (char c : key) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> FileSecureStore::get(const std::string& key) {
    if (!isValidKey(key)) {
        return std::nullopt;
    }
    return readPrivateFile(directory_ / key);
}

bool FileSecureStore::put(const std::string& key, const std::string& value) {
    if (!isValidKey(key)) {
        LOG_WARN("Security", "Rejected invalid store key");
        return false;
    }
    if (!ensurePrivateDirectory(directory_)) {
        return false;
    }
    return writePrivateFile(directory_ / key, value);
}

bool FileSecureStore::remove(const std::string& key) {
    if (!isValidKey(key)) {
        return false;
    }
    std::error_code ec;
    fs::remove(directory_ / key, ec);
    if (ec) {
        LOG_DEBUG("Security", "Failed to remove {}: {}", key, ec.message());
        return false;
    }
    return true;
}

// =============================================================================
// InMemorySecureStore
// =============================================================================

std::optional<std::string> InMemorySecureStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySecureStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return true;
}

bool InMemorySecureStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
    return true;
}

size_t InMemorySecureStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

}  // namespace security
}  // namespace gatelink

/**
 * @file key_provider.cpp
 * @brief File-backed and in-memory KeyProvider.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/security/key_provider.hpp"
#include "gatelink/security/private_file.hpp"
#include "gatelink/utils/logger.hpp"

#include <system_error>

namespace gatelink {
namespace security {

namespace fs = std::filesystem;

namespace {

const char* const kBindingLabel = "gatelink-binding";

crypto::Bytes deriveBinding(const crypto::Bytes& aeadKey) {
    crypto::Bytes input = crypto::toBytes(kBindingLabel);
    input.insert(input.end(), aeadKey.begin(), aeadKey.end());
    return crypto::sha256(input);
}

}  // namespace

// =============================================================================
// FileKeyProvider
// =============================================================================

FileKeyProvider::FileKeyProvider(fs::path directory)
    : directory_(std::move(directory))
{
}

crypto::Bytes FileKeyProvider::getOrCreateAeadKey() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (aeadKey_) {
        return *aeadKey_;
    }

    const fs::path path = directory_ / AEAD_KEY_FILE;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto contents = readPrivateFile(path);
        if (!contents || contents->size() != crypto::AES_128_KEY_SIZE) {
            throw CryptoError("unreadable or corrupt AEAD key at " + path.string());
        }
        aeadKey_ = crypto::Bytes(contents->begin(), contents->end());
        LOG_DEBUG("Identity", "Loaded AEAD key from {}", path.string());
        return *aeadKey_;
    }

    crypto::Bytes key = crypto::randomBytes(crypto::AES_128_KEY_SIZE);
    if (!ensurePrivateDirectory(directory_) ||
        !writePrivateFile(path, std::string(key.begin(), key.end()))) {
        throw CryptoError("cannot persist AEAD key to " + path.string());
    }
    LOG_INFO("Identity", "Created AEAD key at {}", path.string());
    aeadKey_ = std::move(key);
    return *aeadKey_;
}

std::shared_ptr<const crypto::Ed25519Key> FileKeyProvider::getOrCreateSigningKeypair() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (signingKey_) {
        return signingKey_;
    }

    const fs::path path = directory_ / IDENTITY_FILE;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto pem = readPrivateFile(path);
        if (!pem) {
            throw CryptoError("cannot read identity key at " + path.string());
        }
        auto key = crypto::Ed25519Key::fromPrivatePem(*pem);
        if (!key) {
            throw CryptoError("identity key at " + path.string() + " is not an Ed25519 private key");
        }
        signingKey_ = std::make_shared<const crypto::Ed25519Key>(std::move(*key));
        LOG_DEBUG("Identity", "Loaded identity key from {}", path.string());
        return signingKey_;
    }

    auto key = crypto::Ed25519Key::generate();
    if (!ensurePrivateDirectory(directory_) || !writePrivateFile(path, key.toPrivatePem())) {
        throw CryptoError("cannot persist identity key to " + path.string());
    }
    LOG_INFO("Identity", "Created identity key at {}", path.string());
    signingKey_ = std::make_shared<const crypto::Ed25519Key>(std::move(key));
    return signingKey_;
}

std::optional<crypto::Bytes> FileKeyProvider::bindingMaterial() {
    try {
        return deriveBinding(getOrCreateAeadKey());
    } catch (const CryptoError& e) {
        LOG_WARN("Identity", "No binding material available: {}", e.what());
        return std::nullopt;
    }
}

// =============================================================================
// InMemoryKeyProvider
// =============================================================================

crypto::Bytes InMemoryKeyProvider::getOrCreateAeadKey() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!aeadKey_) {
        aeadKey_ = crypto::randomBytes(crypto::AES_128_KEY_SIZE);
    }
    return *aeadKey_;
}

std::shared_ptr<const crypto::Ed25519Key> InMemoryKeyProvider::getOrCreateSigningKeypair() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!signingKey_) {
        signingKey_ = std::make_shared<const crypto::Ed25519Key>(crypto::Ed25519Key::generate());
    }
    return signingKey_;
}

std::optional<crypto::Bytes> InMemoryKeyProvider::bindingMaterial() {
    return deriveBinding(getOrCreateAeadKey());
}

}  // namespace security
}  // namespace gatelink

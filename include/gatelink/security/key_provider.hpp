/**
 * @file key_provider.hpp
 * @brief Source of the long-lived device keys.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/security/crypto.hpp"
#include "gatelink/security/export.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace gatelink {
namespace security {

/**
 * @class KeyProvider
 * @brief Creates device keys on first use and returns them thereafter.
 *
 * Implementations throw CryptoError when a key can neither be loaded
 * nor created.
 */
class GATELINK_SECURITY_API KeyProvider {
public:
    virtual ~KeyProvider() = default;

    /// 16-byte AES-128-GCM key for sealing token records.
    virtual crypto::Bytes getOrCreateAeadKey() = 0;

    /// Ed25519 keypair of this device.
    virtual std::shared_ptr<const crypto::Ed25519Key> getOrCreateSigningKeypair() = 0;

    /**
     * @brief Device-bound secret mixed into token integrity keys.
     *
     * Derived from key material that never leaves the provider. nullopt
     * when none is available.
     */
    virtual std::optional<crypto::Bytes> bindingMaterial() = 0;
};

/**
 * @class FileKeyProvider
 * @brief Keys persisted as 0600 files in a private state directory.
 *
 * Files: "aead.key" (raw 16 bytes) and "identity.pem" (PKCS#8 Ed25519).
 * An unreadable or corrupt existing key file is an error; it is never
 * replaced silently.
 */
class GATELINK_SECURITY_API FileKeyProvider : public KeyProvider {
public:
    static constexpr const char* AEAD_KEY_FILE = "aead.key";
    static constexpr const char* IDENTITY_FILE = "identity.pem";

    explicit FileKeyProvider(std::filesystem::path directory);

    crypto::Bytes getOrCreateAeadKey() override;
    std::shared_ptr<const crypto::Ed25519Key> getOrCreateSigningKeypair() override;
    std::optional<crypto::Bytes> bindingMaterial() override;

private:
    std::filesystem::path directory_;
    std::mutex mutex_;
    std::optional<crypto::Bytes> aeadKey_;
    std::shared_ptr<const crypto::Ed25519Key> signingKey_;
};

/**
 * @class InMemoryKeyProvider
 * @brief Keys generated in memory, lost at exit. Used by tests.
 */
class GATELINK_SECURITY_API InMemoryKeyProvider : public KeyProvider {
public:
    InMemoryKeyProvider() = default;

    crypto::Bytes getOrCreateAeadKey() override;
    std::shared_ptr<const crypto::Ed25519Key> getOrCreateSigningKeypair() override;
    std::optional<crypto::Bytes> bindingMaterial() override;

private:
    std::mutex mutex_;
    std::optional<crypto::Bytes> aeadKey_;
    std::shared_ptr<const crypto::Ed25519Key> signingKey_;
};

}  // namespace security
}  // namespace gatelink

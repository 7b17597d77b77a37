/**
 * @file device_identity.hpp
 * @brief Ed25519 device identity and its cached store.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/security/crypto.hpp"
#include "gatelink/security/export.hpp"
#include "gatelink/security/key_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace gatelink {
namespace security {

/**
 * @class IdentityStateError
 * @brief Signing was attempted without a usable private key.
 */
class GATELINK_SECURITY_API IdentityStateError : public std::logic_error {
public:
    explicit IdentityStateError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @class DeviceIdentity
 * @brief Public view of the device keypair plus signing, when available.
 */
class GATELINK_SECURITY_API DeviceIdentity {
public:
    explicit DeviceIdentity(std::shared_ptr<const crypto::Ed25519Key> key);

    /// Lowercase hex SHA-256 of the raw public key.
    const std::string& deviceId() const { return deviceId_; }

    /// Raw 32-byte public key.
    const crypto::Bytes& publicKey() const { return key_->publicKey(); }

    /// Public key, base64url without padding.
    const std::string& publicKeyBase64Url() const { return publicKeyB64_; }

    bool canSign() const { return key_->hasPrivateKey(); }

    /**
     * @brief Sign the UTF-8 bytes of @p payload.
     * @return Signature, base64url without padding.
     * @throws IdentityStateError when no private key is held.
     */
    std::string sign(const std::string& payload) const;

    /// Check a base64url signature of @p payload against this public key.
    bool verify(const std::string& payload, const std::string& signatureBase64Url) const noexcept;

private:
    std::shared_ptr<const crypto::Ed25519Key> key_;
    std::string deviceId_;
    std::string publicKeyB64_;
};

/**
 * @class DeviceIdentityStore
 * @brief Loads the device identity once and caches it.
 */
class GATELINK_SECURITY_API DeviceIdentityStore {
public:
    explicit DeviceIdentityStore(std::shared_ptr<KeyProvider> keys);

    /**
     * @brief The device identity, created by the key provider on first use.
     *
     * Every call returns the same instance, including concurrent first calls.
     * @throws CryptoError when the key provider cannot supply a keypair.
     */
    std::shared_ptr<const DeviceIdentity> loadOrCreate();

    /// @throws IdentityStateError when @p identity is null or cannot sign.
    std::string signPayload(const std::string& payload,
                            const std::shared_ptr<const DeviceIdentity>& identity) const;

    /// False on malformed input or mismatch. Never throws.
    bool verifySelfSignature(const std::string& payload,
                             const std::string& signatureBase64Url,
                             const std::shared_ptr<const DeviceIdentity>& identity) const noexcept;

    /// Empty when @p identity is null.
    std::string publicKeyBase64Url(const std::shared_ptr<const DeviceIdentity>& identity) const;

private:
    std::shared_ptr<KeyProvider> keys_;
    std::mutex mutex_;
    std::shared_ptr<const DeviceIdentity> cached_;
    std::atomic<bool> loaded_{false};
};

}  // namespace security
}  // namespace gatelink

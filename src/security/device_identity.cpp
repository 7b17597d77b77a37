/**
 * @file device_identity.cpp
 * @brief DeviceIdentity and DeviceIdentityStore implementation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/security/device_identity.hpp"
#include "gatelink/utils/base64.hpp"
#include "gatelink/utils/logger.hpp"
#include "gatelink/utils/string_utils.hpp"

namespace gatelink {
namespace security {

// =============================================================================
// DeviceIdentity
// =============================================================================

DeviceIdentity::DeviceIdentity(std::shared_ptr<const crypto::Ed25519Key> key)
    : key_(std::move(key))
{
    if (!key_) {
        throw IdentityStateError("device identity requires a key");
    }
    const crypto::Bytes digest = crypto::sha256(key_->publicKey());
    deviceId_ = utils::toHex(digest.data(), digest.size());
    publicKeyB64_ = utils::base64UrlEncode(key_->publicKey());
}

std::string DeviceIdentity::sign(const std::string& payload) const {
    if (!canSign()) {
        throw IdentityStateError("signer not initialized");
    }
    const crypto::Bytes sig = key_->sign(reinterpret_cast<const uint8_t*>(payload.data()),
                                         payload.size());
    return utils::base64UrlEncode(sig);
}

bool DeviceIdentity::verify(const std::string& payload,
                            const std::string& signatureBase64Url) const noexcept {
    try {
        auto sig = utils::base64UrlDecode(signatureBase64Url);
        if (!sig || sig->size() != crypto::ED25519_SIGNATURE_SIZE) {
            return false;
        }
        return crypto::ed25519Verify(key_->publicKey(),
                                     reinterpret_cast<const uint8_t*>(payload.data()),
                                     payload.size(), *sig);
    } catch (const std::exception& e) {
        LOG_DEBUG("Identity", "Signature verification error: {}", e.what());
        return false;
    }
}

// =============================================================================
// DeviceIdentityStore
// =============================================================================

DeviceIdentityStore::DeviceIdentityStore(std::shared_ptr<KeyProvider> keys)
    : keys_(std::move(keys))
{
}

std::shared_ptr<const DeviceIdentity> DeviceIdentityStore::loadOrCreate() {
    if (loaded_.load(std::memory_order_acquire)) {
        return cached_;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (loaded_.load(std::memory_order_relaxed)) {
        return cached_;
    }
    if (!keys_) {
        throw CryptoError("no key provider");
    }

    auto key = keys_->getOrCreateSigningKeypair();
    if (!key) {
        throw CryptoError("key provider returned no signing key");
    }
    cached_ = std::make_shared<const DeviceIdentity>(std::move(key));
    loaded_.store(true, std::memory_order_release);

    LOG_INFO("Identity", "Device identity ready: {}", cached_->deviceId());
    return cached_;
}

std::string DeviceIdentityStore::signPayload(
    const std::string& payload,
    const std::shared_ptr<const DeviceIdentity>& identity) const {
    if (!identity) {
        throw IdentityStateError("signer not initialized");
    }
    return identity->sign(payload);
}

bool DeviceIdentityStore::verifySelfSignature(
    const std::string& payload,
    const std::string& signatureBase64Url,
    const std::shared_ptr<const DeviceIdentity>& identity) const noexcept {
    if (!identity || signatureBase64Url.empty()) {
        return false;
    }
    return identity->verify(payload, signatureBase64Url);
}

std::string DeviceIdentityStore::publicKeyBase64Url(
    const std::shared_ptr<const DeviceIdentity>& identity) const {
    if (!identity) {
        return std::string();
    }
    return identity->publicKeyBase64Url();
}

}  // namespace security
}  // namespace gatelink

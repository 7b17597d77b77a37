/**
 * @file crypto.hpp
 * @brief OpenSSL-backed primitives used by identity and token storage.
 *
 * Hashing, HMAC, random bytes, AES-128-GCM sealing and Ed25519 keys.
 * Failures throw CryptoError; verification helpers return false instead.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/security/export.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;

namespace gatelink {
namespace security {

/**
 * @class CryptoError
 * @brief A cryptographic operation failed (bad key, bad tag, library error).
 */
class GATELINK_SECURITY_API CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what) : std::runtime_error(what) {}
};

namespace crypto {

using Bytes = std::vector<uint8_t>;

constexpr size_t SHA256_SIZE = 32;
constexpr size_t AES_128_KEY_SIZE = 16;
constexpr size_t GCM_NONCE_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

GATELINK_SECURITY_API Bytes toBytes(const std::string& s);

GATELINK_SECURITY_API Bytes sha256(const uint8_t* data, size_t length);
GATELINK_SECURITY_API Bytes sha256(const Bytes& data);

GATELINK_SECURITY_API Bytes hmacSha256(const Bytes& key, const Bytes& message);

/// Cryptographically secure random bytes.
GATELINK_SECURITY_API Bytes randomBytes(size_t count);

/// Length-checked constant-time comparison.
GATELINK_SECURITY_API bool constantTimeEquals(const Bytes& a, const Bytes& b);
GATELINK_SECURITY_API bool constantTimeEquals(const std::string& a, const std::string& b);

/**
 * @brief AES-128-GCM encrypt under a fresh random nonce.
 * @return nonce (12) || ciphertext || tag (16)
 * @throws CryptoError on a bad key size or library failure.
 */
GATELINK_SECURITY_API Bytes aesGcmSeal(const Bytes& key, const Bytes& aad, const Bytes& plaintext);

/**
 * @brief Reverse of aesGcmSeal.
 * @throws CryptoError when the input is short or authentication fails.
 */
GATELINK_SECURITY_API Bytes aesGcmOpen(const Bytes& key, const Bytes& aad, const Bytes& sealed);

/**
 * @class Ed25519Key
 * @brief Ed25519 key, either a full keypair or a public key only.
 */
class GATELINK_SECURITY_API Ed25519Key {
public:
    /// @throws CryptoError
    static Ed25519Key generate();

    /// Parse a PKCS#8 PEM private key. nullopt if not an Ed25519 key.
    static std::optional<Ed25519Key> fromPrivatePem(const std::string& pem);

    /// Public-key-only instance. nullopt if @p raw is not 32 bytes.
    static std::optional<Ed25519Key> fromPublicKey(const Bytes& raw);

    Ed25519Key(Ed25519Key&&) noexcept = default;
    Ed25519Key& operator=(Ed25519Key&&) noexcept = default;
    ~Ed25519Key();

    bool hasPrivateKey() const { return hasPrivate_; }

    /// Raw 32-byte public key.
    const Bytes& publicKey() const { return publicKey_; }

    /// @throws CryptoError without a private key or on library failure.
    std::string toPrivatePem() const;

    /// @throws CryptoError without a private key or on library failure.
    Bytes sign(const uint8_t* data, size_t length) const;

    bool verify(const uint8_t* data, size_t length, const Bytes& signature) const;

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* p) const;
    };
    using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

    Ed25519Key(PkeyPtr pkey, bool hasPrivate);

    PkeyPtr pkey_;
    bool hasPrivate_ = false;
    Bytes publicKey_;
};

/// Verify a detached Ed25519 signature against a raw public key.
GATELINK_SECURITY_API bool ed25519Verify(const Bytes& publicKey,
                                         const uint8_t* data, size_t length,
                                         const Bytes& signature);

}  // namespace crypto
}  // namespace security
}  // namespace gatelink

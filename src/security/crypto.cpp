/**
 * @file crypto.cpp
 * @brief OpenSSL EVP implementations of the security primitives.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/security/crypto.hpp"

#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>
#include <openssl/rand.h>

#include <algorithm>

namespace gatelink {
namespace security {
namespace crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

}  // namespace

Bytes toBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

Bytes sha256(const uint8_t* data, size_t length) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_MD_CTX_new failed");
    }
    Bytes out(SHA256_SIZE);
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, length) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 ||
        len != SHA256_SIZE) {
        throw CryptoError("SHA-256 failed");
    }
    return out;
}

Bytes sha256(const Bytes& data) {
    return sha256(data.data(), data.size());
}

Bytes hmacSha256(const Bytes& key, const Bytes& message) {
    Bytes out(SHA256_SIZE);
    unsigned int len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             message.data(), message.size(), out.data(), &len) == nullptr ||
        len != SHA256_SIZE) {
        throw CryptoError("HMAC-SHA256 failed");
    }
    return out;
}

Bytes randomBytes(size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw CryptoError("RAND_bytes failed");
    }
    return out;
}

bool constantTimeEquals(const Bytes& a, const Bytes& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return a.empty() || CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return a.empty() || CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// =============================================================================
// AES-128-GCM
// =============================================================================

Bytes aesGcmSeal(const Bytes& key, const Bytes& aad, const Bytes& plaintext) {
    if (key.size() != AES_128_KEY_SIZE) {
        throw CryptoError("AES-128-GCM key must be 16 bytes");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }

    const Bytes nonce = randomBytes(GCM_NONCE_SIZE);
    Bytes out(GCM_NONCE_SIZE + plaintext.size() + GCM_TAG_SIZE);
    std::copy(nonce.begin(), nonce.end(), out.begin());
    uint8_t* cipher = out.data() + GCM_NONCE_SIZE;

    int len = 0;
    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                                   static_cast<int>(GCM_NONCE_SIZE), nullptr) == 1;
    ok = ok && EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) == 1;
    if (ok && !aad.empty()) {
        ok = EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) == 1;
    }
    int written = 0;
    if (ok && !plaintext.empty()) {
        ok = EVP_EncryptUpdate(ctx.get(), cipher, &len, plaintext.data(),
                               static_cast<int>(plaintext.size())) == 1;
        written = len;
    }
    ok = ok && EVP_EncryptFinal_ex(ctx.get(), cipher + written, &len) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                                   cipher + plaintext.size()) == 1;
    if (!ok) {
        throw CryptoError("AES-GCM encryption failed");
    }
    return out;
}

Bytes aesGcmOpen(const Bytes& key, const Bytes& aad, const Bytes& sealed) {
    if (key.size() != AES_128_KEY_SIZE) {
        throw CryptoError("AES-128-GCM key must be 16 bytes");
    }
    if (sealed.size() < GCM_NONCE_SIZE + GCM_TAG_SIZE) {
        throw CryptoError("sealed data too short");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }

    const uint8_t* nonce = sealed.data();
    const uint8_t* cipher = sealed.data() + GCM_NONCE_SIZE;
    const size_t cipherLen = sealed.size() - GCM_NONCE_SIZE - GCM_TAG_SIZE;
    Bytes tag(cipher + cipherLen, cipher + cipherLen + GCM_TAG_SIZE);

    Bytes out(cipherLen);
    int len = 0;
    bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                                   static_cast<int>(GCM_NONCE_SIZE), nullptr) == 1;
    ok = ok && EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) == 1;
    if (ok && !aad.empty()) {
        ok = EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) == 1;
    }
    int written = 0;
    if (ok && cipherLen > 0) {
        ok = EVP_DecryptUpdate(ctx.get(), out.data(), &len, cipher, static_cast<int>(cipherLen)) == 1;
        written = len;
    }
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                                   static_cast<int>(GCM_TAG_SIZE), tag.data()) == 1;
    ok = ok && EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) == 1;
    if (!ok) {
        throw CryptoError("AES-GCM authentication failed");
    }
    return out;
}

// =============================================================================
// Ed25519
// =============================================================================

void Ed25519Key::PkeyDeleter::operator()(EVP_PKEY* p) const {
    EVP_PKEY_free(p);
}

Ed25519Key::Ed25519Key(PkeyPtr pkey, bool hasPrivate)
    : pkey_(std::move(pkey))
    , hasPrivate_(hasPrivate)
    , publicKey_(ED25519_PUBLIC_KEY_SIZE)
{
    size_t len = publicKey_.size();
    if (EVP_PKEY_get_raw_public_key(pkey_.get(), publicKey_.data(), &len) != 1 ||
        len != ED25519_PUBLIC_KEY_SIZE) {
        throw CryptoError("EVP_PKEY_get_raw_public_key failed");
    }
}

Ed25519Key::~Ed25519Key() = default;

Ed25519Key Ed25519Key::generate() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx) {
        throw CryptoError("EVP_PKEY_CTX_new_id(ED25519) failed");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
        throw CryptoError("Ed25519 key generation failed");
    }
    return Ed25519Key(PkeyPtr(raw), true);
}

std::optional<Ed25519Key> Ed25519Key::fromPrivatePem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return std::nullopt;
    }
    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey || EVP_PKEY_id(pkey.get()) != EVP_PKEY_ED25519) {
        return std::nullopt;
    }
    return Ed25519Key(std::move(pkey), true);
}

std::optional<Ed25519Key> Ed25519Key::fromPublicKey(const Bytes& raw) {
    if (raw.size() != ED25519_PUBLIC_KEY_SIZE) {
        return std::nullopt;
    }
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, raw.data(), raw.size()));
    if (!pkey) {
        return std::nullopt;
    }
    return Ed25519Key(std::move(pkey), false);
}

std::string Ed25519Key::toPrivatePem() const {
    if (!hasPrivate_) {
        throw CryptoError("no private key");
    }
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr, nullptr, 0,
                                         nullptr, nullptr) != 1) {
        throw CryptoError("PEM_write_bio_PrivateKey failed");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) {
        throw CryptoError("empty PEM output");
    }
    return std::string(data, static_cast<size_t>(len));
}

Bytes Ed25519Key::sign(const uint8_t* data, size_t length) const {
    if (!hasPrivate_) {
        throw CryptoError("no private key");
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_MD_CTX_new failed");
    }
    Bytes sig(ED25519_SIGNATURE_SIZE);
    size_t sigLen = sig.size();
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1 ||
        EVP_DigestSign(ctx.get(), sig.data(), &sigLen, data, length) != 1 ||
        sigLen != ED25519_SIGNATURE_SIZE) {
        throw CryptoError("Ed25519 signing failed");
    }
    return sig;
}

bool Ed25519Key::verify(const uint8_t* data, size_t length, const Bytes& signature) const {
    if (signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), data, length) == 1;
}

bool ed25519Verify(const Bytes& publicKey, const uint8_t* data, size_t length,
                   const Bytes& signature) {
    auto key = Ed25519Key::fromPublicKey(publicKey);
    if (!key) {
        return false;
    }
    return key->verify(data, length, signature);
}

}  // namespace crypto
}  // namespace security
}  // namespace gatelink

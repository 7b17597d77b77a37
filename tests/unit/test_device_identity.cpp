/**
 * @file test_device_identity.cpp
 * @brief Unit tests for DeviceIdentity, DeviceIdentityStore and key providers
 */

#include <gtest/gtest.h>
#include <gatelink/security/device_identity.hpp>
#include <gatelink/security/key_provider.hpp>
#include <gatelink/utils/base64.hpp>

#include "support/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <thread>
#include <vector>

using namespace gatelink::security;
using gatelink::test::TempDir;
namespace fs = std::filesystem;

// =============================================================================
// DeviceIdentity
// =============================================================================

TEST(DeviceIdentityTest, DeviceIdIsHexDigestOfPublicKey) {
    auto key = std::make_shared<const crypto::Ed25519Key>(crypto::Ed25519Key::generate());
    DeviceIdentity identity(key);

    EXPECT_EQ(identity.deviceId().size(), 64u);
    EXPECT_EQ(identity.deviceId().find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(identity.publicKey(), key->publicKey());

    auto decoded = gatelink::utils::base64UrlDecode(identity.publicKeyBase64Url());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, key->publicKey());
    EXPECT_EQ(identity.publicKeyBase64Url().find('='), std::string::npos);
}

TEST(DeviceIdentityTest, SignAndVerify) {
    DeviceIdentity identity(
        std::make_shared<const crypto::Ed25519Key>(crypto::Ed25519Key::generate()));
    ASSERT_TRUE(identity.canSign());

    const std::string payload = "v1|device|node|operator|1700000000000|nonce-\xC3\xA9";
    const std::string sig = identity.sign(payload);

    EXPECT_EQ(sig.find('='), std::string::npos);
    EXPECT_EQ(sig.find('+'), std::string::npos);
    EXPECT_EQ(sig.find('/'), std::string::npos);
    EXPECT_TRUE(identity.verify(payload, sig));

    EXPECT_FALSE(identity.verify(payload + "x", sig));
    EXPECT_FALSE(identity.verify(payload, "not base64url!"));
    EXPECT_FALSE(identity.verify(payload, ""));
    EXPECT_FALSE(identity.verify(payload, sig.substr(0, sig.size() - 4)));
}

TEST(DeviceIdentityTest, SignatureChecksAgainstPublishedKey) {
    auto full = std::make_shared<const crypto::Ed25519Key>(crypto::Ed25519Key::generate());
    DeviceIdentity signer(full);
    const std::string sig = signer.sign("hello");

    // A public-only identity built from the advertised key accepts it.
    auto published = gatelink::utils::base64UrlDecode(signer.publicKeyBase64Url());
    ASSERT_TRUE(published.has_value());
    auto pub = crypto::Ed25519Key::fromPublicKey(*published);
    ASSERT_TRUE(pub.has_value());
    DeviceIdentity verifier(std::make_shared<const crypto::Ed25519Key>(std::move(*pub)));
    EXPECT_TRUE(verifier.verify("hello", sig));
    EXPECT_FALSE(verifier.verify("hellO", sig));

    auto rawSig = gatelink::utils::base64UrlDecode(sig);
    ASSERT_TRUE(rawSig.has_value());
    const std::string msg = "hello";
    EXPECT_TRUE(crypto::ed25519Verify(*published, reinterpret_cast<const uint8_t*>(msg.data()),
                                      msg.size(), *rawSig));
}

TEST(DeviceIdentityTest, PublicOnlyKeyCannotSign) {
    auto full = crypto::Ed25519Key::generate();
    const std::string sig = DeviceIdentity(
        std::make_shared<const crypto::Ed25519Key>(crypto::Ed25519Key::generate())).sign("x");

    auto pub = crypto::Ed25519Key::fromPublicKey(full.publicKey());
    ASSERT_TRUE(pub.has_value());
    DeviceIdentity identity(std::make_shared<const crypto::Ed25519Key>(std::move(*pub)));

    EXPECT_FALSE(identity.canSign());
    EXPECT_THROW(identity.sign("payload"), IdentityStateError);
    EXPECT_FALSE(identity.verify("x", sig));
}

TEST(DeviceIdentityTest, NullKeyRejected) {
    EXPECT_THROW({ DeviceIdentity identity(nullptr); }, IdentityStateError);
}

// =============================================================================
// DeviceIdentityStore
// =============================================================================

TEST(DeviceIdentityStoreTest, ReturnsSameInstance) {
    DeviceIdentityStore store(std::make_shared<InMemoryKeyProvider>());
    auto a = store.loadOrCreate();
    auto b = store.loadOrCreate();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a.get(), b.get());
}

TEST(DeviceIdentityStoreTest, ConcurrentFirstCallsAgree) {
    DeviceIdentityStore store(std::make_shared<InMemoryKeyProvider>());
    std::vector<std::shared_ptr<const DeviceIdentity>> results(8);
    std::vector<std::thread> threads;

    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&store, &results, i]() {
            results[i] = store.loadOrCreate();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<const DeviceIdentity*> distinct;
    for (const auto& r : results) {
        distinct.insert(r.get());
    }
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_NE(*distinct.begin(), nullptr);
}

TEST(DeviceIdentityStoreTest, SignAndVerifySelf) {
    DeviceIdentityStore store(std::make_shared<InMemoryKeyProvider>());
    auto identity = store.loadOrCreate();

    const std::string sig = store.signPayload("challenge", identity);
    EXPECT_TRUE(store.verifySelfSignature("challenge", sig, identity));
    EXPECT_FALSE(store.verifySelfSignature("challenge2", sig, identity));
    EXPECT_FALSE(store.verifySelfSignature("challenge", "", identity));
    EXPECT_FALSE(store.verifySelfSignature("challenge", sig, nullptr));
}

TEST(DeviceIdentityStoreTest, NullIdentity) {
    DeviceIdentityStore store(std::make_shared<InMemoryKeyProvider>());
    EXPECT_THROW(store.signPayload("x", nullptr), IdentityStateError);
    EXPECT_EQ(store.publicKeyBase64Url(nullptr), "");
}

TEST(DeviceIdentityStoreTest, MissingProvider) {
    DeviceIdentityStore store(nullptr);
    EXPECT_THROW(store.loadOrCreate(), CryptoError);
}

// =============================================================================
// FileKeyProvider
// =============================================================================

TEST(FileKeyProviderTest, IdentityPersistsAcrossInstances) {
    TempDir dir;
    std::string firstId;
    std::string sig;
    {
        DeviceIdentityStore store(std::make_shared<FileKeyProvider>(dir.path()));
        auto identity = store.loadOrCreate();
        firstId = identity->deviceId();
        sig = identity->sign("persisted");
    }

    EXPECT_TRUE(fs::exists(dir.path() / FileKeyProvider::IDENTITY_FILE));

    DeviceIdentityStore reopened(std::make_shared<FileKeyProvider>(dir.path()));
    auto identity = reopened.loadOrCreate();
    EXPECT_EQ(identity->deviceId(), firstId);
    EXPECT_TRUE(reopened.verifySelfSignature("persisted", sig, identity));
}

TEST(FileKeyProviderTest, AeadKeyPersistsAcrossInstances) {
    TempDir dir;
    const crypto::Bytes first = FileKeyProvider(dir.path()).getOrCreateAeadKey();
    EXPECT_EQ(first.size(), crypto::AES_128_KEY_SIZE);

    FileKeyProvider reopened(dir.path());
    EXPECT_EQ(reopened.getOrCreateAeadKey(), first);
    EXPECT_EQ(reopened.bindingMaterial(), FileKeyProvider(dir.path()).bindingMaterial());

    const fs::perms perms = fs::status(dir.path() / FileKeyProvider::AEAD_KEY_FILE).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
}

TEST(FileKeyProviderTest, CorruptKeysAreNotReplaced) {
    TempDir dir;
    {
        std::ofstream(dir.path() / FileKeyProvider::AEAD_KEY_FILE) << "short";
        std::ofstream(dir.path() / FileKeyProvider::IDENTITY_FILE) << "garbage";
    }

    FileKeyProvider provider(dir.path());
    EXPECT_THROW(provider.getOrCreateAeadKey(), CryptoError);
    EXPECT_THROW(provider.getOrCreateSigningKeypair(), CryptoError);
    EXPECT_FALSE(provider.bindingMaterial().has_value());

    std::ifstream in(dir.path() / FileKeyProvider::AEAD_KEY_FILE);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "short");
}

TEST(InMemoryKeyProviderTest, StableWithinInstance) {
    InMemoryKeyProvider provider;
    EXPECT_EQ(provider.getOrCreateAeadKey(), provider.getOrCreateAeadKey());
    EXPECT_EQ(provider.getOrCreateSigningKeypair(), provider.getOrCreateSigningKeypair());
    ASSERT_TRUE(provider.bindingMaterial().has_value());
    EXPECT_EQ(provider.bindingMaterial()->size(), crypto::SHA256_SIZE);

    InMemoryKeyProvider other;
    EXPECT_NE(provider.getOrCreateAeadKey(), other.getOrCreateAeadKey());
}

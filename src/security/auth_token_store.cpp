/**
 * @file auth_token_store.cpp
 * @brief AuthTokenStore implementation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/security/auth_token_store.hpp"
#include "gatelink/utils/base64.hpp"
#include "gatelink/utils/logger.hpp"
#include "gatelink/utils/string_utils.hpp"

namespace gatelink {
namespace security {

namespace {

const char* const kKeySalt = "oc7qK9mP3nL5xR8v";
constexpr size_t kStorageKeyChars = 32;

std::string normalize(const std::string& s) {
    return utils::toLower(utils::trim(s));
}

void append(crypto::Bytes& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

}  // namespace

AuthTokenStore::AuthTokenStore(std::shared_ptr<SecureStore> store,
                               std::shared_ptr<KeyProvider> keys,
                               std::shared_ptr<const utils::Clock> clock)
    : store_(std::move(store))
    , keys_(std::move(keys))
    , clock_(clock ? std::move(clock) : std::make_shared<utils::SystemClock>())
{
}

std::string AuthTokenStore::storageKeyFor(const std::string& deviceId, const std::string& role) {
    crypto::Bytes input;
    append(input, kKeySalt);
    append(input, normalize(deviceId));
    append(input, normalize(role));
    append(input, std::string(deviceId.rbegin(), deviceId.rend()));

    std::string encoded = utils::base64UrlEncode(crypto::sha256(input));
    return std::string(KEY_PREFIX) + encoded.substr(0, kStorageKeyChars);
}

crypto::Bytes AuthTokenStore::integrityKey(const std::string& deviceId, const std::string& role) {
    crypto::Bytes material;
    append(material, kKeySalt);
    append(material, normalize(deviceId));
    append(material, normalize(role));
    if (auto binding = keys_->bindingMaterial()) {
        material.insert(material.end(), binding->begin(), binding->end());
    }
    return crypto::sha256(material);
}

crypto::Bytes AuthTokenStore::integrityMessage(const std::string& token,
                                               const std::string& deviceId,
                                               const std::string& role,
                                               int64_t expiresAtMs) {
    crypto::Bytes message;
    append(message, token);
    append(message, deviceId);
    append(message, role);
    append(message, std::to_string(expiresAtMs));
    return message;
}

bool AuthTokenStore::saveToken(const std::string& deviceId,
                               const std::string& role,
                               const std::string& token) {
    const std::string trimmed = utils::trim(token);
    if (trimmed.empty()) {
        clearToken(deviceId, role);
        return true;
    }

    try {
        const std::string key = storageKeyFor(deviceId, role);
        const int64_t expiresAt = clock_->nowMs() + TOKEN_TTL_MS;

        const crypto::Bytes mac = crypto::hmacSha256(
            integrityKey(deviceId, role), integrityMessage(trimmed, deviceId, role, expiresAt));

        const std::string record = std::string(RECORD_VERSION) + ":" + std::to_string(expiresAt) +
                                   ":" + utils::base64Encode(mac) + ":" + trimmed;

        const crypto::Bytes sealed = crypto::aesGcmSeal(
            keys_->getOrCreateAeadKey(), crypto::toBytes(key), crypto::toBytes(record));

        if (!store_->put(key, utils::base64Encode(sealed))) {
            LOG_ERROR("AuthStore", "Failed to persist token for role '{}'", role);
            return false;
        }
        LOG_DEBUG("AuthStore", "Saved token for role '{}' (expires {})", role, expiresAt);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("AuthStore", "Failed to save token for role '{}': {}", role, e.what());
        return false;
    }
}

std::optional<AuthTokenStore::Record> AuthTokenStore::loadRecord(const std::string& deviceId,
                                                                 const std::string& role) {
    try {
        const std::string key = storageKeyFor(deviceId, role);
        auto stored = store_->get(key);
        if (!stored) {
            return std::nullopt;
        }

        auto sealed = utils::base64Decode(*stored);
        if (!sealed) {
            LOG_WARN("AuthStore", "Discarding undecodable token record");
            return std::nullopt;
        }

        const crypto::Bytes plain =
            crypto::aesGcmOpen(keys_->getOrCreateAeadKey(), crypto::toBytes(key), *sealed);
        const std::vector<std::string> parts =
            utils::splitLimit(std::string(plain.begin(), plain.end()), ':', 4);
        if (parts.size() != 4 || parts[0] != RECORD_VERSION) {
            return std::nullopt;
        }

        auto expiresAt = utils::parseInt64(parts[1]);
        if (!expiresAt || clock_->nowMs() > *expiresAt) {
            return std::nullopt;
        }

        const std::string& token = parts[3];
        if (utils::trim(token).empty()) {
            return std::nullopt;
        }

        auto mac = utils::base64Decode(parts[2]);
        if (!mac) {
            return std::nullopt;
        }
        const crypto::Bytes expected = crypto::hmacSha256(
            integrityKey(deviceId, role), integrityMessage(token, deviceId, role, *expiresAt));
        if (!crypto::constantTimeEquals(*mac, expected)) {
            LOG_WARN("AuthStore", "Token integrity check failed for role '{}'", role);
            return std::nullopt;
        }

        return Record{*expiresAt, token};
    } catch (const std::exception& e) {
        LOG_WARN("AuthStore", "Failed to load token for role '{}': {}", role, e.what());
        return std::nullopt;
    }
}

std::optional<std::string> AuthTokenStore::loadToken(const std::string& deviceId,
                                                     const std::string& role) {
    auto record = loadRecord(deviceId, role);
    if (!record) {
        return std::nullopt;
    }
    return record->token;
}

bool AuthTokenStore::hasValidToken(const std::string& deviceId, const std::string& role) {
    return loadRecord(deviceId, role).has_value();
}

std::optional<int64_t> AuthTokenStore::getTokenExpiration(const std::string& deviceId,
                                                          const std::string& role) {
    auto record = loadRecord(deviceId, role);
    if (!record) {
        return std::nullopt;
    }
    return record->expires_at_ms;
}

void AuthTokenStore::clearToken(const std::string& deviceId, const std::string& role) {
    try {
        if (!store_->remove(storageKeyFor(deviceId, role))) {
            LOG_DEBUG("AuthStore", "Token removal for role '{}' did not complete", role);
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("AuthStore", "Token removal for role '{}' failed: {}", role, e.what());
    }
}

}  // namespace security
}  // namespace gatelink

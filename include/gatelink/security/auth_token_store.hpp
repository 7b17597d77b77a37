/**
 * @file auth_token_store.hpp
 * @brief Sealed, expiring storage of gateway-issued device tokens.
 *
 * Each (deviceId, role) pair maps to one record in a SecureStore. The
 * record is "v2:<expiresAtMs>:<base64 hmac>:<token>", sealed with
 * AES-128-GCM under the provider's AEAD key and bound to its storage key
 * as associated data. Every public operation fails closed: a missing,
 * expired, tampered or undecryptable record reads as absent and no
 * exception escapes.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/security/export.hpp"
#include "gatelink/security/key_provider.hpp"
#include "gatelink/security/secure_store.hpp"
#include "gatelink/utils/clock.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace gatelink {
namespace security {

class GATELINK_SECURITY_API AuthTokenStore {
public:
    static constexpr int64_t TOKEN_TTL_MS = 30LL * 24 * 60 * 60 * 1000;
    static constexpr const char* RECORD_VERSION = "v2";
    static constexpr const char* KEY_PREFIX = "dt.";

    AuthTokenStore(std::shared_ptr<SecureStore> store,
                   std::shared_ptr<KeyProvider> keys,
                   std::shared_ptr<const utils::Clock> clock = nullptr);

    /**
     * @brief Store @p token for (deviceId, role), valid for TOKEN_TTL_MS.
     *
     * The token is trimmed; a blank token clears the entry instead.
     * @return True when the record was written (or cleared).
     */
    bool saveToken(const std::string& deviceId, const std::string& role, const std::string& token);

    /// The stored token when present, unexpired and intact.
    std::optional<std::string> loadToken(const std::string& deviceId, const std::string& role);

    bool hasValidToken(const std::string& deviceId, const std::string& role);

    /// Expiry (epoch ms) of a valid token only.
    std::optional<int64_t> getTokenExpiration(const std::string& deviceId, const std::string& role);

    /// Best effort; failures are logged at debug and otherwise ignored.
    void clearToken(const std::string& deviceId, const std::string& role);

    /// "dt." + 32 characters of base64url SHA-256 over the salted identifiers.
    static std::string storageKeyFor(const std::string& deviceId, const std::string& role);

private:
    struct Record {
        int64_t expires_at_ms;
        std::string token;
    };

    std::optional<Record> loadRecord(const std::string& deviceId, const std::string& role);

    crypto::Bytes integrityKey(const std::string& deviceId, const std::string& role);

    static crypto::Bytes integrityMessage(const std::string& token,
                                          const std::string& deviceId,
                                          const std::string& role,
                                          int64_t expiresAtMs);

    std::shared_ptr<SecureStore> store_;
    std::shared_ptr<KeyProvider> keys_;
    std::shared_ptr<const utils::Clock> clock_;
};

}  // namespace security
}  // namespace gatelink

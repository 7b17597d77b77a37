/**
 * @file gateway_endpoint.hpp
 * @brief Discovered gateway endpoint value and identity helpers.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace core {

/// Domain used for endpoints found by multicast DNS.
constexpr const char* LOCAL_DOMAIN = "local.";

/**
 * @struct GatewayEndpoint
 * @brief A resolved gateway service instance.
 *
 * Endpoints are compared and deduplicated by stable_id only; two sources
 * reporting the same instance produce the same id.
 */
struct GATELINK_CORE_API GatewayEndpoint {
    std::string stable_id;                  ///< "<service-type>|<domain>|<instance>"
    std::string name;                       ///< Display name
    std::string host;                       ///< Resolved address
    int port = 0;                           ///< SRV port, always > 0
    std::optional<std::string> lan_host;    ///< TXT lanHost
    std::optional<std::string> tailnet_dns; ///< TXT tailnetDns
    std::optional<int> gateway_port;        ///< TXT gatewayPort
    std::optional<int> canvas_port;         ///< TXT canvasPort
    bool tls_enabled = false;               ///< TXT gatewayTls
    std::optional<std::string> tls_fingerprint_sha256;  ///< TXT gatewayTlsSha256

    bool operator==(const GatewayEndpoint& other) const;
    bool operator!=(const GatewayEndpoint& other) const { return !(*this == other); }
};

/**
 * @brief Normalize an instance name: trim, collapse whitespace runs to one space.
 */
GATELINK_CORE_API std::string normalizeInstanceName(const std::string& raw);

/**
 * @brief Derive the stable id of an instance.
 * @param serviceType e.g. "_openclaw-gw._tcp."
 * @param domain "local." or the wide-area domain with a trailing dot.
 * @param instanceName Decoded (unescaped) instance name.
 */
GATELINK_CORE_API std::string makeStableId(const std::string& serviceType,
                                           const std::string& domain,
                                           const std::string& instanceName);

/// Ensure a trailing dot ("example.com" -> "example.com.").
GATELINK_CORE_API std::string absoluteDomain(const std::string& domain);

/**
 * @brief Build an endpoint from resolved SRV/address data and TXT segments.
 *
 * The display name is TXT displayName when present, else the instance name.
 */
GATELINK_CORE_API GatewayEndpoint makeEndpoint(const std::string& stableId,
                                               const std::string& instanceName,
                                               const std::string& host,
                                               int port,
                                               const std::vector<std::string>& txt);

/// Sort case-insensitively by name, ties by stable_id.
GATELINK_CORE_API void sortEndpoints(std::vector<GatewayEndpoint>& endpoints);

}  // namespace core
}  // namespace gatelink

/**
 * @file gateway_endpoint.cpp
 * @brief Gateway endpoint helpers.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/core/gateway_endpoint.hpp"
#include "gatelink/core/dns_sd.hpp"
#include "gatelink/utils/string_utils.hpp"

#include <algorithm>

namespace gatelink {
namespace core {

bool GatewayEndpoint::operator==(const GatewayEndpoint& other) const {
    return stable_id == other.stable_id &&
           name == other.name &&
           host == other.host &&
           port == other.port &&
           lan_host == other.lan_host &&
           tailnet_dns == other.tailnet_dns &&
           gateway_port == other.gateway_port &&
           canvas_port == other.canvas_port &&
           tls_enabled == other.tls_enabled &&
           tls_fingerprint_sha256 == other.tls_fingerprint_sha256;
}

std::string normalizeInstanceName(const std::string& raw) {
    return utils::collapseWhitespace(raw);
}

std::string makeStableId(const std::string& serviceType,
                         const std::string& domain,
                         const std::string& instanceName) {
    return serviceType + "|" + domain + "|" + normalizeInstanceName(instanceName);
}

std::string absoluteDomain(const std::string& domain) {
    std::string out = utils::trim(domain);
    if (!out.empty() && out.back() != '.') {
        out.push_back('.');
    }
    return out;
}

GatewayEndpoint makeEndpoint(const std::string& stableId,
                             const std::string& instanceName,
                             const std::string& host,
                             int port,
                             const std::vector<std::string>& txt) {
    GatewayEndpoint ep;
    ep.stable_id = stableId;
    ep.name = unescapeLabel(txtValue(txt, "displayName").value_or(instanceName));
    ep.host = host;
    ep.port = port;
    ep.lan_host = txtValue(txt, "lanHost");
    ep.tailnet_dns = txtValue(txt, "tailnetDns");
    ep.gateway_port = txtInt(txt, "gatewayPort");
    ep.canvas_port = txtInt(txt, "canvasPort");
    ep.tls_enabled = txtBool(txt, "gatewayTls");
    ep.tls_fingerprint_sha256 = txtValue(txt, "gatewayTlsSha256");
    return ep;
}

void sortEndpoints(std::vector<GatewayEndpoint>& endpoints) {
    std::sort(endpoints.begin(), endpoints.end(),
              [](const GatewayEndpoint& a, const GatewayEndpoint& b) {
                  if (utils::lessIgnoreCase(a.name, b.name)) return true;
                  if (utils::lessIgnoreCase(b.name, a.name)) return false;
                  return a.stable_id < b.stable_id;
              });
}

}  // namespace core
}  // namespace gatelink

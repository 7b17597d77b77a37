/**
 * @file network_info.hpp
 * @brief Interface enumeration and nameserver selection.
 *
 * The DNS paths prefer the nameservers of an active VPN/overlay network
 * over those of the default network. Overlay nameservers are not listed in
 * resolv.conf on most hosts, so they are supplied by configuration and
 * promoted to the front whenever an overlay interface is up.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/net/export.hpp"

#include <string>
#include <vector>

namespace gatelink {
namespace net {

/**
 * @struct NetworkInterface
 * @brief One IPv4-configured interface as reported by getifaddrs().
 */
struct GATELINK_NET_API NetworkInterface {
    std::string name;
    std::string address;
    bool up = false;
    bool loopback = false;
    bool pointToPoint = false;

    /// Overlay/VPN by name (tun, tap, wg, tailscale, utun, zt) or by IFF_POINTOPOINT.
    bool isVpn() const;
};

/// True for interface names used by common VPN and overlay drivers.
GATELINK_NET_API bool isVpnInterfaceName(const std::string& name);

/// IPv4 interfaces of this host. Empty on failure.
GATELINK_NET_API std::vector<NetworkInterface> listInterfaces();

/// IPv4 nameservers of the system resolver configuration, in order.
GATELINK_NET_API std::vector<std::string> systemNameservers();

/**
 * @brief Merge nameserver lists, overlay first when a VPN is active.
 *
 * Duplicates are removed keeping the first occurrence. With no active VPN
 * the overlay servers follow the system ones.
 */
GATELINK_NET_API std::vector<std::string> orderNameservers(
    const std::vector<std::string>& system,
    const std::vector<std::string>& overlay,
    bool vpnActive);

/**
 * @class NameserverSource
 * @brief Live view of candidate nameservers for the DNS clients.
 *
 * Every call re-reads the interface table and resolver configuration so that
 * a VPN coming up or going down takes effect on the next query.
 */
class GATELINK_NET_API NameserverSource {
public:
    explicit NameserverSource(std::vector<std::string> overlayServers = {});
    virtual ~NameserverSource() = default;

    virtual bool vpnActive() const;

    virtual std::vector<std::string> candidates() const;

    /// True when overlay servers are configured and a VPN interface is up.
    bool preferOverlay() const { return !overlay_.empty() && vpnActive(); }

    const std::vector<std::string>& overlayServers() const { return overlay_; }

private:
    std::vector<std::string> overlay_;
};

}  // namespace net
}  // namespace gatelink

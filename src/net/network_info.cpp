/**
 * @file network_info.cpp
 * @brief Interface enumeration and nameserver selection.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/net/network_info.hpp"
#include "gatelink/net/platform.hpp"
#include "gatelink/utils/logger.hpp"

#include <algorithm>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>

namespace gatelink {
namespace net {

namespace {

const char* const kVpnPrefixes[] = {"tun", "tap", "wg", "tailscale", "utun", "zt", "ppp"};

void appendUnique(std::vector<std::string>& out, const std::string& server) {
    if (std::find(out.begin(), out.end(), server) == out.end()) {
        out.push_back(server);
    }
}

}  // namespace

bool NetworkInterface::isVpn() const {
    return pointToPoint || isVpnInterfaceName(name);
}

bool isVpnInterfaceName(const std::string& name) {
    for (const char* prefix : kVpnPrefixes) {
        if (name.compare(0, std::strlen(prefix), prefix) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<NetworkInterface> listInterfaces() {
    std::vector<NetworkInterface> result;

    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        LOG_WARN("Network", "getifaddrs failed: {}", std::strerror(errno));
        return result;
    }

    for (struct ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        char buf[INET_ADDRSTRLEN] = {0};
        auto* sin = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
        inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));

        NetworkInterface iface;
        iface.name = it->ifa_name;
        iface.address = buf;
        iface.up = (it->ifa_flags & IFF_UP) && (it->ifa_flags & IFF_RUNNING);
        iface.loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
        iface.pointToPoint = (it->ifa_flags & IFF_POINTOPOINT) != 0;
        result.push_back(std::move(iface));
    }

    freeifaddrs(list);
    return result;
}

std::vector<std::string> systemNameservers() {
    std::vector<std::string> servers;

    struct __res_state state;
    std::memset(&state, 0, sizeof(state));
    if (res_ninit(&state) != 0) {
        LOG_WARN("Network", "res_ninit failed, no system nameservers");
        return servers;
    }

    for (int i = 0; i < state.nscount; ++i) {
        const struct sockaddr_in& sin = state.nsaddr_list[i];
        if (sin.sin_family != AF_INET) {
            continue;
        }
        char buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &sin.sin_addr, buf, sizeof(buf));
        appendUnique(servers, buf);
    }

    res_nclose(&state);
    return servers;
}

std::vector<std::string> orderNameservers(const std::vector<std::string>& system,
                                          const std::vector<std::string>& overlay,
                                          bool vpnActive) {
    std::vector<std::string> out;
    const auto& first = vpnActive ? overlay : system;
    const auto& second = vpnActive ? system : overlay;
    for (const auto& s : first) {
        appendUnique(out, s);
    }
    for (const auto& s : second) {
        appendUnique(out, s);
    }
    return out;
}

NameserverSource::NameserverSource(std::vector<std::string> overlayServers)
    : overlay_(std::move(overlayServers))
{
}

bool NameserverSource::vpnActive() const {
    for (const auto& iface : listInterfaces()) {
        if (iface.up && !iface.loopback && iface.isVpn()) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> NameserverSource::candidates() const {
    return orderNameservers(systemNameservers(), overlay_, vpnActive());
}

}  // namespace net
}  // namespace gatelink

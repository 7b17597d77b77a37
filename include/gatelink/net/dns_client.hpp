/**
 * @file dns_client.hpp
 * @brief Unicast DNS lookup paths used by wide-area discovery.
 *
 * Three implementations share the DnsClient interface:
 * - SystemDnsClient asks the glibc stub resolver (res_nsend).
 * - DirectDnsClient sends one UDP query to every candidate nameserver at
 *   once and takes the first matching reply.
 * - FallbackDnsClient chains the two: system first, direct only when the
 *   system answer lacks the requested type.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/net/dns_message.hpp"
#include "gatelink/net/export.hpp"
#include "gatelink/net/udp_socket.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace net {

class NameserverSource;

/**
 * @class DnsClient
 * @brief A single DNS lookup.
 */
class GATELINK_NET_API DnsClient {
public:
    virtual ~DnsClient() = default;

    /**
     * @brief Look up @p name / @p type (class IN).
     * @return The response (any rcode), or nullopt when no response arrived
     *         within the client's timeout.
     */
    virtual std::optional<DnsMessage> query(const std::string& name, uint16_t type) = 0;
};

/**
 * @class SystemDnsClient
 * @brief Lookup through the system stub resolver.
 *
 * The resolver configuration is re-read on every query. When a nameserver
 * source is supplied its ordering replaces resolv.conf's, so that overlay
 * nameservers are asked first while a VPN is up.
 */
class GATELINK_NET_API SystemDnsClient : public DnsClient {
public:
    explicit SystemDnsClient(int timeoutMs, std::shared_ptr<NameserverSource> servers = nullptr);

    std::optional<DnsMessage> query(const std::string& name, uint16_t type) override;

private:
    int timeoutMs_;
    std::shared_ptr<NameserverSource> servers_;
};

/**
 * @class DirectDnsClient
 * @brief Parallel UDP query to every candidate nameserver.
 *
 * Queries carry an EDNS0 OPT record advertising a 4096-byte payload.
 * Replies are matched on message ID and the QR flag; truncated (TC) replies
 * are discarded. The first reply that answers with the requested type wins;
 * failing that, the first matching reply received before the deadline is
 * returned. IPv6 nameservers are skipped.
 */
class GATELINK_NET_API DirectDnsClient : public DnsClient {
public:
    using ServerList = std::function<std::vector<SocketAddress>()>;

    DirectDnsClient(ServerList servers, int timeoutMs);

    std::optional<DnsMessage> query(const std::string& name, uint16_t type) override;

    /// Candidate nameservers of @p source on port 53.
    static ServerList fromSource(std::shared_ptr<NameserverSource> source);

private:
    ServerList servers_;
    int timeoutMs_;
};

/**
 * @class FallbackDnsClient
 * @brief System path first, direct path when the system answer is empty.
 *
 * Selection for a lookup of type T:
 * - system reply answers with T: system reply
 * - direct reply answers with T: direct reply
 * - otherwise: the system reply, which may be absent. A direct reply
 *   without answers is never returned, so a silent system path stays a
 *   transport failure even when a nameserver answered NXDOMAIN directly.
 */
class GATELINK_NET_API FallbackDnsClient : public DnsClient {
public:
    FallbackDnsClient(std::unique_ptr<DnsClient> system, std::unique_ptr<DnsClient> direct);

    std::optional<DnsMessage> query(const std::string& name, uint16_t type) override;

private:
    std::unique_ptr<DnsClient> system_;
    std::unique_ptr<DnsClient> direct_;
};

}  // namespace net
}  // namespace gatelink

/**
 * @file service_browser.hpp
 * @brief mDNS browse/resolve state for one service type.
 *
 * The browser owns no socket and no thread. It is fed received mDNS
 * messages and the current time, and answers three questions: which
 * endpoints are fully resolved, which follow-up queries are due, and
 * whether anything changed. LocalDiscovery drives it from its listener
 * thread.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/export.hpp"
#include "gatelink/core/gateway_endpoint.hpp"
#include "gatelink/net/dns_message.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace core {

/**
 * @struct BrowseQuery
 * @brief A question the browser wants asked on the multicast group.
 */
struct GATELINK_CORE_API BrowseQuery {
    std::string name;
    uint16_t type;

    bool operator==(const BrowseQuery& other) const {
        return name == other.name && type == other.type;
    }
};

/**
 * @class ServiceBrowser
 * @brief Tracks instances of one service type in the "local." domain.
 *
 * An instance is published only once it has an SRV record with a non-zero
 * port and an address for the SRV target; TXT data is applied when
 * present. Instances that stay unresolved past the resolve timeout are
 * dropped until announced again. A PTR goodbye (TTL 0) or PTR expiry
 * removes the instance and exactly its stable id.
 */
class GATELINK_CORE_API ServiceBrowser {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr std::chrono::milliseconds DEFAULT_RESOLVE_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds QUERY_RETRY_INTERVAL{1000};

    explicit ServiceBrowser(const std::string& serviceType,
                            std::chrono::milliseconds resolveTimeout = DEFAULT_RESOLVE_TIMEOUT);

    /// "<service type>local.", the PTR owner name that is browsed.
    const std::string& browseName() const { return browseName_; }

    /**
     * @brief Apply the records of one received message.
     * @return True when the published endpoint set changed.
     */
    bool handleMessage(const net::DnsMessage& message, TimePoint now);

    /**
     * @brief Expire records and time out pending resolves.
     * @return True when the published endpoint set changed.
     */
    bool tick(TimePoint now);

    /**
     * @brief Follow-up queries for instances with missing data.
     *
     * Each instance is asked about at most once per QUERY_RETRY_INTERVAL.
     */
    std::vector<BrowseQuery> dueQueries(TimePoint now);

    /// Resolved endpoints, sorted.
    std::vector<GatewayEndpoint> endpoints() const;

private:
    struct Expiring {
        TimePoint expires;
    };

    struct SrvEntry : Expiring {
        std::string target;
        uint16_t port = 0;
    };

    struct TxtEntry : Expiring {
        std::vector<std::string> segments;
    };

    struct AddressEntry : Expiring {
        std::string address;
        bool ipv6 = false;
    };

    struct Instance {
        std::string fqdn;
        std::string instanceName;
        std::string stableId;
        TimePoint ptrExpires;
        TimePoint resolveStarted;
        std::optional<TimePoint> lastQuery;
        std::optional<SrvEntry> srv;
        std::optional<TxtEntry> txt;
        bool published = false;
    };

    void applyPtr(const net::DnsRecord& rec, TimePoint now, bool& changed);
    void applySrv(const net::DnsRecord& rec, TimePoint now);
    void applyTxt(const net::DnsRecord& rec, TimePoint now);
    void applyAddress(const net::DnsRecord& rec, TimePoint now);

    bool isReferencedHost(const std::string& canonicalHost) const;
    std::optional<std::string> addressFor(const std::string& host) const;
    bool refreshPublished();
    void removeInstance(std::map<std::string, Instance>::iterator it, bool& changed);

    static TimePoint expiryFor(uint32_t ttl, TimePoint now);

    std::string serviceType_;
    std::string browseName_;
    std::chrono::milliseconds resolveTimeout_;

    std::map<std::string, Instance> instances_;   // by canonical instance fqdn
    std::map<std::string, std::vector<AddressEntry>> hosts_;  // by canonical host
    std::map<std::string, GatewayEndpoint> published_;        // by stable id
};

}  // namespace core
}  // namespace gatelink

/**
 * @file wide_area_resolver.hpp
 * @brief Periodic unicast DNS-SD browse of a configured domain.
 *
 * Each cycle walks PTR -> SRV -> A/AAAA -> TXT for the service type under
 * the domain, reusing records the server already supplied in additional
 * sections before issuing new queries. Cycles are paced by a
 * FailureTracker: transport failures lengthen the delay, any response
 * (including NXDOMAIN) resets it.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/discovery_aggregator.hpp"
#include "gatelink/core/export.hpp"
#include "gatelink/core/failure_tracker.hpp"
#include "gatelink/core/gateway_endpoint.hpp"
#include "gatelink/net/dns_client.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace gatelink {
namespace core {

/**
 * @class DnsTransportError
 * @brief No DNS response arrived on any path.
 */
class GATELINK_CORE_API DnsTransportError : public std::runtime_error {
public:
    explicit DnsTransportError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @struct WideAreaConfig
 * @brief Configuration for the wide-area resolver.
 */
struct GATELINK_CORE_API WideAreaConfig {
    std::string service_type;   ///< e.g. "_openclaw-gw._tcp."
    std::string domain;         ///< e.g. "example.com" (trailing dot optional)
    int64_t backoff_base_ms;    ///< Delay before each cycle while healthy
    int64_t backoff_max_ms;     ///< Delay ceiling
    int backoff_threshold;      ///< Failures at which the ceiling applies

    WideAreaConfig()
        : service_type("_openclaw-gw._tcp.")
        , backoff_base_ms(FailureTracker::DEFAULT_BASE_DELAY_MS)
        , backoff_max_ms(FailureTracker::DEFAULT_MAX_DELAY_MS)
        , backoff_threshold(FailureTracker::DEFAULT_THRESHOLD)
    {}
};

/**
 * @class WideAreaResolver
 * @brief Background loop publishing wide-area endpoints to the aggregator.
 *
 * The loop thread is the only writer of the wide-area set. After stop(),
 * results of a cycle still in flight are discarded.
 */
class GATELINK_CORE_API WideAreaResolver {
public:
    WideAreaResolver(const WideAreaConfig& config,
                     std::shared_ptr<net::DnsClient> dns,
                     DiscoveryAggregator& aggregator);
    ~WideAreaResolver();

    WideAreaResolver(const WideAreaResolver&) = delete;
    WideAreaResolver& operator=(const WideAreaResolver&) = delete;

    /// Launch the loop. A second call while running does nothing.
    void start();

    /// Interrupt the backoff sleep, abandon the current cycle and join.
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Run one cycle and publish its result.
     * @throws DnsTransportError when the PTR lookup got no response.
     */
    void runCycle();

    /**
     * @brief runCycle() plus failure accounting.
     * @return True when the cycle succeeded.
     */
    bool runOnce();

    const FailureTracker& tracker() const { return tracker_; }

    /// "<service type><domain>", the PTR name queried each cycle.
    const std::string& browseName() const { return ptrName_; }

private:
    void loop();
    bool sleepFor(std::chrono::milliseconds duration);
    void publish(std::vector<GatewayEndpoint> endpoints, const WideAreaOutcome& outcome);

    std::optional<std::string> resolveHost(const std::string& target,
                                           const net::DnsMessage& ptrMsg,
                                           const std::optional<net::DnsMessage>& srvMsg);
    std::vector<std::string> resolveTxt(const std::string& instanceFqdn,
                                        const net::DnsMessage& ptrMsg,
                                        const std::optional<net::DnsMessage>& srvMsg);

    static std::optional<std::string> hostFromMessage(const net::DnsMessage& msg,
                                                      const std::string& host);
    static std::vector<std::string> txtFromAdditional(const net::DnsMessage& msg,
                                                      const std::string& instanceFqdn);

    WideAreaConfig config_;
    std::string domain_;
    std::string ptrName_;
    std::shared_ptr<net::DnsClient> dns_;
    DiscoveryAggregator& aggregator_;
    FailureTracker tracker_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::thread loopThread_;
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}  // namespace core
}  // namespace gatelink

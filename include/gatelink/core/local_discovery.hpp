/**
 * @file local_discovery.hpp
 * @brief Multicast DNS browser for gateways on the local link.
 *
 * LocalDiscovery handles:
 * - Joining 224.0.0.251:5353 and retrying socket setup until it works
 * - PTR queries at 1s, 2s, 4s ... capped at 60s
 * - Follow-up SRV/TXT/A queries for unresolved instances
 * - Publishing a fresh snapshot to the aggregator on every change
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/discovery_aggregator.hpp"
#include "gatelink/core/export.hpp"
#include "gatelink/core/service_browser.hpp"
#include "gatelink/net/udp_socket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace gatelink {
namespace core {

/**
 * @struct LocalDiscoveryConfig
 * @brief Configuration for the mDNS listener.
 */
struct GATELINK_CORE_API LocalDiscoveryConfig {
    std::string service_type;       ///< e.g. "_openclaw-gw._tcp."
    std::string mcast_addr;         ///< mDNS group
    uint16_t mcast_port;            ///< mDNS port
    std::string interface_addr;     ///< Local IPv4 of the interface (empty = default)
    int resolve_timeout_ms;         ///< Drop unresolved instances after this
    int initial_query_interval_ms;  ///< First PTR re-query delay
    int max_query_interval_ms;      ///< PTR re-query ceiling
    int setup_retry_ms;             ///< Delay between socket setup attempts
    bool loopback;                  ///< Receive own packets (for testing)

    LocalDiscoveryConfig()
        : service_type("_openclaw-gw._tcp.")
        , mcast_addr("224.0.0.251")
        , mcast_port(5353)
        , resolve_timeout_ms(5000)
        , initial_query_interval_ms(1000)
        , max_query_interval_ms(60000)
        , setup_retry_ms(5000)
        , loopback(false)
    {}
};

/**
 * @class LocalDiscovery
 * @brief Owns the mDNS socket and listener thread.
 *
 * The listener thread is the only writer of the browse state. Errors are
 * logged and never stop the listener.
 *
 * Usage:
 * @code
 * DiscoveryAggregator aggregator(false);
 * LocalDiscovery local(LocalDiscoveryConfig(), aggregator);
 * local.start();
 * ...
 * local.stop();
 * @endcode
 */
class GATELINK_CORE_API LocalDiscovery {
public:
    LocalDiscovery(const LocalDiscoveryConfig& config, DiscoveryAggregator& aggregator);
    ~LocalDiscovery();

    LocalDiscovery(const LocalDiscovery&) = delete;
    LocalDiscovery& operator=(const LocalDiscovery&) = delete;

    /**
     * @brief Launch the listener. A second call while running does nothing.
     */
    void start();

    /**
     * @brief Stop the listener and join it.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

private:
    void listenerLoop();
    bool setupSocket();
    void sendQuery(const std::string& name, uint16_t type);
    bool sleepFor(std::chrono::milliseconds duration);

    LocalDiscoveryConfig config_;
    DiscoveryAggregator& aggregator_;

    std::atomic<bool> running_{false};
    std::thread listenerThread_;
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;

    // Owned by the listener thread.
    std::unique_ptr<net::UdpSocket> socket_;
    ServiceBrowser browser_;
};

}  // namespace core
}  // namespace gatelink

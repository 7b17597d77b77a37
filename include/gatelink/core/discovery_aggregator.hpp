/**
 * @file discovery_aggregator.hpp
 * @brief Merges local and wide-area discovery into one published state.
 *
 * Each source hands over a complete snapshot of its endpoints; the
 * aggregator keeps the latest snapshot per source, merges them, derives the
 * status line and bumps a version counter. Readers either poll state(),
 * register a listener, or block in waitForChange().
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/export.hpp"
#include "gatelink/core/gateway_endpoint.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace core {

/**
 * @struct WideAreaOutcome
 * @brief Result of the latest wide-area cycle.
 */
struct GATELINK_CORE_API WideAreaOutcome {
    bool transport_error = false;   ///< No DNS response on either path
    int rcode = 0;                  ///< Response code when a response arrived
    size_t count = 0;               ///< Endpoints resolved in the cycle

    static WideAreaOutcome transportError() {
        WideAreaOutcome o;
        o.transport_error = true;
        return o;
    }

    static WideAreaOutcome fromRcode(int rcode, size_t count) {
        WideAreaOutcome o;
        o.rcode = rcode;
        o.count = count;
        return o;
    }
};

/**
 * @struct DiscoveryState
 * @brief Immutable view handed to consumers.
 */
struct GATELINK_CORE_API DiscoveryState {
    uint64_t version = 0;
    std::vector<GatewayEndpoint> endpoints;  ///< Merged, deduplicated, sorted
    std::string status;
    size_t local_count = 0;
    size_t wide_area_count = 0;
};

/**
 * @class DiscoveryAggregator
 * @brief Thread-safe merge point for both discovery sources.
 *
 * Usage:
 * @code
 * DiscoveryAggregator aggregator(true);
 * auto id = aggregator.addListener([](const DiscoveryState& s) {
 *     LOG_INFO("Discovery", "{}", s.status);
 * });
 * aggregator.publishLocal(endpoints);
 * @endcode
 */
class GATELINK_CORE_API DiscoveryAggregator {
public:
    using Listener = std::function<void(const DiscoveryState&)>;

    /**
     * @param wideAreaEnabled False when no wide-area domain is configured;
     *        the status then reports "Wide: off".
     */
    explicit DiscoveryAggregator(bool wideAreaEnabled);

    DiscoveryAggregator(const DiscoveryAggregator&) = delete;
    DiscoveryAggregator& operator=(const DiscoveryAggregator&) = delete;

    /// Replace the local snapshot.
    void publishLocal(std::vector<GatewayEndpoint> endpoints);

    /**
     * @brief Replace the wide-area snapshot.
     * @param outcome Result of the cycle; nullopt keeps the previous outcome.
     */
    void publishWideArea(std::vector<GatewayEndpoint> endpoints,
                         std::optional<WideAreaOutcome> outcome);

    DiscoveryState state() const;

    /**
     * @brief Register a change listener.
     *
     * Listeners run on the publishing thread, outside the state lock, one
     * publication at a time. They must not publish themselves.
     * @return Handle for removeListener().
     */
    uint64_t addListener(Listener listener);

    void removeListener(uint64_t id);

    /**
     * @brief Block until the version differs from @p sinceVersion.
     * @return True with @p out filled on change; false on timeout.
     */
    bool waitForChange(uint64_t sinceVersion, std::chrono::milliseconds timeout,
                       DiscoveryState& out);

    /**
     * @brief Status line for the given counts.
     *
     * "Searching…" with nothing local and no wide-area outcome (or wide-area
     * off); the wide part alone with nothing local; otherwise
     * "Local: N • <wide part>".
     */
    static std::string buildStatus(size_t localCount,
                                   bool wideAreaEnabled,
                                   const std::optional<WideAreaOutcome>& outcome);

    /// "Wide: N", "Wide: NXDOMAIN", "Wide: <RCODE>", "Wide: error" or "Wide: off".
    static std::string wideAreaStatus(bool wideAreaEnabled,
                                      const std::optional<WideAreaOutcome>& outcome);

    /// Merge local then wide-area, first stable_id wins, then sort.
    static std::vector<GatewayEndpoint> merge(const std::vector<GatewayEndpoint>& local,
                                              const std::vector<GatewayEndpoint>& wideArea);

private:
    void rebuildLocked();
    void notify();

    const bool wideAreaEnabled_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<GatewayEndpoint> local_;
    std::vector<GatewayEndpoint> wideArea_;
    std::optional<WideAreaOutcome> outcome_;
    DiscoveryState state_;

    // Serializes listener delivery so listeners see versions in order.
    std::mutex notifyMutex_;
    std::mutex listenerMutex_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t nextListenerId_ = 1;
};

}  // namespace core
}  // namespace gatelink

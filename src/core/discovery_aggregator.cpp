/**
 * @file discovery_aggregator.cpp
 * @brief DiscoveryAggregator implementation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/core/discovery_aggregator.hpp"
#include "gatelink/net/dns_message.hpp"
#include "gatelink/utils/logger.hpp"

#include <unordered_set>

namespace gatelink {
namespace core {

namespace {

constexpr const char* kSearching = "Searching\xE2\x80\xA6";
constexpr const char* kBullet = " \xE2\x80\xA2 ";

}  // namespace

DiscoveryAggregator::DiscoveryAggregator(bool wideAreaEnabled)
    : wideAreaEnabled_(wideAreaEnabled)
{
    state_.status = buildStatus(0, wideAreaEnabled_, std::nullopt);
}

void DiscoveryAggregator::publishLocal(std::vector<GatewayEndpoint> endpoints) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local_ = std::move(endpoints);
        rebuildLocked();
    }
    notify();
}

void DiscoveryAggregator::publishWideArea(std::vector<GatewayEndpoint> endpoints,
                                          std::optional<WideAreaOutcome> outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wideArea_ = std::move(endpoints);
        if (outcome) {
            outcome_ = outcome;
        }
        rebuildLocked();
    }
    notify();
}

DiscoveryState DiscoveryAggregator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t DiscoveryAggregator::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    uint64_t id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void DiscoveryAggregator::removeListener(uint64_t id) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.erase(id);
}

bool DiscoveryAggregator::waitForChange(uint64_t sinceVersion,
                                        std::chrono::milliseconds timeout,
                                        DiscoveryState& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!changed_.wait_for(lock, timeout, [&] { return state_.version != sinceVersion; })) {
        return false;
    }
    out = state_;
    return true;
}

std::string DiscoveryAggregator::wideAreaStatus(bool wideAreaEnabled,
                                                const std::optional<WideAreaOutcome>& outcome) {
    if (!wideAreaEnabled) {
        return "Wide: off";
    }
    if (!outcome) {
        return "Wide: ?";
    }
    if (outcome->transport_error) {
        return "Wide: error";
    }
    if (outcome->rcode == ns_r_noerror) {
        return "Wide: " + std::to_string(outcome->count);
    }
    return "Wide: " + net::rcodeToString(outcome->rcode);
}

std::string DiscoveryAggregator::buildStatus(size_t localCount,
                                             bool wideAreaEnabled,
                                             const std::optional<WideAreaOutcome>& outcome) {
    if (localCount == 0 && (!wideAreaEnabled || !outcome)) {
        return kSearching;
    }

    const std::string wide = wideAreaStatus(wideAreaEnabled, outcome);
    if (localCount == 0) {
        return wide;
    }
    return "Local: " + std::to_string(localCount) + kBullet + wide;
}

std::vector<GatewayEndpoint> DiscoveryAggregator::merge(
    const std::vector<GatewayEndpoint>& local,
    const std::vector<GatewayEndpoint>& wideArea) {
    std::vector<GatewayEndpoint> merged;
    merged.reserve(local.size() + wideArea.size());
    std::unordered_set<std::string> seen;

    for (const auto* source : {&local, &wideArea}) {
        for (const auto& ep : *source) {
            if (seen.insert(ep.stable_id).second) {
                merged.push_back(ep);
            }
        }
    }

    sortEndpoints(merged);
    return merged;
}

void DiscoveryAggregator::rebuildLocked() {
    state_.version++;
    state_.endpoints = merge(local_, wideArea_);
    state_.local_count = local_.size();
    state_.wide_area_count = wideArea_.size();
    state_.status = buildStatus(local_.size(), wideAreaEnabled_, outcome_);
    changed_.notify_all();
}

void DiscoveryAggregator::notify() {
    std::lock_guard<std::mutex> notifyLock(notifyMutex_);

    DiscoveryState snapshot = state();
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    LOG_DEBUG("Discovery", "State v{}: {} endpoint(s), status '{}'",
              snapshot.version, snapshot.endpoints.size(), snapshot.status);

    for (const auto& listener : listeners) {
        listener(snapshot);
    }
}

}  // namespace core
}  // namespace gatelink

/**
 * @file wide_area_resolver.cpp
 * @brief WideAreaResolver implementation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/core/wide_area_resolver.hpp"
#include "gatelink/core/dns_sd.hpp"
#include "gatelink/utils/logger.hpp"

#include <map>

namespace gatelink {
namespace core {

WideAreaResolver::WideAreaResolver(const WideAreaConfig& config,
                                   std::shared_ptr<net::DnsClient> dns,
                                   DiscoveryAggregator& aggregator)
    : config_(config)
    , domain_(absoluteDomain(config.domain))
    , ptrName_(config.service_type + absoluteDomain(config.domain))
    , dns_(std::move(dns))
    , aggregator_(aggregator)
    , tracker_(config.backoff_base_ms, config.backoff_max_ms, config.backoff_threshold)
{
    LOG_INFO("WideArea", "Created resolver for {}", ptrName_);
}

WideAreaResolver::~WideAreaResolver() {
    stop();
}

void WideAreaResolver::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("WideArea", "Resolver already running");
        return;
    }

    cancelled_.store(false);
    loopThread_ = std::thread(&WideAreaResolver::loop, this);
    LOG_INFO("WideArea", "Wide-area discovery started for {}", domain_);
}

void WideAreaResolver::stop() {
    cancelled_.store(true);
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("WideArea", "Stopping wide-area discovery...");
    {
        std::lock_guard<std::mutex> lock(sleepMutex_);
    }
    sleepCv_.notify_all();

    if (loopThread_.joinable()) {
        loopThread_.join();
    }
    LOG_INFO("WideArea", "Wide-area discovery stopped");
}

bool WideAreaResolver::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

void WideAreaResolver::loop() {
    LOG_DEBUG("WideArea", "Loop thread started");

    while (running_.load()) {
        const int64_t delayMs = tracker_.backoffDelayMs();
        if (delayMs > tracker_.baseDelayMs()) {
            LOG_DEBUG("WideArea", "DNS backoff active: waiting {}ms before next query", delayMs);
        }
        if (!sleepFor(std::chrono::milliseconds(delayMs))) {
            break;
        }
        runOnce();
    }

    LOG_DEBUG("WideArea", "Loop thread stopped");
}

bool WideAreaResolver::runOnce() {
    try {
        runCycle();
        tracker_.recordSuccess();
        return true;
    } catch (const DnsTransportError& e) {
        tracker_.recordFailure();
        LOG_ERROR("WideArea", "Wide-area discovery failed (consecutiveFailures={}): {}",
                  tracker_.consecutiveFailures(), e.what());
    } catch (const std::exception& e) {
        tracker_.recordFailure();
        LOG_ERROR("WideArea", "Wide-area discovery error (consecutiveFailures={}): {}",
                  tracker_.consecutiveFailures(), e.what());
    }
    return false;
}

void WideAreaResolver::publish(std::vector<GatewayEndpoint> endpoints,
                               const WideAreaOutcome& outcome) {
    if (cancelled_.load()) {
        LOG_DEBUG("WideArea", "Discarding cycle result after stop");
        return;
    }
    aggregator_.publishWideArea(std::move(endpoints), outcome);
}

std::optional<std::string> WideAreaResolver::hostFromMessage(const net::DnsMessage& msg,
                                                             const std::string& host) {
    std::optional<std::string> v6;
    for (const net::DnsRecord* rec : msg.recordsNamed(net::DnsSection::Additional, host)) {
        if (rec->type == ns_t_a) {
            return rec->address;
        }
        if (rec->type == ns_t_aaaa && !v6) {
            v6 = rec->address;
        }
    }
    return v6;
}

std::vector<std::string> WideAreaResolver::txtFromAdditional(const net::DnsMessage& msg,
                                                             const std::string& instanceFqdn) {
    std::vector<std::string> segments;
    for (const net::DnsRecord* rec : msg.recordsNamed(net::DnsSection::Additional, instanceFqdn)) {
        if (rec->type == ns_t_txt) {
            segments.insert(segments.end(), rec->txt.begin(), rec->txt.end());
        }
    }
    return segments;
}

std::optional<std::string> WideAreaResolver::resolveHost(
    const std::string& target,
    const net::DnsMessage& ptrMsg,
    const std::optional<net::DnsMessage>& srvMsg) {
    if (auto host = hostFromMessage(ptrMsg, target)) {
        return host;
    }
    if (srvMsg) {
        if (auto host = hostFromMessage(*srvMsg, target)) {
            return host;
        }
    }

    for (uint16_t type : {ns_t_a, ns_t_aaaa}) {
        if (cancelled_.load()) {
            return std::nullopt;
        }
        auto msg = dns_->query(target, type);
        if (!msg) {
            continue;
        }
        for (const auto& rec : msg->answers) {
            if (rec.type == type && !rec.address.empty()) {
                return rec.address;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> WideAreaResolver::resolveTxt(const std::string& instanceFqdn,
                                                      const net::DnsMessage& ptrMsg,
                                                      const std::optional<net::DnsMessage>& srvMsg) {
    std::vector<std::string> segments = txtFromAdditional(ptrMsg, instanceFqdn);
    if (segments.empty() && srvMsg) {
        segments = txtFromAdditional(*srvMsg, instanceFqdn);
    }
    if (!segments.empty() || cancelled_.load()) {
        return segments;
    }

    auto msg = dns_->query(instanceFqdn, ns_t_txt);
    if (!msg) {
        LOG_WARN("WideArea", "DNS TXT lookup failed for {}", instanceFqdn);
        return segments;
    }
    for (const auto& rec : msg->answers) {
        if (rec.type == ns_t_txt) {
            segments.insert(segments.end(), rec.txt.begin(), rec.txt.end());
        }
    }
    return segments;
}

void WideAreaResolver::runCycle() {
    auto ptrMsg = dns_->query(ptrName_, ns_t_ptr);
    if (!ptrMsg) {
        LOG_WARN("WideArea", "DNS PTR lookup failed for {}", ptrName_);
        publish({}, WideAreaOutcome::transportError());
        throw DnsTransportError("no DNS response for " + ptrName_);
    }

    std::vector<const net::DnsRecord*> ptrs;
    for (const auto& rec : ptrMsg->answers) {
        if (rec.type == ns_t_ptr) {
            ptrs.push_back(&rec);
        }
    }

    if (ptrs.empty() && ptrMsg->rcode != ns_r_noerror) {
        LOG_WARN("WideArea", "DNS PTR lookup returned rcode={} for {}",
                 net::rcodeToString(ptrMsg->rcode), ptrName_);
        publish({}, WideAreaOutcome::fromRcode(ptrMsg->rcode, 0));
        return;
    }

    std::map<std::string, GatewayEndpoint> next;
    for (const net::DnsRecord* ptr : ptrs) {
        if (cancelled_.load()) {
            return;
        }

        const std::string& instanceFqdn = ptr->target;

        std::optional<net::DnsMessage> srvMsg;
        const net::DnsRecord* srv = ptrMsg->findRecord(instanceFqdn, ns_t_srv);
        if (!srv) {
            srvMsg = dns_->query(instanceFqdn, ns_t_srv);
            if (!srvMsg) {
                LOG_WARN("WideArea", "DNS SRV lookup failed for {}", instanceFqdn);
                continue;
            }
            srv = srvMsg->findRecord(instanceFqdn, ns_t_srv);
        }
        if (!srv || srv->srv.port == 0) {
            continue;
        }

        const int port = srv->srv.port;
        const std::string target = srv->srv.target;

        auto host = resolveHost(target, *ptrMsg, srvMsg);
        if (!host) {
            LOG_WARN("WideArea", "Could not resolve host for {}", target);
            continue;
        }

        const std::vector<std::string> txt = resolveTxt(instanceFqdn, *ptrMsg, srvMsg);
        const std::string instanceName = instanceNameFromFqdn(instanceFqdn, config_.service_type, domain_);
        const std::string id = makeStableId(config_.service_type, domain_, instanceName);
        next[id] = makeEndpoint(id, instanceName, *host, port, txt);
    }

    std::vector<GatewayEndpoint> endpoints;
    endpoints.reserve(next.size());
    for (auto& entry : next) {
        endpoints.push_back(std::move(entry.second));
    }

    const int rcode = endpoints.empty() ? ptrMsg->rcode : static_cast<int>(ns_r_noerror);
    if (endpoints.empty()) {
        LOG_DEBUG("WideArea", "wide-area discovery: 0 results for {} (rcode={})",
                  ptrName_, net::rcodeToString(ptrMsg->rcode));
    } else {
        LOG_DEBUG("WideArea", "wide-area discovery: found {} gateway(s) for {}",
                  endpoints.size(), domain_);
    }

    const size_t count = endpoints.size();
    publish(std::move(endpoints), WideAreaOutcome::fromRcode(rcode, count));
}

}  // namespace core
}  // namespace gatelink

/**
 * @file service_browser.cpp
 * @brief mDNS browse/resolve state machine.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/core/service_browser.hpp"
#include "gatelink/core/dns_sd.hpp"
#include "gatelink/utils/logger.hpp"

#include <algorithm>

namespace gatelink {
namespace core {

ServiceBrowser::ServiceBrowser(const std::string& serviceType,
                               std::chrono::milliseconds resolveTimeout)
    : serviceType_(serviceType)
    , browseName_(serviceType + LOCAL_DOMAIN)
    , resolveTimeout_(resolveTimeout)
{
}

ServiceBrowser::TimePoint ServiceBrowser::expiryFor(uint32_t ttl, TimePoint now) {
    return now + std::chrono::seconds(ttl);
}

bool ServiceBrowser::handleMessage(const net::DnsMessage& message, TimePoint now) {
    bool changed = false;

    std::vector<const net::DnsRecord*> records;
    records.reserve(message.answers.size() + message.additional.size());
    for (const auto& rec : message.answers) {
        records.push_back(&rec);
    }
    for (const auto& rec : message.additional) {
        records.push_back(&rec);
    }

    // PTR first so SRV/TXT in the same packet find their instance, and
    // SRV before addresses so the target host is known.
    const std::string browseKey = net::canonicalName(browseName_);
    for (const auto* rec : records) {
        if (rec->type == ns_t_ptr && net::canonicalName(rec->name) == browseKey) {
            applyPtr(*rec, now, changed);
        }
    }
    for (const auto* rec : records) {
        if (rec->type == ns_t_srv) {
            applySrv(*rec, now);
        } else if (rec->type == ns_t_txt) {
            applyTxt(*rec, now);
        }
    }
    for (const auto* rec : records) {
        if (rec->type == ns_t_a || rec->type == ns_t_aaaa) {
            applyAddress(*rec, now);
        }
    }

    if (refreshPublished()) {
        changed = true;
    }
    return changed;
}

void ServiceBrowser::applyPtr(const net::DnsRecord& rec, TimePoint now, bool& changed) {
    const std::string key = net::canonicalName(rec.target);
    auto it = instances_.find(key);

    if (rec.ttl == 0) {
        const std::string name = instanceNameFromFqdn(rec.target, serviceType_, LOCAL_DOMAIN);
        const std::string id = makeStableId(serviceType_, LOCAL_DOMAIN, name);
        LOG_INFO("Discovery", "Service lost: {}", name);
        if (published_.erase(id) > 0) {
            changed = true;
        }
        if (it != instances_.end()) {
            instances_.erase(it);
        }
        return;
    }

    if (it != instances_.end()) {
        it->second.ptrExpires = expiryFor(rec.ttl, now);
        return;
    }

    Instance inst;
    inst.fqdn = rec.target;
    inst.instanceName = instanceNameFromFqdn(rec.target, serviceType_, LOCAL_DOMAIN);
    if (inst.instanceName.empty()) {
        LOG_DEBUG("Discovery", "Ignoring PTR with empty instance name: {}", rec.target);
        return;
    }
    inst.stableId = makeStableId(serviceType_, LOCAL_DOMAIN, inst.instanceName);
    inst.ptrExpires = expiryFor(rec.ttl, now);
    inst.resolveStarted = now;

    LOG_DEBUG("Discovery", "Service found: {}", inst.instanceName);
    instances_.emplace(key, std::move(inst));
}

void ServiceBrowser::applySrv(const net::DnsRecord& rec, TimePoint now) {
    auto it = instances_.find(net::canonicalName(rec.name));
    if (it == instances_.end()) {
        return;
    }
    if (rec.ttl == 0) {
        it->second.srv.reset();
        return;
    }

    SrvEntry srv;
    srv.expires = expiryFor(rec.ttl, now);
    srv.target = rec.srv.target;
    srv.port = rec.srv.port;
    it->second.srv = std::move(srv);
}

void ServiceBrowser::applyTxt(const net::DnsRecord& rec, TimePoint now) {
    auto it = instances_.find(net::canonicalName(rec.name));
    if (it == instances_.end()) {
        return;
    }
    if (rec.ttl == 0) {
        it->second.txt.reset();
        return;
    }

    TxtEntry txt;
    txt.expires = expiryFor(rec.ttl, now);
    txt.segments = rec.txt;
    it->second.txt = std::move(txt);
}

void ServiceBrowser::applyAddress(const net::DnsRecord& rec, TimePoint now) {
    const std::string host = net::canonicalName(rec.name);
    if (!isReferencedHost(host)) {
        return;
    }

    const bool ipv6 = rec.type == ns_t_aaaa;
    auto& entries = hosts_[host];

    if (rec.cacheFlush) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&](const AddressEntry& e) {
                                         return e.ipv6 == ipv6 && e.address != rec.address;
                                     }),
                      entries.end());
    }

    auto existing = std::find_if(entries.begin(), entries.end(),
                                 [&](const AddressEntry& e) { return e.address == rec.address; });
    if (rec.ttl == 0) {
        if (existing != entries.end()) {
            entries.erase(existing);
        }
        return;
    }

    if (existing != entries.end()) {
        existing->expires = expiryFor(rec.ttl, now);
        return;
    }

    AddressEntry entry;
    entry.expires = expiryFor(rec.ttl, now);
    entry.address = rec.address;
    entry.ipv6 = ipv6;
    entries.push_back(std::move(entry));
}

bool ServiceBrowser::isReferencedHost(const std::string& canonicalHost) const {
    for (const auto& entry : instances_) {
        const auto& srv = entry.second.srv;
        if (srv && net::canonicalName(srv->target) == canonicalHost) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> ServiceBrowser::addressFor(const std::string& host) const {
    auto it = hosts_.find(net::canonicalName(host));
    if (it == hosts_.end()) {
        return std::nullopt;
    }

    const AddressEntry* v6 = nullptr;
    for (const auto& entry : it->second) {
        if (!entry.ipv6) {
            return entry.address;
        }
        if (!v6) {
            v6 = &entry;
        }
    }
    if (v6) {
        return v6->address;
    }
    return std::nullopt;
}

bool ServiceBrowser::refreshPublished() {
    bool changed = false;

    for (auto& entry : instances_) {
        Instance& inst = entry.second;
        if (!inst.srv || inst.srv->port == 0) {
            continue;
        }
        auto address = addressFor(inst.srv->target);
        if (!address) {
            continue;
        }

        static const std::vector<std::string> kNoTxt;
        GatewayEndpoint ep = makeEndpoint(inst.stableId, inst.instanceName, *address,
                                          inst.srv->port,
                                          inst.txt ? inst.txt->segments : kNoTxt);

        auto pub = published_.find(inst.stableId);
        if (pub == published_.end()) {
            LOG_INFO("Discovery", "Resolved gateway '{}' at {}:{}", ep.name, ep.host, ep.port);
            published_.emplace(inst.stableId, std::move(ep));
            changed = true;
        } else if (pub->second != ep) {
            LOG_DEBUG("Discovery", "Updated gateway '{}' at {}:{}", ep.name, ep.host, ep.port);
            pub->second = std::move(ep);
            changed = true;
        }
        inst.published = true;
    }
    return changed;
}

void ServiceBrowser::removeInstance(std::map<std::string, Instance>::iterator it, bool& changed) {
    if (published_.erase(it->second.stableId) > 0) {
        changed = true;
    }
    instances_.erase(it);
}

bool ServiceBrowser::tick(TimePoint now) {
    bool changed = false;

    for (auto it = instances_.begin(); it != instances_.end();) {
        Instance& inst = it->second;

        if (now >= inst.ptrExpires) {
            LOG_INFO("Discovery", "Service expired: {}", inst.instanceName);
            auto victim = it++;
            removeInstance(victim, changed);
            continue;
        }

        if (inst.srv && now >= inst.srv->expires) {
            inst.srv.reset();
        }
        if (inst.txt && now >= inst.txt->expires) {
            inst.txt.reset();
        }

        if (!inst.published && now - inst.resolveStarted >= resolveTimeout_) {
            LOG_WARN("Discovery", "Resolve timed out for '{}', dropping until announced again",
                     inst.instanceName);
            it = instances_.erase(it);
            continue;
        }
        ++it;
    }

    for (auto it = hosts_.begin(); it != hosts_.end();) {
        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&](const AddressEntry& e) { return now >= e.expires; }),
                      entries.end());
        if (entries.empty() || !isReferencedHost(it->first)) {
            it = hosts_.erase(it);
        } else {
            ++it;
        }
    }

    if (refreshPublished()) {
        changed = true;
    }
    return changed;
}

std::vector<BrowseQuery> ServiceBrowser::dueQueries(TimePoint now) {
    std::vector<BrowseQuery> queries;

    for (auto& entry : instances_) {
        Instance& inst = entry.second;
        const bool haveAddress = inst.srv && addressFor(inst.srv->target).has_value();
        const bool wantTxt = !inst.txt && !inst.published;
        if (inst.srv && haveAddress && !wantTxt) {
            continue;
        }
        if (inst.lastQuery && now - *inst.lastQuery < QUERY_RETRY_INTERVAL) {
            continue;
        }
        inst.lastQuery = now;

        if (!inst.srv) {
            queries.push_back({inst.fqdn, ns_t_srv});
        } else if (!haveAddress) {
            queries.push_back({inst.srv->target, ns_t_a});
        }
        if (wantTxt) {
            queries.push_back({inst.fqdn, ns_t_txt});
        }
    }
    return queries;
}

std::vector<GatewayEndpoint> ServiceBrowser::endpoints() const {
    std::vector<GatewayEndpoint> out;
    out.reserve(published_.size());
    for (const auto& entry : published_) {
        out.push_back(entry.second);
    }
    sortEndpoints(out);
    return out;
}

}  // namespace core
}  // namespace gatelink

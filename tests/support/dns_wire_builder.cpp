/**
 * @file dns_wire_builder.cpp
 * @brief DnsWireBuilder and ScriptedDnsClient.
 */

#include "support/dns_wire_builder.hpp"

#include <gatelink/core/dns_sd.hpp>
#include <gatelink/net/platform.hpp>

#include <stdexcept>

namespace gatelink {
namespace test {

namespace {

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    put16(out, static_cast<uint16_t>(v >> 16));
    put16(out, static_cast<uint16_t>(v & 0xFFFF));
}

// Resolver output escapes spaces as \032; scripts are written unescaped.
std::string canonicalKey(const std::string& name) {
    return net::canonicalName(core::unescapeLabel(name));
}

}  // namespace

std::vector<uint8_t> encodeName(const std::string& name) {
    uint8_t buf[NS_MAXCDNAME];
    int n = dn_comp(name.c_str(), buf, sizeof(buf), nullptr, nullptr);
    if (n < 0) {
        throw std::runtime_error("cannot encode name: " + name);
    }
    return std::vector<uint8_t>(buf, buf + n);
}

DnsWireBuilder::DnsWireBuilder(uint16_t id, bool response, int rcode)
    : id_(id)
    , response_(response)
    , rcode_(rcode)
{
}

DnsWireBuilder& DnsWireBuilder::question(const std::string& name, uint16_t type) {
    std::vector<uint8_t> q = encodeName(name);
    put16(q, type);
    put16(q, 1);
    questions_.push_back(std::move(q));
    return *this;
}

DnsWireBuilder& DnsWireBuilder::add(net::DnsSection section, const std::string& owner,
                                    uint16_t type, uint32_t ttl, bool cacheFlush,
                                    const std::vector<uint8_t>& rdata) {
    Record rec;
    rec.section = section;
    rec.bytes = encodeName(owner);
    put16(rec.bytes, type);
    put16(rec.bytes, static_cast<uint16_t>(cacheFlush ? 0x8001 : 0x0001));
    put32(rec.bytes, ttl);
    put16(rec.bytes, static_cast<uint16_t>(rdata.size()));
    rec.bytes.insert(rec.bytes.end(), rdata.begin(), rdata.end());
    records_.push_back(std::move(rec));
    return *this;
}

DnsWireBuilder& DnsWireBuilder::ptr(net::DnsSection section, const std::string& owner,
                                    const std::string& target, uint32_t ttl) {
    return add(section, owner, ns_t_ptr, ttl, false, encodeName(target));
}

DnsWireBuilder& DnsWireBuilder::srv(net::DnsSection section, const std::string& owner,
                                    uint16_t port, const std::string& target, uint32_t ttl,
                                    bool cacheFlush) {
    std::vector<uint8_t> rdata;
    put16(rdata, 0);
    put16(rdata, 0);
    put16(rdata, port);
    std::vector<uint8_t> name = encodeName(target);
    rdata.insert(rdata.end(), name.begin(), name.end());
    return add(section, owner, ns_t_srv, ttl, cacheFlush, rdata);
}

DnsWireBuilder& DnsWireBuilder::txt(net::DnsSection section, const std::string& owner,
                                    const std::vector<std::string>& strings, uint32_t ttl,
                                    bool cacheFlush) {
    std::vector<uint8_t> rdata;
    for (const auto& s : strings) {
        rdata.push_back(static_cast<uint8_t>(s.size()));
        rdata.insert(rdata.end(), s.begin(), s.end());
    }
    return add(section, owner, ns_t_txt, ttl, cacheFlush, rdata);
}

DnsWireBuilder& DnsWireBuilder::a(net::DnsSection section, const std::string& owner,
                                  const std::string& ipv4, uint32_t ttl, bool cacheFlush) {
    std::vector<uint8_t> rdata(4);
    if (inet_pton(AF_INET, ipv4.c_str(), rdata.data()) != 1) {
        throw std::runtime_error("bad IPv4 address: " + ipv4);
    }
    return add(section, owner, ns_t_a, ttl, cacheFlush, rdata);
}

DnsWireBuilder& DnsWireBuilder::aaaa(net::DnsSection section, const std::string& owner,
                                     const std::string& ipv6, uint32_t ttl, bool cacheFlush) {
    std::vector<uint8_t> rdata(16);
    if (inet_pton(AF_INET6, ipv6.c_str(), rdata.data()) != 1) {
        throw std::runtime_error("bad IPv6 address: " + ipv6);
    }
    return add(section, owner, ns_t_aaaa, ttl, cacheFlush, rdata);
}

std::vector<uint8_t> DnsWireBuilder::build() const {
    uint16_t counts[3] = {0, 0, 0};
    for (const auto& rec : records_) {
        ++counts[static_cast<int>(rec.section)];
    }

    std::vector<uint8_t> out;
    put16(out, id_);
    uint16_t flags = static_cast<uint16_t>(rcode_ & 0x0F);
    if (response_) {
        flags |= 0x8000;
    }
    put16(out, flags);
    put16(out, static_cast<uint16_t>(questions_.size()));
    put16(out, counts[0]);
    put16(out, counts[1]);
    put16(out, counts[2]);

    for (const auto& q : questions_) {
        out.insert(out.end(), q.begin(), q.end());
    }
    for (net::DnsSection section : {net::DnsSection::Answer, net::DnsSection::Authority,
                                    net::DnsSection::Additional}) {
        for (const auto& rec : records_) {
            if (rec.section == section) {
                out.insert(out.end(), rec.bytes.begin(), rec.bytes.end());
            }
        }
    }
    return out;
}

net::DnsMessage DnsWireBuilder::message() const {
    const std::vector<uint8_t> wire = build();
    auto msg = net::DnsMessage::parse(wire.data(), wire.size());
    if (!msg) {
        throw std::runtime_error("built message does not parse");
    }
    return *msg;
}

// =============================================================================
// ScriptedDnsClient
// =============================================================================

void ScriptedDnsClient::set(const std::string& name, uint16_t type,
                            std::optional<net::DnsMessage> reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_[{canonicalKey(name), type}] = std::move(reply);
}

std::optional<net::DnsMessage> ScriptedDnsClient::query(const std::string& name, uint16_t type) {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_.emplace_back(canonicalKey(name), type);
    auto it = replies_.find({canonicalKey(name), type});
    if (it == replies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<std::string, uint16_t>> ScriptedDnsClient::queries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_;
}

size_t ScriptedDnsClient::queryCount(const std::string& name, uint16_t type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& q : queries_) {
        if (q.first == canonicalKey(name) && q.second == type) {
            ++count;
        }
    }
    return count;
}

}  // namespace test
}  // namespace gatelink

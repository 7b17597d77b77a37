/**
 * @file dns_client.cpp
 * @brief System, direct and fallback DNS lookup paths.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/net/dns_client.hpp"
#include "gatelink/net/network_info.hpp"
#include "gatelink/net/platform.hpp"
#include "gatelink/utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <random>

namespace gatelink {
namespace net {

namespace {

constexpr size_t kMaxMessage = 65535;
constexpr uint16_t kEdnsUdpSize = 4096;

using Clock = std::chrono::steady_clock;

int64_t elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

uint16_t randomQueryId() {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 0xFFFF);
    return static_cast<uint16_t>(dist(gen));
}

/**
 * @brief Owns a resolver state initialized from resolv.conf.
 */
class ResolverState {
public:
    ResolverState() {
        std::memset(&state_, 0, sizeof(state_));
        ok_ = res_ninit(&state_) == 0;
    }

    ~ResolverState() {
        if (ok_) {
            res_nclose(&state_);
        }
    }

    ResolverState(const ResolverState&) = delete;
    ResolverState& operator=(const ResolverState&) = delete;

    bool ok() const { return ok_; }
    res_state get() { return &state_; }

    /// Replace the nameserver list with IPv4 servers on port 53.
    void setNameservers(const std::vector<std::string>& servers) {
        int n = 0;
        for (const auto& ip : servers) {
            if (n >= MAXNS) {
                break;
            }
            struct sockaddr_in sin{};
            if (inet_pton(AF_INET, ip.c_str(), &sin.sin_addr) != 1) {
                continue;
            }
            sin.sin_family = AF_INET;
            sin.sin_port = htons(DNS_PORT);

            // An IPv6 entry in this slot would shadow the IPv4 address.
            if (state_._u._ext.nsaddrs[n] != nullptr) {
                std::free(state_._u._ext.nsaddrs[n]);
                state_._u._ext.nsaddrs[n] = nullptr;
            }
            state_.nsaddr_list[n++] = sin;
        }
        if (n > 0) {
            state_.nscount = n;
        }
    }

private:
    struct __res_state state_;
    bool ok_;
};

bool isIpv4(const std::string& ip) {
    struct in_addr addr{};
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

}  // namespace

// =============================================================================
// SystemDnsClient
// =============================================================================

SystemDnsClient::SystemDnsClient(int timeoutMs, std::shared_ptr<NameserverSource> servers)
    : timeoutMs_(timeoutMs)
    , servers_(std::move(servers))
{
}

std::optional<DnsMessage> SystemDnsClient::query(const std::string& name, uint16_t type) {
    const auto start = Clock::now();

    ResolverState resolver;
    if (!resolver.ok()) {
        LOG_WARN("Dns", "Resolver initialization failed");
        return std::nullopt;
    }

    res_state state = resolver.get();
    state->retrans = std::max(1, timeoutMs_ / 1000);
    state->retry = 1;

    if (servers_ && servers_->preferOverlay()) {
        resolver.setNameservers(servers_->candidates());
    }

    uint8_t queryBuf[NS_PACKETSZ];
    int queryLen = res_nmkquery(state, ns_o_query, name.c_str(), ns_c_in, type,
                                nullptr, 0, nullptr, queryBuf, sizeof(queryBuf));
    if (queryLen < 0) {
        LOG_WARN("Dns", "Failed to build DNS query for {} type={}", name, typeToString(type));
        return std::nullopt;
    }

    std::vector<uint8_t> answer(kMaxMessage);
    int len = res_nsend(state, queryBuf, queryLen, answer.data(), static_cast<int>(answer.size()));
    if (len < 0) {
        LOG_TRACE("Dns", "System DNS query failed: {} type={} after {}ms",
                  name, typeToString(type), elapsedMs(start));
        return std::nullopt;
    }

    auto msg = DnsMessage::parse(answer.data(), std::min(static_cast<size_t>(len), answer.size()));
    if (!msg) {
        LOG_WARN("Dns", "Failed to parse DNS response for {} type={}", name, typeToString(type));
        return std::nullopt;
    }

    LOG_TRACE("Dns", "System DNS {} type={} rcode={} answers={} in {}ms",
              name, typeToString(type), rcodeToString(msg->rcode),
              msg->answers.size(), elapsedMs(start));
    return msg;
}

// =============================================================================
// DirectDnsClient
// =============================================================================

DirectDnsClient::DirectDnsClient(ServerList servers, int timeoutMs)
    : servers_(std::move(servers))
    , timeoutMs_(timeoutMs)
{
}

DirectDnsClient::ServerList DirectDnsClient::fromSource(std::shared_ptr<NameserverSource> source) {
    return [source]() {
        std::vector<SocketAddress> out;
        if (!source) {
            return out;
        }
        for (const auto& ip : source->candidates()) {
            out.emplace_back(ip, DNS_PORT);
        }
        return out;
    };
}

std::optional<DnsMessage> DirectDnsClient::query(const std::string& name, uint16_t type) {
    const auto start = Clock::now();

    std::vector<SocketAddress> servers;
    if (servers_) {
        for (auto& server : servers_()) {
            if (isIpv4(server.ip)) {
                servers.push_back(std::move(server));
            }
        }
    }
    if (servers.empty()) {
        LOG_TRACE("Dns", "No direct nameservers for {} type={}", name, typeToString(type));
        return std::nullopt;
    }

    const uint16_t id = randomQueryId();
    const std::vector<uint8_t> wire = buildQuery(id, name, type, true, false, kEdnsUdpSize);
    if (wire.empty()) {
        LOG_WARN("Dns", "Failed to build DNS query for {} type={}", name, typeToString(type));
        return std::nullopt;
    }

    UdpSocket socket;
    if (!socket.isValid() || !socket.bind(0)) {
        return std::nullopt;
    }

    size_t sent = 0;
    for (const auto& server : servers) {
        if (socket.sendTo(server, wire.data(), wire.size()) > 0) {
            ++sent;
        } else {
            LOG_DEBUG("Dns", "Direct query to {} failed: {}",
                      server.toString(), std::strerror(socket.getLastError()));
        }
    }
    if (sent == 0) {
        return std::nullopt;
    }

    const auto deadline = start + std::chrono::milliseconds(timeoutMs_);
    std::optional<DnsMessage> firstReply;
    size_t replies = 0;
    std::vector<uint8_t> buffer(kMaxMessage);

    while (replies < sent) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        SocketAddress sender;
        int received = socket.receiveFrom(buffer.data(), buffer.size(),
                                          static_cast<int>(remaining), sender);
        if (received < 0) {
            break;
        }
        if (received == 0) {
            continue;
        }
        if (std::find(servers.begin(), servers.end(), sender) == servers.end()) {
            continue;
        }

        auto msg = DnsMessage::parse(buffer.data(), static_cast<size_t>(received));
        if (!msg || !msg->response || msg->id != id) {
            continue;
        }
        ++replies;

        if (msg->truncated) {
            // Records are missing and there is no TCP retry on this path.
            LOG_DEBUG("Dns", "Direct DNS {} type={}: truncated reply from {} ignored",
                      name, typeToString(type), sender.toString());
            continue;
        }
        if (msg->hasAnswerOfType(type)) {
            LOG_TRACE("Dns", "Direct DNS {} type={} answered by {} in {}ms",
                      name, typeToString(type), sender.toString(), elapsedMs(start));
            return msg;
        }
        if (!firstReply) {
            firstReply = std::move(msg);
        }
    }

    LOG_TRACE("Dns", "Direct DNS {} type={} without answers after {}ms ({} replies)",
              name, typeToString(type), elapsedMs(start), replies);
    return firstReply;
}

// =============================================================================
// FallbackDnsClient
// =============================================================================

FallbackDnsClient::FallbackDnsClient(std::unique_ptr<DnsClient> system,
                                     std::unique_ptr<DnsClient> direct)
    : system_(std::move(system))
    , direct_(std::move(direct))
{
}

std::optional<DnsMessage> FallbackDnsClient::query(const std::string& name, uint16_t type) {
    std::optional<DnsMessage> system;
    if (system_) {
        system = system_->query(name, type);
        if (system && system->hasAnswerOfType(type)) {
            return system;
        }
    }

    if (!direct_) {
        return system;
    }

    std::optional<DnsMessage> direct = direct_->query(name, type);
    if (direct && direct->hasAnswerOfType(type)) {
        LOG_TRACE("Dns", "Using direct answer for {} type={}", name, typeToString(type));
        return direct;
    }

    if (!system) {
        LOG_DEBUG("Dns", "No usable response for {} type={} ({})", name, typeToString(type),
                  direct ? "direct reply without answers" : "no reply on either path");
    }
    return system;
}

}  // namespace net
}  // namespace gatelink

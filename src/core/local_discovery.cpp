/**
 * @file local_discovery.cpp
 * @brief LocalDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/core/local_discovery.hpp"
#include "gatelink/net/dns_message.hpp"
#include "gatelink/utils/logger.hpp"

#include <algorithm>
#include <cstring>
#include <vector>

namespace gatelink {
namespace core {

namespace {

// Receive timeout; bounds how late a due query or stop() is noticed.
constexpr int kReceiveSliceMs = 250;

// mDNS packets may exceed the classic 512-byte limit (RFC 6762 §17).
constexpr size_t kMaxPacket = 9000;

}  // namespace

LocalDiscovery::LocalDiscovery(const LocalDiscoveryConfig& config, DiscoveryAggregator& aggregator)
    : config_(config)
    , aggregator_(aggregator)
    , browser_(config.service_type, std::chrono::milliseconds(config.resolve_timeout_ms))
{
    LOG_INFO("Discovery", "Created local browser for {} on {}:{}",
             browser_.browseName(), config_.mcast_addr, config_.mcast_port);
}

LocalDiscovery::~LocalDiscovery() {
    stop();
}

void LocalDiscovery::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("Discovery", "Local discovery already running");
        return;
    }

    listenerThread_ = std::thread(&LocalDiscovery::listenerLoop, this);
    LOG_INFO("Discovery", "Local discovery started for {}", config_.service_type);
}

void LocalDiscovery::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Discovery", "Stopping local discovery...");
    {
        std::lock_guard<std::mutex> lock(sleepMutex_);
    }
    sleepCv_.notify_all();

    if (listenerThread_.joinable()) {
        listenerThread_.join();
    }
    LOG_INFO("Discovery", "Local discovery stopped");
}

bool LocalDiscovery::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

bool LocalDiscovery::setupSocket() {
    auto socket = std::make_unique<net::UdpSocket>();
    if (!socket->isValid()) {
        return false;
    }
    if (!socket->setReuseAddress(true)) {
        LOG_WARN("Discovery", "Failed to set SO_REUSEADDR: {}", std::strerror(socket->getLastError()));
        return false;
    }
    if (!socket->bind(config_.mcast_port)) {
        return false;
    }
    if (!socket->joinMulticastGroup(config_.mcast_addr, config_.interface_addr)) {
        return false;
    }
    if (!config_.interface_addr.empty() && !socket->setMulticastInterface(config_.interface_addr)) {
        LOG_WARN("Discovery", "Failed to select multicast interface {}", config_.interface_addr);
    }
    if (!socket->setMulticastTTL(255)) {
        LOG_WARN("Discovery", "Failed to set multicast TTL");
    }
    if (!socket->setMulticastLoopback(config_.loopback)) {
        LOG_WARN("Discovery", "Failed to set multicast loopback");
    }

    socket_ = std::move(socket);
    LOG_INFO("Discovery", "Listening on {}:{}", config_.mcast_addr, config_.mcast_port);
    return true;
}

void LocalDiscovery::sendQuery(const std::string& name, uint16_t type) {
    std::vector<uint8_t> wire = net::buildQuery(0, name, type, false);
    if (wire.empty()) {
        LOG_WARN("Discovery", "Cannot encode query for {}", name);
        return;
    }

    net::SocketAddress dest(config_.mcast_addr, config_.mcast_port);
    if (socket_->sendTo(dest, wire.data(), wire.size()) < 0) {
        LOG_WARN("Discovery", "Failed to send {} query for {}: {}",
                 net::typeToString(type), name, std::strerror(socket_->getLastError()));
    } else {
        LOG_TRACE("Discovery", "Sent {} query for {}", net::typeToString(type), name);
    }
}

void LocalDiscovery::listenerLoop() {
    LOG_DEBUG("Discovery", "Listener thread started");

    using Clock = ServiceBrowser::Clock;
    const auto maxInterval = std::chrono::milliseconds(config_.max_query_interval_ms);
    auto browseInterval = std::chrono::milliseconds(config_.initial_query_interval_ms);
    auto nextBrowse = Clock::now();

    std::vector<uint8_t> buffer(kMaxPacket);

    while (running_.load()) {
        if (!socket_) {
            if (!setupSocket()) {
                LOG_WARN("Discovery", "mDNS socket setup failed, retrying in {}ms",
                         config_.setup_retry_ms);
                if (!sleepFor(std::chrono::milliseconds(config_.setup_retry_ms))) {
                    break;
                }
                continue;
            }
            browseInterval = std::chrono::milliseconds(config_.initial_query_interval_ms);
            nextBrowse = Clock::now();
        }

        auto now = Clock::now();
        if (now >= nextBrowse) {
            sendQuery(browser_.browseName(), ns_t_ptr);
            nextBrowse = now + browseInterval;
            browseInterval = std::min(browseInterval * 2, maxInterval);
        }

        for (const auto& query : browser_.dueQueries(now)) {
            sendQuery(query.name, query.type);
        }

        net::SocketAddress sender;
        int received = socket_->receiveFrom(buffer.data(), buffer.size(), kReceiveSliceMs, sender);

        bool changed = false;
        if (received > 0) {
            auto message = net::DnsMessage::parse(buffer.data(), static_cast<size_t>(received));
            if (!message) {
                LOG_TRACE("Discovery", "Ignoring malformed packet from {}", sender.toString());
            } else if (message->response) {
                changed = browser_.handleMessage(*message, Clock::now());
            }
        } else if (received < 0 && running_.load()) {
            LOG_WARN("Discovery", "Receive error: {}, reopening socket",
                     std::strerror(socket_->getLastError()));
            socket_.reset();
        }

        if (browser_.tick(Clock::now())) {
            changed = true;
        }
        if (changed) {
            aggregator_.publishLocal(browser_.endpoints());
        }
    }

    if (socket_) {
        if (!socket_->leaveMulticastGroup(config_.mcast_addr, config_.interface_addr)) {
            LOG_DEBUG("Discovery", "Leaving {} failed", config_.mcast_addr);
        }
        socket_.reset();
    }
    LOG_DEBUG("Discovery", "Listener thread stopped");
}

}  // namespace core
}  // namespace gatelink

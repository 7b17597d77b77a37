/**
 * @file udp_socket.hpp
 * @brief IPv4 UDP socket used for mDNS multicast and direct DNS queries.
 *
 * RAII wrapper with multicast group membership, hop limit control and a
 * select()-based receive timeout.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/net/export.hpp"
#include "gatelink/net/platform.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gatelink {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct GATELINK_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket.
 *
 * Usage (mDNS listener):
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(MDNS_PORT);
 * sock.joinMulticastGroup(MDNS_GROUP);
 * sock.setMulticastTTL(255);
 *
 * std::vector<uint8_t> buffer(9000);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 250, sender);
 * @endcode
 */
class GATELINK_NET_API UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind to a local port.
     * @param port The port to bind to (0 for an ephemeral port).
     * @param address Local address (default: any).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    uint16_t getLocalPort() const;

    /// SO_REUSEADDR, plus SO_REUSEPORT where available. Call before bind().
    bool setReuseAddress(bool enable);

    /// Multicast hop limit. mDNS uses 255.
    bool setMulticastTTL(int ttl);

    bool setMulticastLoopback(bool enable);

    /// Outgoing interface for multicast, by local IPv4 address.
    bool setMulticastInterface(const std::string& interfaceAddress);

    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    bool leaveMulticastGroup(const std::string& groupAddress,
                             const std::string& interfaceAddress = "");

    /**
     * @brief Send one datagram.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive one datagram.
     * @param timeoutMs 0 = poll, -1 = block.
     * @return Bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    bool setIpOption(int option, const void* value, socklen_t length);
    void setLastError();

    SocketHandle socket_;
    int lastError_;
};

}  // namespace net
}  // namespace gatelink

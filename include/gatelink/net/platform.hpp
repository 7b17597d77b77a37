/**
 * @file platform.hpp
 * @brief POSIX socket and resolver includes shared by the net library.
 *
 * The DNS paths depend on the glibc stub resolver (libresolv), so only
 * POSIX targets are supported.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include <cstdint>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <resolv.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace gatelink {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

/// Standard DNS port.
constexpr uint16_t DNS_PORT = 53;

/// mDNS group and port (RFC 6762).
constexpr const char* MDNS_GROUP = "224.0.0.251";
constexpr uint16_t MDNS_PORT = 5353;

}  // namespace net
}  // namespace gatelink

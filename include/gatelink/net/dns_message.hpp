/**
 * @file dns_message.hpp
 * @brief Parsed DNS response and query encoding.
 *
 * Only the record shapes DNS-SD needs are decoded (PTR, SRV, TXT, A, AAAA);
 * any other record is kept with its name, type and TTL. Parsing is done with
 * the libresolv ns_* API, which handles name compression. Record types and
 * response codes are the libresolv ns_type / ns_rcode values.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/net/export.hpp"

#include <arpa/nameser.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gatelink {
namespace net {

/// Standard mnemonic for an rcode ("NOERROR", "NXDOMAIN", ...), or the number.
GATELINK_NET_API std::string rcodeToString(int code);

/// Mnemonic for a record type ("PTR", "SRV", ...), or "TYPE<n>".
GATELINK_NET_API std::string typeToString(uint16_t type);

/// Lower-cased, absolute (trailing dot) form used to compare owner names.
GATELINK_NET_API std::string canonicalName(const std::string& name);

struct GATELINK_NET_API SrvData {
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint16_t port = 0;
    std::string target;
};

/**
 * @struct DnsRecord
 * @brief One resource record. Only the field matching @c type is set.
 */
struct GATELINK_NET_API DnsRecord {
    std::string name;          ///< Owner name, absolute, original case.
    uint16_t type = 0;
    uint16_t rrClass = 0;      ///< Class with the mDNS cache-flush bit masked off.
    bool cacheFlush = false;
    uint32_t ttl = 0;

    std::string target;        ///< PTR
    SrvData srv;               ///< SRV
    std::string address;       ///< A / AAAA, textual
    std::vector<std::string> txt;  ///< TXT character-strings, raw bytes
};

enum class DnsSection {
    Answer,
    Authority,
    Additional
};

/**
 * @struct DnsMessage
 * @brief A decoded DNS message.
 */
struct GATELINK_NET_API DnsMessage {
    uint16_t id = 0;
    bool response = false;
    bool truncated = false;    ///< TC: the sender had more than fit in the datagram.
    int rcode = 0;
    std::vector<std::string> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authority;
    std::vector<DnsRecord> additional;

    /**
     * @brief Decode a wire-format message.
     * @return The message, or nullopt when the bytes are not a valid message.
     */
    static std::optional<DnsMessage> parse(const uint8_t* data, size_t length);

    const std::vector<DnsRecord>& section(DnsSection which) const;

    /// True when the answer section holds at least one record of @p type.
    bool hasAnswerOfType(uint16_t type) const;

    /// Records in @p which whose owner name equals @p name (case-insensitive).
    std::vector<const DnsRecord*> recordsNamed(DnsSection which, const std::string& name) const;

    /// First record of @p type named @p name: answer section, then additional.
    const DnsRecord* findRecord(const std::string& name, uint16_t type) const;
};

/**
 * @brief Encode a single-question query.
 * @param id Message ID (0 for multicast queries).
 * @param recursionDesired Sets RD; unicast queries want it, mDNS does not.
 * @param unicastResponse Sets the mDNS QU bit in the question class.
 * @param ednsUdpSize When non-zero, appends an EDNS0 OPT record advertising
 *        this UDP payload size.
 * @return Wire bytes, empty if @p name cannot be encoded.
 */
GATELINK_NET_API std::vector<uint8_t> buildQuery(uint16_t id,
                                                 const std::string& name,
                                                 uint16_t type,
                                                 bool recursionDesired,
                                                 bool unicastResponse = false,
                                                 uint16_t ednsUdpSize = 0);

}  // namespace net
}  // namespace gatelink

/**
 * @file dns_message.cpp
 * @brief DNS message decoding via libresolv and query encoding.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/net/dns_message.hpp"
#include "gatelink/net/platform.hpp"
#include "gatelink/utils/string_utils.hpp"

namespace gatelink {
namespace net {

namespace {

constexpr uint16_t kClassIn = 1;
constexpr uint16_t kCacheFlushBit = 0x8000;
constexpr size_t kOptRecordSize = 11;

bool uncompressName(const ns_msg& handle, const uint8_t* at, std::string& out) {
    char buf[NS_MAXDNAME];
    if (ns_name_uncompress(ns_msg_base(handle), ns_msg_end(handle), at,
                           buf, sizeof(buf)) < 0) {
        return false;
    }
    out = buf;
    if (out.empty() || out.back() != '.') {
        out.push_back('.');
    }
    return true;
}

bool decodeRdata(const ns_msg& handle, const ns_rr& rr, DnsRecord& rec) {
    const uint8_t* rdata = ns_rr_rdata(rr);
    const size_t rdlen = ns_rr_rdlen(rr);

    switch (rec.type) {
        case ns_t_ptr:
            return uncompressName(handle, rdata, rec.target);

        case ns_t_srv:
            if (rdlen < 7) {
                return false;
            }
            rec.srv.priority = ns_get16(rdata);
            rec.srv.weight = ns_get16(rdata + 2);
            rec.srv.port = ns_get16(rdata + 4);
            return uncompressName(handle, rdata + 6, rec.srv.target);

        case ns_t_a: {
            if (rdlen != 4) {
                return false;
            }
            char buf[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, rdata, buf, sizeof(buf)) == nullptr) {
                return false;
            }
            rec.address = buf;
            return true;
        }

        case ns_t_aaaa: {
            if (rdlen != 16) {
                return false;
            }
            char buf[INET6_ADDRSTRLEN];
            if (inet_ntop(AF_INET6, rdata, buf, sizeof(buf)) == nullptr) {
                return false;
            }
            rec.address = buf;
            return true;
        }

        case ns_t_txt: {
            size_t pos = 0;
            while (pos < rdlen) {
                const size_t len = rdata[pos++];
                if (pos + len > rdlen) {
                    return false;
                }
                rec.txt.emplace_back(reinterpret_cast<const char*>(rdata + pos), len);
                pos += len;
            }
            return true;
        }

        default:
            return true;
    }
}

bool parseSection(ns_msg& handle, ns_sect sect, std::vector<DnsRecord>& out) {
    const int count = ns_msg_count(handle, sect);
    out.reserve(static_cast<size_t>(count));

    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&handle, sect, i, &rr) < 0) {
            return false;
        }

        DnsRecord rec;
        rec.name = ns_rr_name(rr);
        if (rec.name.empty() || rec.name.back() != '.') {
            rec.name.push_back('.');
        }
        rec.type = ns_rr_type(rr);
        const uint16_t cls = ns_rr_class(rr);
        rec.cacheFlush = (cls & kCacheFlushBit) != 0;
        rec.rrClass = cls & static_cast<uint16_t>(~kCacheFlushBit);
        rec.ttl = ns_rr_ttl(rr);

        if (!decodeRdata(handle, rr, rec)) {
            return false;
        }
        out.push_back(std::move(rec));
    }
    return true;
}

}  // namespace

std::string rcodeToString(int code) {
    switch (code) {
        case ns_r_noerror:  return "NOERROR";
        case ns_r_formerr:  return "FORMERR";
        case ns_r_servfail: return "SERVFAIL";
        case ns_r_nxdomain: return "NXDOMAIN";
        case ns_r_notimpl:  return "NOTIMP";
        case ns_r_refused:  return "REFUSED";
        case ns_r_yxdomain: return "YXDOMAIN";
        case ns_r_yxrrset:  return "YXRRSET";
        case ns_r_nxrrset:  return "NXRRSET";
        case ns_r_notauth:  return "NOTAUTH";
        case ns_r_notzone:  return "NOTZONE";
        default: return std::to_string(code);
    }
}

std::string typeToString(uint16_t type) {
    switch (type) {
        case ns_t_a:    return "A";
        case ns_t_ptr:  return "PTR";
        case ns_t_txt:  return "TXT";
        case ns_t_aaaa: return "AAAA";
        case ns_t_srv:  return "SRV";
        case ns_t_any:  return "ANY";
        default:       return "TYPE" + std::to_string(type);
    }
}

std::string canonicalName(const std::string& name) {
    std::string out = utils::toLower(utils::trim(name));
    if (out.empty() || out.back() != '.') {
        out.push_back('.');
    }
    return out;
}

std::optional<DnsMessage> DnsMessage::parse(const uint8_t* data, size_t length) {
    if (data == nullptr || length < NS_HFIXEDSZ) {
        return std::nullopt;
    }

    ns_msg handle;
    if (ns_initparse(data, static_cast<int>(length), &handle) < 0) {
        return std::nullopt;
    }

    DnsMessage msg;
    msg.id = ns_msg_id(handle);
    msg.response = ns_msg_getflag(handle, ns_f_qr) != 0;
    msg.truncated = ns_msg_getflag(handle, ns_f_tc) != 0;
    msg.rcode = ns_msg_getflag(handle, ns_f_rcode);

    const int qdcount = ns_msg_count(handle, ns_s_qd);
    for (int i = 0; i < qdcount; ++i) {
        ns_rr rr;
        if (ns_parserr(&handle, ns_s_qd, i, &rr) < 0) {
            return std::nullopt;
        }
        msg.questions.push_back(ns_rr_name(rr));
    }

    if (!parseSection(handle, ns_s_an, msg.answers) ||
        !parseSection(handle, ns_s_ns, msg.authority) ||
        !parseSection(handle, ns_s_ar, msg.additional)) {
        return std::nullopt;
    }
    return msg;
}

const std::vector<DnsRecord>& DnsMessage::section(DnsSection which) const {
    switch (which) {
        case DnsSection::Answer:    return answers;
        case DnsSection::Authority: return authority;
        case DnsSection::Additional:
        default:                    return additional;
    }
}

bool DnsMessage::hasAnswerOfType(uint16_t type) const {
    for (const auto& rec : answers) {
        if (rec.type == type) {
            return true;
        }
    }
    return false;
}

std::vector<const DnsRecord*> DnsMessage::recordsNamed(DnsSection which,
                                                       const std::string& name) const {
    std::vector<const DnsRecord*> out;
    const std::string key = canonicalName(name);
    for (const auto& rec : section(which)) {
        if (canonicalName(rec.name) == key) {
            out.push_back(&rec);
        }
    }
    return out;
}

const DnsRecord* DnsMessage::findRecord(const std::string& name, uint16_t type) const {
    for (DnsSection which : {DnsSection::Answer, DnsSection::Additional}) {
        for (const DnsRecord* rec : recordsNamed(which, name)) {
            if (rec->type == type) {
                return rec;
            }
        }
    }
    return nullptr;
}

std::vector<uint8_t> buildQuery(uint16_t id, const std::string& name, uint16_t type,
                                bool recursionDesired, bool unicastResponse,
                                uint16_t ednsUdpSize) {
    std::vector<uint8_t> out(NS_HFIXEDSZ + NS_MAXCDNAME + NS_QFIXEDSZ + kOptRecordSize, 0);

    ns_put16(id, out.data());
    out[2] = recursionDesired ? 0x01 : 0x00;
    ns_put16(1, out.data() + 4);  // QDCOUNT

    int n = dn_comp(name.c_str(), out.data() + NS_HFIXEDSZ, NS_MAXCDNAME, nullptr, nullptr);
    if (n < 0) {
        return {};
    }

    uint8_t* p = out.data() + NS_HFIXEDSZ + n;
    ns_put16(type, p);
    ns_put16(static_cast<uint16_t>(kClassIn | (unicastResponse ? kCacheFlushBit : 0)), p + 2);

    size_t size = NS_HFIXEDSZ + static_cast<size_t>(n) + NS_QFIXEDSZ;
    if (ednsUdpSize != 0) {
        // OPT: root owner, CLASS carries the payload size, TTL and RDLENGTH zero.
        uint8_t* opt = out.data() + size;
        opt[0] = 0;
        ns_put16(ns_t_opt, opt + 1);
        ns_put16(ednsUdpSize, opt + 3);
        ns_put16(1, out.data() + 10);  // ARCOUNT
        size += kOptRecordSize;
    }
    out.resize(size);
    return out;
}

}  // namespace net
}  // namespace gatelink

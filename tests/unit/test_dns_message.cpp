/**
 * @file test_dns_message.cpp
 * @brief Unit tests for DNS message decoding and query encoding
 */

#include <gtest/gtest.h>
#include <gatelink/net/platform.hpp>
#include <gatelink/net/dns_message.hpp>

#include "support/dns_wire_builder.hpp"

using namespace gatelink::net;
using gatelink::test::DnsWireBuilder;

TEST(DnsMessageTest, RcodeMnemonics) {
    EXPECT_EQ(rcodeToString(0), "NOERROR");
    EXPECT_EQ(rcodeToString(2), "SERVFAIL");
    EXPECT_EQ(rcodeToString(3), "NXDOMAIN");
    EXPECT_EQ(rcodeToString(5), "REFUSED");
    EXPECT_EQ(rcodeToString(9), "NOTAUTH");
    EXPECT_EQ(rcodeToString(10), "NOTZONE");
    EXPECT_EQ(rcodeToString(11), "11");
}

TEST(DnsMessageTest, ResolverConstantsNameTheSameCodes) {
    // The resolver compat macros (NXDOMAIN, NOERROR) are in scope here.
    EXPECT_EQ(ns_r_nxdomain, NXDOMAIN);
    EXPECT_EQ(rcodeToString(ns_r_noerror), "NOERROR");
    EXPECT_EQ(rcodeToString(ns_r_nxdomain), "NXDOMAIN");
    EXPECT_EQ(rcodeToString(ns_r_notzone), "NOTZONE");
    EXPECT_EQ(typeToString(ns_t_aaaa), "AAAA");
    EXPECT_EQ(typeToString(ns_t_any), "ANY");
}

TEST(DnsMessageTest, TypeMnemonics) {
    EXPECT_EQ(typeToString(ns_t_ptr), "PTR");
    EXPECT_EQ(typeToString(ns_t_srv), "SRV");
    EXPECT_EQ(typeToString(99), "TYPE99");
}

TEST(DnsMessageTest, CanonicalName) {
    EXPECT_EQ(canonicalName("Office._GW._tcp.Example.COM"), "office._gw._tcp.example.com.");
    EXPECT_EQ(canonicalName("example.com."), "example.com.");
}

TEST(DnsMessageTest, ParsesAllRecordKinds) {
    auto msg = DnsWireBuilder(0x1234, true)
        .question("_gw._tcp.example.com.", ns_t_ptr)
        .ptr(DnsSection::Answer, "_gw._tcp.example.com.", "Office._gw._tcp.example.com.", 300)
        .srv(DnsSection::Additional, "Office._gw._tcp.example.com.", 18789, "gw1.example.com.")
        .txt(DnsSection::Additional, "Office._gw._tcp.example.com.", {"lanHost=gw1.lan", "gatewayTls=1"})
        .a(DnsSection::Additional, "gw1.example.com.", "10.0.0.5")
        .aaaa(DnsSection::Additional, "gw1.example.com.", "fd00::5")
        .message();

    EXPECT_EQ(msg.id, 0x1234);
    EXPECT_TRUE(msg.response);
    EXPECT_EQ(msg.rcode, ns_r_noerror);
    ASSERT_EQ(msg.questions.size(), 1u);
    ASSERT_EQ(msg.answers.size(), 1u);
    ASSERT_EQ(msg.additional.size(), 4u);

    const DnsRecord& ptr = msg.answers[0];
    EXPECT_EQ(ptr.type, ns_t_ptr);
    EXPECT_EQ(ptr.name, "_gw._tcp.example.com.");
    EXPECT_EQ(ptr.target, "Office._gw._tcp.example.com.");
    EXPECT_EQ(ptr.ttl, 300u);
    EXPECT_EQ(ptr.rrClass, 1);

    const DnsRecord* srv = msg.findRecord("office._gw._tcp.example.com", ns_t_srv);
    ASSERT_NE(srv, nullptr);
    EXPECT_EQ(srv->srv.port, 18789);
    EXPECT_EQ(srv->srv.target, "gw1.example.com.");

    const DnsRecord* txt = msg.findRecord("Office._gw._tcp.example.com.", ns_t_txt);
    ASSERT_NE(txt, nullptr);
    ASSERT_EQ(txt->txt.size(), 2u);
    EXPECT_EQ(txt->txt[0], "lanHost=gw1.lan");

    auto hosts = msg.recordsNamed(DnsSection::Additional, "GW1.example.com.");
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0]->address, "10.0.0.5");
    EXPECT_EQ(hosts[1]->address, "fd00::5");
}

TEST(DnsMessageTest, NxdomainHeader) {
    auto msg = DnsWireBuilder(7, true, ns_r_nxdomain)
        .question("_gw._tcp.example.com.", ns_t_ptr)
        .message();

    EXPECT_EQ(msg.rcode, ns_r_nxdomain);
    EXPECT_TRUE(msg.answers.empty());
    EXPECT_FALSE(msg.hasAnswerOfType(ns_t_ptr));
}

TEST(DnsMessageTest, CacheFlushBitIsSeparated) {
    auto msg = DnsWireBuilder()
        .a(DnsSection::Answer, "host.local.", "192.168.1.20", 120, true)
        .message();

    ASSERT_EQ(msg.answers.size(), 1u);
    EXPECT_TRUE(msg.answers[0].cacheFlush);
    EXPECT_EQ(msg.answers[0].rrClass, 1);
}

TEST(DnsMessageTest, SpacesInLabelsAreEscaped) {
    auto msg = DnsWireBuilder()
        .ptr(DnsSection::Answer, "_gw._tcp.local.", "Living Room._gw._tcp.local.")
        .message();

    ASSERT_EQ(msg.answers.size(), 1u);
    EXPECT_EQ(msg.answers[0].target, "Living\\032Room._gw._tcp.local.");
}

TEST(DnsMessageTest, RejectsTruncatedInput) {
    auto wire = DnsWireBuilder()
        .ptr(DnsSection::Answer, "_gw._tcp.local.", "A._gw._tcp.local.")
        .build();

    EXPECT_FALSE(DnsMessage::parse(wire.data(), 5).has_value());
    EXPECT_FALSE(DnsMessage::parse(wire.data(), wire.size() - 3).has_value());
    EXPECT_FALSE(DnsMessage::parse(nullptr, 0).has_value());
}

TEST(DnsMessageTest, BuildQueryRoundTrip) {
    auto wire = buildQuery(0xBEEF, "_gw._tcp.example.com.", ns_t_ptr, true);
    ASSERT_FALSE(wire.empty());
    EXPECT_EQ(wire[2] & 0x01, 0x01);

    auto msg = DnsMessage::parse(wire.data(), wire.size());
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->id, 0xBEEF);
    EXPECT_FALSE(msg->response);
    ASSERT_EQ(msg->questions.size(), 1u);
    EXPECT_EQ(canonicalName(msg->questions[0]), "_gw._tcp.example.com.");
}

TEST(DnsMessageTest, QueryWithEdnsOption) {
    auto plain = buildQuery(7, "_gw._tcp.example.com.", ns_t_ptr, true);
    auto wire = buildQuery(7, "_gw._tcp.example.com.", ns_t_ptr, true, false, 4096);
    ASSERT_EQ(wire.size(), plain.size() + 11);
    EXPECT_EQ(wire[11], 1);  // ARCOUNT

    auto msg = DnsMessage::parse(wire.data(), wire.size());
    ASSERT_TRUE(msg.has_value());
    ASSERT_EQ(msg->additional.size(), 1u);
    EXPECT_EQ(msg->additional[0].type, ns_t_opt);
    EXPECT_EQ(msg->additional[0].rrClass, 4096);
    EXPECT_FALSE(msg->truncated);
}

TEST(DnsMessageTest, TruncatedFlag) {
    auto wire = DnsWireBuilder(3, true)
        .question("_gw._tcp.example.com.", ns_t_ptr)
        .build();
    wire[2] |= 0x02;

    auto msg = DnsMessage::parse(wire.data(), wire.size());
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(msg->truncated);
    EXPECT_TRUE(msg->response);
}

TEST(DnsMessageTest, MulticastQueryFlags) {
    auto wire = buildQuery(0, "_gw._tcp.local.", ns_t_ptr, false, true);
    ASSERT_GE(wire.size(), 4u);
    EXPECT_EQ(wire[2], 0x00);
    // QU bit is the top bit of the question class.
    EXPECT_EQ(wire[wire.size() - 2] & 0x80, 0x80);
}

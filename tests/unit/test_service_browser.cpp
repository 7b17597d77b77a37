/**
 * @file test_service_browser.cpp
 * @brief Unit tests for the mDNS browse/resolve state machine
 */

#include <gtest/gtest.h>
#include <gatelink/core/service_browser.hpp>

#include "support/dns_wire_builder.hpp"

#include <algorithm>

using namespace gatelink::core;
using gatelink::net::DnsSection;
using gatelink::test::DnsWireBuilder;

namespace {

const std::string kType = "_openclaw-gw._tcp.";
const std::string kBrowse = "_openclaw-gw._tcp.local.";
const std::string kOffice = "Office Gateway._openclaw-gw._tcp.local.";
// Owner names come back from the resolver in presentation form.
const std::string kOfficeEscaped = "Office\\032Gateway._openclaw-gw._tcp.local.";

}  // namespace

class ServiceBrowserTest : public ::testing::Test {
protected:
    ServiceBrowserTest()
        : browser_(kType, std::chrono::milliseconds(5000))
        , now_(ServiceBrowser::Clock::now())
    {}

    DnsWireBuilder fullAnnouncement(uint32_t ptrTtl = 4500) {
        DnsWireBuilder b;
        b.ptr(DnsSection::Answer, kBrowse, kOffice, ptrTtl)
         .srv(DnsSection::Additional, kOffice, 18789, "office-host.local.", 120, true)
         .txt(DnsSection::Additional, kOffice, {"lanHost=office.lan", "gatewayTls=1"}, 4500, true)
         .a(DnsSection::Additional, "office-host.local.", "192.168.1.20", 120, true);
        return b;
    }

    std::chrono::milliseconds ms(int n) const { return std::chrono::milliseconds(n); }

    ServiceBrowser browser_;
    ServiceBrowser::TimePoint now_;
};

TEST_F(ServiceBrowserTest, BrowseName) {
    EXPECT_EQ(browser_.browseName(), kBrowse);
}

TEST_F(ServiceBrowserTest, SinglePacketResolves) {
    EXPECT_TRUE(browser_.handleMessage(fullAnnouncement().message(), now_));

    auto eps = browser_.endpoints();
    ASSERT_EQ(eps.size(), 1u);
    EXPECT_EQ(eps[0].stable_id, "_openclaw-gw._tcp.|local.|Office Gateway");
    EXPECT_EQ(eps[0].name, "Office Gateway");
    EXPECT_EQ(eps[0].host, "192.168.1.20");
    EXPECT_EQ(eps[0].port, 18789);
    EXPECT_EQ(eps[0].lan_host, "office.lan");
    EXPECT_TRUE(eps[0].tls_enabled);
    EXPECT_TRUE(browser_.dueQueries(now_).empty());
}

TEST_F(ServiceBrowserTest, RepeatedAnnouncementIsNotAChange) {
    ASSERT_TRUE(browser_.handleMessage(fullAnnouncement().message(), now_));
    EXPECT_FALSE(browser_.handleMessage(fullAnnouncement().message(), now_ + ms(100)));
}

TEST_F(ServiceBrowserTest, ResolvesAcrossPackets) {
    auto ptrOnly = DnsWireBuilder().ptr(DnsSection::Answer, kBrowse, kOffice).message();
    EXPECT_FALSE(browser_.handleMessage(ptrOnly, now_));
    EXPECT_TRUE(browser_.endpoints().empty());

    auto queries = browser_.dueQueries(now_);
    ASSERT_EQ(queries.size(), 2u);
    EXPECT_EQ(queries[0], (BrowseQuery{kOfficeEscaped, ns_t_srv}));
    EXPECT_EQ(queries[1], (BrowseQuery{kOfficeEscaped, ns_t_txt}));

    auto srv = DnsWireBuilder()
        .srv(DnsSection::Answer, kOffice, 18789, "office-host.local.")
        .message();
    EXPECT_FALSE(browser_.handleMessage(srv, now_ + ms(200)));

    // Retries wait for the interval.
    EXPECT_TRUE(browser_.dueQueries(now_ + ms(500)).empty());
    queries = browser_.dueQueries(now_ + ms(1200));
    ASSERT_EQ(queries.size(), 2u);
    EXPECT_EQ(queries[0], (BrowseQuery{"office-host.local.", ns_t_a}));

    auto addr = DnsWireBuilder()
        .aaaa(DnsSection::Answer, "office-host.local.", "fe80::1")
        .message();
    EXPECT_TRUE(browser_.handleMessage(addr, now_ + ms(1300)));

    auto eps = browser_.endpoints();
    ASSERT_EQ(eps.size(), 1u);
    EXPECT_EQ(eps[0].host, "fe80::1");
    EXPECT_FALSE(eps[0].lan_host.has_value());
}

TEST_F(ServiceBrowserTest, PrefersIpv4Address) {
    auto msg = fullAnnouncement()
        .aaaa(DnsSection::Additional, "office-host.local.", "fe80::1")
        .message();
    ASSERT_TRUE(browser_.handleMessage(msg, now_));
    EXPECT_EQ(browser_.endpoints()[0].host, "192.168.1.20");
}

TEST_F(ServiceBrowserTest, UnrelatedAddressesIgnored) {
    auto msg = DnsWireBuilder()
        .a(DnsSection::Answer, "printer.local.", "192.168.1.9")
        .message();
    EXPECT_FALSE(browser_.handleMessage(msg, now_));
    EXPECT_TRUE(browser_.endpoints().empty());
}

TEST_F(ServiceBrowserTest, TxtUpdateIsAChange) {
    ASSERT_TRUE(browser_.handleMessage(fullAnnouncement().message(), now_));

    auto txt = DnsWireBuilder()
        .txt(DnsSection::Answer, kOffice, {"lanHost=moved.lan"}, 4500, true)
        .message();
    EXPECT_TRUE(browser_.handleMessage(txt, now_ + ms(10)));
    EXPECT_EQ(browser_.endpoints()[0].lan_host, "moved.lan");
    EXPECT_FALSE(browser_.endpoints()[0].tls_enabled);
}

TEST_F(ServiceBrowserTest, GoodbyeRemovesOnlyThatInstance) {
    const std::string studio = "Studio._openclaw-gw._tcp.local.";
    auto msg = fullAnnouncement()
        .ptr(DnsSection::Answer, kBrowse, studio)
        .srv(DnsSection::Additional, studio, 18790, "studio-host.local.")
        .a(DnsSection::Additional, "studio-host.local.", "192.168.1.30")
        .message();
    ASSERT_TRUE(browser_.handleMessage(msg, now_));
    ASSERT_EQ(browser_.endpoints().size(), 2u);

    auto goodbye = DnsWireBuilder().ptr(DnsSection::Answer, kBrowse, kOffice, 0).message();
    EXPECT_TRUE(browser_.handleMessage(goodbye, now_ + ms(50)));

    auto eps = browser_.endpoints();
    ASSERT_EQ(eps.size(), 1u);
    EXPECT_EQ(eps[0].name, "Studio");
}

TEST_F(ServiceBrowserTest, GoodbyeForUnknownInstance) {
    auto goodbye = DnsWireBuilder().ptr(DnsSection::Answer, kBrowse, kOffice, 0).message();
    EXPECT_FALSE(browser_.handleMessage(goodbye, now_));
}

TEST_F(ServiceBrowserTest, OtherServiceTypesIgnored) {
    auto msg = DnsWireBuilder()
        .ptr(DnsSection::Answer, "_http._tcp.local.", "Web._http._tcp.local.")
        .message();
    EXPECT_FALSE(browser_.handleMessage(msg, now_));
    EXPECT_TRUE(browser_.dueQueries(now_).empty());
    EXPECT_TRUE(browser_.endpoints().empty());
}

TEST_F(ServiceBrowserTest, UnresolvedInstanceTimesOut) {
    auto ptrOnly = DnsWireBuilder().ptr(DnsSection::Answer, kBrowse, kOffice).message();
    browser_.handleMessage(ptrOnly, now_);

    EXPECT_FALSE(browser_.tick(now_ + ms(4999)));
    EXPECT_EQ(browser_.dueQueries(now_ + ms(4999)).size(), 2u);

    EXPECT_FALSE(browser_.tick(now_ + ms(5000)));
    EXPECT_TRUE(browser_.dueQueries(now_ + ms(6000)).empty());

    // A later announcement starts over.
    EXPECT_TRUE(browser_.handleMessage(fullAnnouncement().message(), now_ + ms(7000)));
    EXPECT_EQ(browser_.endpoints().size(), 1u);
}

TEST_F(ServiceBrowserTest, PtrExpiryRemovesEndpoint) {
    ASSERT_TRUE(browser_.handleMessage(fullAnnouncement(10).message(), now_));

    EXPECT_FALSE(browser_.tick(now_ + std::chrono::seconds(9)));
    EXPECT_EQ(browser_.endpoints().size(), 1u);

    EXPECT_TRUE(browser_.tick(now_ + std::chrono::seconds(10)));
    EXPECT_TRUE(browser_.endpoints().empty());
}

TEST_F(ServiceBrowserTest, ResolvedInstanceNeedsNoQueries) {
    ASSERT_TRUE(browser_.handleMessage(fullAnnouncement().message(), now_));
    EXPECT_TRUE(browser_.dueQueries(now_).empty());
}

TEST_F(ServiceBrowserTest, EndpointsSortedByName) {
    const std::string alpha = "alpha._openclaw-gw._tcp.local.";
    auto msg = fullAnnouncement()
        .ptr(DnsSection::Answer, kBrowse, alpha)
        .srv(DnsSection::Additional, alpha, 1, "alpha-host.local.")
        .a(DnsSection::Additional, "alpha-host.local.", "192.168.1.40")
        .message();
    ASSERT_TRUE(browser_.handleMessage(msg, now_));

    auto eps = browser_.endpoints();
    ASSERT_EQ(eps.size(), 2u);
    EXPECT_EQ(eps[0].name, "alpha");
    EXPECT_EQ(eps[1].name, "Office Gateway");
}

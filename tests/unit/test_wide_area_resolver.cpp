/**
 * @file test_wide_area_resolver.cpp
 * @brief Unit tests for the wide-area DNS-SD resolver
 */

#include <gtest/gtest.h>
#include <gatelink/core/wide_area_resolver.hpp>

#include "support/dns_wire_builder.hpp"

#include <memory>

using namespace gatelink::core;
using gatelink::net::DnsSection;
using gatelink::test::DnsWireBuilder;
using gatelink::test::ScriptedDnsClient;

namespace {

const std::string kBrowse = "_openclaw-gw._tcp.example.com.";
const std::string kOffice = "Office Gateway._openclaw-gw._tcp.example.com.";
const std::string kStudio = "Studio._openclaw-gw._tcp.example.com.";

}  // namespace

class WideAreaResolverTest : public ::testing::Test {
protected:
    WideAreaResolverTest()
        : dns_(std::make_shared<ScriptedDnsClient>())
        , aggregator_(true)
    {
        config_.domain = "example.com";
    }

    std::unique_ptr<WideAreaResolver> makeResolver() {
        return std::make_unique<WideAreaResolver>(config_, dns_, aggregator_);
    }

    /// Office arrives fully in the PTR response; Studio needs follow-up queries.
    void scriptTwoGateways() {
        dns_->set(kBrowse, ns_t_ptr, DnsWireBuilder(1, true)
            .ptr(DnsSection::Answer, kBrowse, kOffice)
            .ptr(DnsSection::Answer, kBrowse, kStudio)
            .srv(DnsSection::Additional, kOffice, 18789, "gw1.example.com.")
            .a(DnsSection::Additional, "gw1.example.com.", "10.0.0.5")
            .txt(DnsSection::Additional, kOffice, {"lanHost=office.lan", "tailnetDns=gw1.tail.ts.net"})
            .message());

        dns_->set(kStudio, ns_t_srv, DnsWireBuilder(2, true)
            .srv(DnsSection::Answer, kStudio, 18790, "gw2.example.com.")
            .message());
        dns_->set("gw2.example.com.", ns_t_a, DnsWireBuilder(3, true)
            .a(DnsSection::Answer, "gw2.example.com.", "10.0.0.6")
            .message());
        dns_->set(kStudio, ns_t_txt, DnsWireBuilder(4, true)
            .txt(DnsSection::Answer, kStudio, {"gatewayTls=1", "gatewayTlsSha256=AA:BB"})
            .message());
    }

    WideAreaConfig config_;
    std::shared_ptr<ScriptedDnsClient> dns_;
    DiscoveryAggregator aggregator_;
};

TEST_F(WideAreaResolverTest, BrowseName) {
    auto resolver = makeResolver();
    EXPECT_EQ(resolver->browseName(), kBrowse);
}

TEST_F(WideAreaResolverTest, ResolvesTwoGateways) {
    scriptTwoGateways();
    auto resolver = makeResolver();

    EXPECT_TRUE(resolver->runOnce());
    EXPECT_EQ(resolver->tracker().consecutiveFailures(), 0);

    auto state = aggregator_.state();
    EXPECT_EQ(state.status, "Wide: 2");
    ASSERT_EQ(state.endpoints.size(), 2u);

    const auto& office = state.endpoints[0];
    EXPECT_EQ(office.stable_id, "_openclaw-gw._tcp.|example.com.|Office Gateway");
    EXPECT_EQ(office.name, "Office Gateway");
    EXPECT_EQ(office.host, "10.0.0.5");
    EXPECT_EQ(office.port, 18789);
    EXPECT_EQ(office.lan_host, "office.lan");
    EXPECT_EQ(office.tailnet_dns, "gw1.tail.ts.net");
    EXPECT_FALSE(office.tls_enabled);

    const auto& studio = state.endpoints[1];
    EXPECT_EQ(studio.name, "Studio");
    EXPECT_EQ(studio.host, "10.0.0.6");
    EXPECT_EQ(studio.port, 18790);
    EXPECT_TRUE(studio.tls_enabled);
    EXPECT_EQ(studio.tls_fingerprint_sha256, "AA:BB");

    // Records supplied with the PTR response are not asked for again.
    EXPECT_EQ(dns_->queryCount(kOffice, ns_t_srv), 0u);
    EXPECT_EQ(dns_->queryCount("gw1.example.com.", ns_t_a), 0u);
    EXPECT_EQ(dns_->queryCount(kOffice, ns_t_txt), 0u);
    EXPECT_EQ(dns_->queryCount(kStudio, ns_t_srv), 1u);
    EXPECT_EQ(dns_->queryCount("gw2.example.com.", ns_t_a), 1u);
}

TEST_F(WideAreaResolverTest, UsesTxtFromSrvResponseAdditionals) {
    dns_->set(kBrowse, ns_t_ptr, DnsWireBuilder(1, true)
        .ptr(DnsSection::Answer, kBrowse, kStudio)
        .message());
    dns_->set(kStudio, ns_t_srv, DnsWireBuilder(2, true)
        .srv(DnsSection::Answer, kStudio, 18790, "gw2.example.com.")
        .a(DnsSection::Additional, "gw2.example.com.", "10.0.0.6")
        .txt(DnsSection::Additional, kStudio, {"gatewayTls=1", "lanHost=studio.lan"})
        .message());
    auto resolver = makeResolver();

    ASSERT_TRUE(resolver->runOnce());
    auto state = aggregator_.state();
    ASSERT_EQ(state.endpoints.size(), 1u);
    EXPECT_EQ(state.endpoints[0].host, "10.0.0.6");
    EXPECT_TRUE(state.endpoints[0].tls_enabled);
    EXPECT_EQ(state.endpoints[0].lan_host, "studio.lan");

    EXPECT_EQ(dns_->queryCount("gw2.example.com.", ns_t_a), 0u);
    EXPECT_EQ(dns_->queryCount(kStudio, ns_t_txt), 0u);
}

TEST_F(WideAreaResolverTest, NxdomainIsNotAFailure) {
    scriptTwoGateways();
    auto resolver = makeResolver();
    ASSERT_TRUE(resolver->runOnce());
    ASSERT_EQ(aggregator_.state().endpoints.size(), 2u);

    dns_->set(kBrowse, ns_t_ptr, DnsWireBuilder(5, true, ns_r_nxdomain)
        .question(kBrowse, ns_t_ptr)
        .message());

    EXPECT_TRUE(resolver->runOnce());
    EXPECT_EQ(resolver->tracker().consecutiveFailures(), 0);

    auto state = aggregator_.state();
    EXPECT_TRUE(state.endpoints.empty());
    EXPECT_EQ(state.status, "Wide: NXDOMAIN");
}

TEST_F(WideAreaResolverTest, NoResponseIsAFailure) {
    auto resolver = makeResolver();

    EXPECT_FALSE(resolver->runOnce());
    EXPECT_EQ(resolver->tracker().consecutiveFailures(), 1);
    EXPECT_EQ(aggregator_.state().status, "Wide: error");
    EXPECT_TRUE(aggregator_.state().endpoints.empty());

    EXPECT_FALSE(resolver->runOnce());
    EXPECT_EQ(resolver->tracker().consecutiveFailures(), 2);
    EXPECT_EQ(resolver->tracker().backoffDelayMs(), 10000);

    scriptTwoGateways();
    EXPECT_TRUE(resolver->runOnce());
    EXPECT_EQ(resolver->tracker().consecutiveFailures(), 0);
    EXPECT_EQ(resolver->tracker().backoffDelayMs(), 5000);
}

TEST_F(WideAreaResolverTest, DirectNegativeAfterSilentSystemPathIsAFailure) {
    auto system = std::make_unique<ScriptedDnsClient>();
    auto direct = std::make_unique<ScriptedDnsClient>();
    direct->set(kBrowse, ns_t_ptr, DnsWireBuilder(9, true, ns_r_nxdomain)
        .question(kBrowse, ns_t_ptr)
        .message());
    auto dns = std::make_shared<gatelink::net::FallbackDnsClient>(std::move(system), std::move(direct));
    WideAreaResolver resolver(config_, dns, aggregator_);

    EXPECT_FALSE(resolver.runOnce());
    EXPECT_EQ(resolver.tracker().consecutiveFailures(), 1);
    EXPECT_EQ(aggregator_.state().status, "Wide: error");
}

TEST_F(WideAreaResolverTest, RunCycleThrowsOnTransportError) {
    auto resolver = makeResolver();
    EXPECT_THROW(resolver->runCycle(), DnsTransportError);
}

TEST_F(WideAreaResolverTest, EmptyNoerrorReportsZero) {
    dns_->set(kBrowse, ns_t_ptr, DnsWireBuilder(1, true).question(kBrowse, ns_t_ptr).message());
    auto resolver = makeResolver();

    EXPECT_TRUE(resolver->runOnce());
    EXPECT_EQ(aggregator_.state().status, "Wide: 0");
}

TEST_F(WideAreaResolverTest, SkipsUnresolvableInstances) {
    dns_->set(kBrowse, ns_t_ptr, DnsWireBuilder(1, true)
        .ptr(DnsSection::Answer, kBrowse, kOffice)
        .ptr(DnsSection::Answer, kBrowse, kStudio)
        .srv(DnsSection::Additional, kOffice, 0, "gw1.example.com.")
        .srv(DnsSection::Additional, kStudio, 18790, "nowhere.example.com.")
        .message());
    auto resolver = makeResolver();

    EXPECT_TRUE(resolver->runOnce());
    auto state = aggregator_.state();
    EXPECT_TRUE(state.endpoints.empty());
    EXPECT_EQ(state.status, "Wide: 0");
    EXPECT_EQ(dns_->queryCount("nowhere.example.com.", ns_t_a), 1u);
    EXPECT_EQ(dns_->queryCount("nowhere.example.com.", ns_t_aaaa), 1u);
}

TEST_F(WideAreaResolverTest, FallsBackToAaaa) {
    dns_->set(kBrowse, ns_t_ptr, DnsWireBuilder(1, true)
        .ptr(DnsSection::Answer, kBrowse, kStudio)
        .srv(DnsSection::Additional, kStudio, 18790, "gw2.example.com.")
        .message());
    dns_->set("gw2.example.com.", ns_t_aaaa, DnsWireBuilder(2, true)
        .aaaa(DnsSection::Answer, "gw2.example.com.", "fd7a:115c:a1e0::6")
        .message());
    auto resolver = makeResolver();

    ASSERT_TRUE(resolver->runOnce());
    auto state = aggregator_.state();
    ASSERT_EQ(state.endpoints.size(), 1u);
    EXPECT_EQ(state.endpoints[0].host, "fd7a:115c:a1e0::6");
}

TEST_F(WideAreaResolverTest, LoopPublishesAndStops) {
    config_.backoff_base_ms = 10;
    config_.backoff_max_ms = 50;
    scriptTwoGateways();
    auto resolver = makeResolver();

    resolver->start();
    EXPECT_TRUE(resolver->isRunning());

    DiscoveryState state;
    ASSERT_TRUE(aggregator_.waitForChange(0, std::chrono::seconds(5), state));
    EXPECT_EQ(state.endpoints.size(), 2u);

    resolver->stop();
    EXPECT_FALSE(resolver->isRunning());
    resolver->stop();
}

TEST_F(WideAreaResolverTest, StopInterruptsLongBackoff) {
    config_.backoff_base_ms = 60000;
    config_.backoff_max_ms = 60000;
    auto resolver = makeResolver();

    resolver->start();
    const auto start = std::chrono::steady_clock::now();
    resolver->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(dns_->queries().size(), 0u);
}

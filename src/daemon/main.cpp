/**
 * @file main.cpp
 * @brief gatelinkd entry point
 *
 * Thin executable that wires the library components together:
 * - Local (mDNS) and wide-area (unicast DNS-SD) gateway discovery
 * - Device identity and token storage under the state directory
 * - GatewayLinkService, the local gRPC API
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include <gatelink/daemon/config.hpp>
#include <gatelink/utils/logger.hpp>
#include <gatelink/net/dns_client.hpp>
#include <gatelink/net/network_info.hpp>
#include <gatelink/core/discovery_aggregator.hpp>
#include <gatelink/core/local_discovery.hpp>
#include <gatelink/core/wide_area_resolver.hpp>
#include <gatelink/security/auth_token_store.hpp>
#include <gatelink/security/device_identity.hpp>
#include <gatelink/security/key_provider.hpp>
#include <gatelink/security/secure_store.hpp>
#include <gatelink/services/gateway_link_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>

using namespace gatelink;
using namespace gatelink::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};
static std::atomic<int> g_signal{0};

// Signal handler
void signalHandler(int signal) {
    g_signal.store(signal);
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::Logger::parseLevel(config.log_level));

    const bool wideAreaEnabled = !config.wide_area_domain.empty();

    LOG_INFO("Daemon", "gatelinkd starting...");
    LOG_INFO("Daemon", "Service type: {}", config.service_type);
    LOG_INFO("Daemon", "mDNS: {}:{}", config.mdns_addr, config.mdns_port);
    LOG_INFO("Daemon", "Wide-area domain: {}", wideAreaEnabled ? config.wide_area_domain : "(off)");
    LOG_INFO("Daemon", "State directory: {}", config.state_dir);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        const std::filesystem::path stateDir(config.state_dir);

        // Identity and token storage
        auto keys = std::make_shared<security::FileKeyProvider>(stateDir);
        auto store = std::make_shared<security::FileSecureStore>(stateDir / "tokens");

        services::LinkContext context;
        context.aggregator = std::make_shared<core::DiscoveryAggregator>(wideAreaEnabled);
        context.identity = std::make_shared<security::DeviceIdentityStore>(keys);
        context.tokens = std::make_shared<security::AuthTokenStore>(store, keys);

        try {
            auto identity = context.identity->loadOrCreate();
            LOG_INFO("Daemon", "Device id: {}", identity->deviceId());
        } catch (const security::CryptoError& e) {
            LOG_ERROR("Daemon", "Device identity unavailable: {}", e.what());
        }

        // Local discovery
        core::LocalDiscoveryConfig localConfig;
        localConfig.service_type = config.service_type;
        localConfig.mcast_addr = config.mdns_addr;
        localConfig.mcast_port = config.mdns_port;
        localConfig.interface_addr = config.mdns_interface;
        localConfig.resolve_timeout_ms = config.resolve_timeout_ms;

        core::LocalDiscovery localDiscovery(localConfig, *context.aggregator);
        localDiscovery.start();

        // Wide-area discovery
        std::unique_ptr<core::WideAreaResolver> wideArea;
        if (wideAreaEnabled) {
            auto nameservers = std::make_shared<net::NameserverSource>(config.dns_servers);
            auto dns = std::make_shared<net::FallbackDnsClient>(
                std::make_unique<net::SystemDnsClient>(config.dns_timeout_ms, nameservers),
                std::make_unique<net::DirectDnsClient>(
                    net::DirectDnsClient::fromSource(nameservers), config.dns_timeout_ms));

            core::WideAreaConfig wideConfig;
            wideConfig.service_type = config.service_type;
            wideConfig.domain = config.wide_area_domain;
            wideConfig.backoff_base_ms = config.backoff_base_ms;
            wideConfig.backoff_max_ms = config.backoff_max_ms;
            wideConfig.backoff_threshold = config.backoff_threshold;

            wideArea = std::make_unique<core::WideAreaResolver>(wideConfig, dns, *context.aggregator);
            wideArea->start();
        }

        // Local API
        auto service = std::make_unique<services::GatewayLinkServiceImpl>(context);

        grpc::ServerBuilder builder;
        builder.AddListeningPort(config.listen, grpc::InsecureServerCredentials());
        builder.RegisterService(service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start gRPC server on {}", config.listen);
            if (wideArea) {
                wideArea->stop();
            }
            localDiscovery.stop();
            return 1;
        }
        LOG_INFO("Daemon", "Gateway link service listening on {}", config.listen);
        LOG_INFO("Daemon", "gatelinkd is ready");

        // Main loop - report discovery changes until a shutdown signal arrives
        core::DiscoveryState state = context.aggregator->state();
        LOG_INFO("Daemon", "{} ({} gateway(s))", state.status, state.endpoints.size());
        while (!g_shutdown.load()) {
            if (context.aggregator->waitForChange(state.version, std::chrono::milliseconds(100), state)) {
                LOG_INFO("Daemon", "{} ({} gateway(s))", state.status, state.endpoints.size());
            }
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Received signal {}, shutting down...", g_signal.load());

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        if (wideArea) {
            wideArea->stop();
        }
        localDiscovery.stop();

        LOG_INFO("Daemon", "gatelinkd stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_FATAL("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}

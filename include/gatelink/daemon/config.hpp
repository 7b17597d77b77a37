/**
 * @file config.hpp
 * @brief gatelinkd configuration and CLI parsing
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/utils/string_utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace gatelink {
namespace daemon {

/**
 * @brief Default state directory: $HOME/.local/share/gatelink, or ./gatelink-state.
 */
inline std::string defaultStateDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.local/share/gatelink";
    }
    return "gatelink-state";
}

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string service_type = "_openclaw-gw._tcp.";
    std::string wide_area_domain;               ///< Empty = wide-area discovery off
    std::string mdns_addr = "224.0.0.251";
    uint16_t mdns_port = 5353;
    std::string mdns_interface;                 ///< Empty = default interface
    int resolve_timeout_ms = 5000;
    int dns_timeout_ms = 3000;
    std::vector<std::string> dns_servers;       ///< Overlay nameservers (--dns-server)

    // Wide-area backoff
    int64_t backoff_base_ms = 5000;
    int64_t backoff_max_ms = 60000;
    int backoff_threshold = 5;

    std::string state_dir = defaultStateDir();
    std::string listen = "127.0.0.1:5710";
    std::string log_level = "INFO";
    bool help = false;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "gatelinkd - Gateway discovery, device identity and token daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Discovery Options:\n"
              << "  --service-type <type>        DNS-SD service type (default: _openclaw-gw._tcp.)\n"
              << "  --wide-area-domain <domain>  Unicast DNS-SD domain; empty disables (default: empty)\n"
              << "  --mdns-addr <addr>           mDNS group address (default: 224.0.0.251)\n"
              << "  --mdns-port <port>           mDNS port (default: 5353)\n"
              << "  --mdns-interface <addr>      Local IPv4 address for multicast (default: any)\n"
              << "  --resolve-timeout-ms <ms>    mDNS resolve timeout (default: 5000)\n"
              << "\nDNS Options:\n"
              << "  --dns-timeout-ms <ms>        Timeout per DNS lookup path (default: 3000)\n"
              << "  --dns-server <ip>            Extra overlay nameserver, repeatable\n"
              << "  --backoff-base-ms <ms>       Wide-area poll interval (default: 5000)\n"
              << "  --backoff-max-ms <ms>        Backoff ceiling (default: 60000)\n"
              << "  --backoff-threshold <n>      Failures before the ceiling applies (default: 5)\n"
              << "\nService Options:\n"
              << "  --state-dir <dir>            Key and token directory (default: ~/.local/share/gatelink)\n"
              << "  --listen <addr:port>         Local gRPC API address (default: 127.0.0.1:5710)\n"
              << "  --log-level <level>          TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\n  --help                       Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --wide-area-domain gw.example.com --dns-server 100.100.100.100\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set on any error
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto badValue = [&config](const char* arg, const char* value) {
        std::cerr << "Error: Invalid value '" << value << "' for " << arg << "\n";
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--service-type") == 0) {
            config.service_type = value;
        } else if (std::strcmp(arg, "--wide-area-domain") == 0) {
            config.wide_area_domain = utils::trim(value);
        } else if (std::strcmp(arg, "--mdns-addr") == 0) {
            config.mdns_addr = value;
        } else if (std::strcmp(arg, "--mdns-port") == 0) {
            auto port = utils::parseInt(value);
            if (!port || *port <= 0 || *port > 65535) {
                return badValue(arg, value);
            }
            config.mdns_port = static_cast<uint16_t>(*port);
        } else if (std::strcmp(arg, "--mdns-interface") == 0) {
            config.mdns_interface = value;
        } else if (std::strcmp(arg, "--resolve-timeout-ms") == 0) {
            auto ms = utils::parseInt(value);
            if (!ms || *ms <= 0) {
                return badValue(arg, value);
            }
            config.resolve_timeout_ms = *ms;
        } else if (std::strcmp(arg, "--dns-timeout-ms") == 0) {
            auto ms = utils::parseInt(value);
            if (!ms || *ms <= 0) {
                return badValue(arg, value);
            }
            config.dns_timeout_ms = *ms;
        } else if (std::strcmp(arg, "--dns-server") == 0) {
            config.dns_servers.push_back(value);
        } else if (std::strcmp(arg, "--backoff-base-ms") == 0) {
            auto ms = utils::parseInt64(value);
            if (!ms || *ms <= 0) {
                return badValue(arg, value);
            }
            config.backoff_base_ms = *ms;
        } else if (std::strcmp(arg, "--backoff-max-ms") == 0) {
            auto ms = utils::parseInt64(value);
            if (!ms || *ms <= 0) {
                return badValue(arg, value);
            }
            config.backoff_max_ms = *ms;
        } else if (std::strcmp(arg, "--backoff-threshold") == 0) {
            auto n = utils::parseInt(value);
            if (!n || *n <= 0) {
                return badValue(arg, value);
            }
            config.backoff_threshold = *n;
        } else if (std::strcmp(arg, "--state-dir") == 0) {
            config.state_dir = value;
        } else if (std::strcmp(arg, "--listen") == 0) {
            config.listen = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.help = true;
            return config;
        }
    }

    if (config.backoff_max_ms < config.backoff_base_ms) {
        std::cerr << "Error: --backoff-max-ms must not be below --backoff-base-ms\n";
        config.help = true;
    }

    return config;
}

} // namespace daemon
} // namespace gatelink

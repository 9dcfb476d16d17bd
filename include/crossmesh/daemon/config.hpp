/**
 * @file config.hpp
 * @brief CrossMesh daemon configuration and CLI parsing
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/cluster_scanner.hpp"
#include "crossmesh/core/types.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace crossmesh {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string cluster_id = "default";
    std::string bind_addr = "0.0.0.0";
    uint16_t mesh_port = 15003;
    uint16_t proxy_port = 15001;
    uint16_t admin_port = 15002;
    std::string proxy_bind_addr = "127.0.0.1";
    std::string key_file;                         ///< Empty = ephemeral identity
    std::string relay_url;
    std::vector<std::string> advertise;           ///< Direct addresses published for us
    std::string namespace_filter;                 ///< Empty = export all namespaces
    std::string log_level = "INFO";
    bool help = false;
    bool error = false;                           ///< Set when the command line was invalid

    // Peers and exports
    std::map<core::ClusterId, core::NodeAddr> peers;   ///< --peer / --peer-relay
    std::vector<core::LocalService> exports;            ///< --export

    // Discovery
    int64_t cache_ttl_ms = 30000;
    int64_t discovery_timeout_ms = 5000;

    // Connections
    int64_t connect_timeout_ms = 5000;
    int64_t idle_timeout_ms = 300000;
    int resolve_attempts = 4;

    // Traffic
    int max_retries = 2;
    int breaker_threshold = 5;
    int64_t breaker_window_ms = 10000;
    int64_t breaker_cooldown_ms = 30000;
    std::string lb_algorithm = "round-robin";
    int64_t max_tasks = 1024;                     ///< Per accept loop; excess work is shed
};

/**
 * @brief Split on a delimiter, dropping empty pieces.
 */
inline std::vector<std::string> splitList(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(delimiter, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            parts.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

/**
 * @brief Parse "<cluster>=<nodeid>@<host:port>[,<host:port>...]".
 *
 * The address list may be empty ("b=<nodeid>@") for peers only reachable
 * through their relay.
 */
inline bool parsePeerSpec(const std::string& spec, core::ClusterId& cluster,
                          core::NodeAddr& addr) {
    size_t eq = spec.find('=');
    size_t at = spec.find('@', eq == std::string::npos ? 0 : eq);
    if (eq == std::string::npos || eq == 0 || at == std::string::npos) {
        return false;
    }
    cluster = spec.substr(0, eq);
    addr.node_id = spec.substr(eq + 1, at - eq - 1);
    if (addr.node_id.empty()) {
        return false;
    }
    addr.direct_addresses = splitList(spec.substr(at + 1), ',');
    return true;
}

/**
 * @brief Parse "<cluster>=<host:port>".
 */
inline bool parsePeerRelaySpec(const std::string& spec, core::ClusterId& cluster,
                               std::string& relay) {
    size_t eq = spec.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= spec.size()) {
        return false;
    }
    cluster = spec.substr(0, eq);
    relay = spec.substr(eq + 1);
    return true;
}

/**
 * @brief Parse "<name>.<ns>:<port>/<proto>=<addr:port>[,<addr:port>...]".
 *
 * "/<proto>" is optional and defaults to http. Throws std::invalid_argument
 * on a non-numeric port.
 */
inline bool parseExportSpec(const std::string& spec, core::LocalService& service) {
    size_t eq = spec.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    std::string key = spec.substr(0, eq);
    std::string instances = spec.substr(eq + 1);

    std::string protocol = "http";
    size_t slash = key.find('/');
    if (slash != std::string::npos) {
        protocol = key.substr(slash + 1);
        key = key.substr(0, slash);
    }

    size_t colon = key.rfind(':');
    size_t dot = key.find('.');
    if (colon == std::string::npos || dot == std::string::npos || dot > colon ||
        dot == 0 || dot + 1 == colon || protocol.empty()) {
        return false;
    }

    int port = std::stoi(key.substr(colon + 1));
    if (port <= 0 || port > 65535) {
        return false;
    }

    service = core::LocalService();
    service.info = core::ServiceInfo(key.substr(0, dot), key.substr(dot + 1, colon - dot - 1),
                                     static_cast<uint16_t>(port), protocol);

    for (const auto& instance : splitList(instances, ',')) {
        size_t sep = instance.rfind(':');
        if (sep == std::string::npos || sep == 0) {
            return false;
        }
        int instancePort = std::stoi(instance.substr(sep + 1));
        if (instancePort <= 0 || instancePort > 65535) {
            return false;
        }
        core::InstanceAddress address;
        address.address = instance.substr(0, sep);
        address.port = static_cast<uint16_t>(instancePort);
        service.instances.push_back(address);
    }
    return !service.instances.empty();
}

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "CrossMesh - Cross-Cluster Service Mesh Daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --cluster <id>          Cluster identifier (default: default)\n"
              << "  --bind <addr>           Bind address for mesh and admin servers (default: 0.0.0.0)\n"
              << "  --mesh-port <port>      Mesh transport port (default: 15003)\n"
              << "  --proxy-port <port>     HTTP interception port on 127.0.0.1 (default: 15001)\n"
              << "  --admin-port <port>     gRPC admin/status port (default: 15002)\n"
              << "  --key-file <path>       Node identity file, created on first start (default: ephemeral)\n"
              << "  --relay <host:port>     Relay address advertised for this node\n"
              << "  --advertise <a,b,...>   Direct addresses advertised for this node\n"
              << "  --namespace <ns>        Only export services of this namespace\n"
              << "  --log-level <level>     Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\nPeers and Services:\n"
              << "  --peer <c>=<nodeid>@<host:port>[,...]   Known peer cluster (repeatable)\n"
              << "  --peer-relay <c>=<host:port>            Relay for a peer cluster (repeatable)\n"
              << "  --export <name>.<ns>:<port>/<proto>=<addr:port>[,...]\n"
              << "                                          Local service to export (repeatable)\n"
              << "\nDiscovery Options:\n"
              << "  --cache-ttl-ms <ms>          Endpoint cache TTL (default: 30000)\n"
              << "  --discovery-timeout-ms <ms>  Remote discovery query budget (default: 5000)\n"
              << "\nConnection Options:\n"
              << "  --connect-timeout-ms <ms>    Per-path connect budget (default: 5000)\n"
              << "  --idle-timeout-ms <ms>       Idle connection reclaim (default: 300000)\n"
              << "  --resolve-attempts <n>       Address directory lookups before giving up (default: 4)\n"
              << "\nTraffic Options:\n"
              << "  --max-retries <n>            Retries of idempotent requests (default: 2)\n"
              << "  --breaker-threshold <n>      Failures that trip a breaker (default: 5)\n"
              << "  --breaker-window-ms <ms>     Failure counting window (default: 10000)\n"
              << "  --breaker-cooldown-ms <ms>   Open time before a trial (default: 30000)\n"
              << "  --lb <algorithm>             round-robin, least-connections, weighted-round-robin,\n"
              << "                               ewma-latency (default: round-robin)\n"
              << "  --max-tasks <n>              Concurrent streams or requests per listener (default: 1024)\n"
              << "\n  --help                  Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --cluster east --key-file /var/lib/crossmesh/node.key \\\n"
              << "      --export payment-service.prod:8080/http=10.0.0.5:8080 \\\n"
              << "      --peer west=<nodeid>@10.1.0.2:15003\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help and error are set on invalid input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto fail = [&config](const std::string& message) {
        std::cerr << "Error: " << message << "\n";
        config.help = true;
        config.error = true;
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
            return fail(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--cluster") == 0) {
                config.cluster_id = value;
            } else if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--mesh-port") == 0) {
                config.mesh_port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--proxy-port") == 0) {
                config.proxy_port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--admin-port") == 0) {
                config.admin_port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--key-file") == 0) {
                config.key_file = value;
            } else if (std::strcmp(arg, "--relay") == 0) {
                config.relay_url = value;
            } else if (std::strcmp(arg, "--advertise") == 0) {
                config.advertise = splitList(value, ',');
            } else if (std::strcmp(arg, "--namespace") == 0) {
                config.namespace_filter = value;
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--peer") == 0) {
                core::ClusterId cluster;
                core::NodeAddr addr;
                if (!parsePeerSpec(value, cluster, addr)) {
                    return fail(std::string("Invalid --peer value ") + value);
                }
                auto& known = config.peers[cluster];
                known.node_id = addr.node_id;
                known.direct_addresses = addr.direct_addresses;
            } else if (std::strcmp(arg, "--peer-relay") == 0) {
                core::ClusterId cluster;
                std::string relay;
                if (!parsePeerRelaySpec(value, cluster, relay)) {
                    return fail(std::string("Invalid --peer-relay value ") + value);
                }
                config.peers[cluster].relay_url = relay;
            } else if (std::strcmp(arg, "--export") == 0) {
                core::LocalService service;
                if (!parseExportSpec(value, service)) {
                    return fail(std::string("Invalid --export value ") + value);
                }
                config.exports.push_back(service);
            } else if (std::strcmp(arg, "--cache-ttl-ms") == 0) {
                config.cache_ttl_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--discovery-timeout-ms") == 0) {
                config.discovery_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--connect-timeout-ms") == 0) {
                config.connect_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--idle-timeout-ms") == 0) {
                config.idle_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--resolve-attempts") == 0) {
                config.resolve_attempts = std::stoi(value);
            } else if (std::strcmp(arg, "--max-retries") == 0) {
                config.max_retries = std::stoi(value);
            } else if (std::strcmp(arg, "--breaker-threshold") == 0) {
                config.breaker_threshold = std::stoi(value);
            } else if (std::strcmp(arg, "--breaker-window-ms") == 0) {
                config.breaker_window_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--breaker-cooldown-ms") == 0) {
                config.breaker_cooldown_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--lb") == 0) {
                config.lb_algorithm = value;
            } else if (std::strcmp(arg, "--max-tasks") == 0) {
                config.max_tasks = std::stoll(value);
                if (config.max_tasks <= 0) {
                    return fail(std::string("--max-tasks must be positive: ") + value);
                }
            } else {
                return fail(std::string("Unknown option ") + arg);
            }
        } catch (const std::logic_error&) {
            return fail(std::string("Invalid number for ") + arg + ": " + value);
        }
    }

    return config;
}

}  // namespace daemon
}  // namespace crossmesh

/**
 * @file main.cpp
 * @brief CrossMesh daemon entry point
 *
 * This is the thin executable that wires together all the library components:
 * - gRPC mesh transport and the discovery server answering peers
 * - Mesh agent registering this cluster's exported services
 * - Traffic router fed by the local HTTP interception listener
 * - Admin service exposing read-only status
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include <crossmesh/daemon/config.hpp>
#include <crossmesh/net/platform.hpp>
#include <crossmesh/utils/logger.hpp>
#include <crossmesh/utils/node_identity.hpp>
#include <crossmesh/core/address_directory.hpp>
#include <crossmesh/core/cluster_scanner.hpp>
#include <crossmesh/core/connection_manager.hpp>
#include <crossmesh/core/discovery_manager.hpp>
#include <crossmesh/core/discovery_server.hpp>
#include <crossmesh/core/load_balancer.hpp>
#include <crossmesh/core/mesh_agent.hpp>
#include <crossmesh/core/route_table.hpp>
#include <crossmesh/core/traffic_router.hpp>
#include <crossmesh/services/admin_service.hpp>
#include <crossmesh/services/grpc_endpoint.hpp>
#include <crossmesh/services/http_forwarder.hpp>
#include <crossmesh/services/http_proxy_interceptor.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace crossmesh;
using namespace crossmesh::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int /*signal*/) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? 1 : 0;
    }

    utils::Logger::instance().setLevel(utils::logLevelFromString(config.log_level));

    auto algorithm = core::algorithmFromString(config.lb_algorithm);
    if (!algorithm) {
        LOG_ERROR("Daemon", "Unknown load-balancing algorithm '{}'", config.lb_algorithm);
        return 1;
    }

    net::SocketInitializer sockets;
    if (!sockets.isInitialized()) {
        LOG_ERROR("Daemon", "Socket layer failed to initialize");
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        const std::string node_id = config.key_file.empty()
            ? utils::generateNodeId()
            : utils::loadOrCreateNodeId(config.key_file);

        LOG_INFO("Daemon", "CrossMesh starting...");
        LOG_INFO("Daemon", "Cluster: {}", config.cluster_id);
        LOG_INFO("Daemon", "Node: {}", node_id);
        if (config.key_file.empty()) {
            LOG_WARN("Daemon", "No --key-file given, identity will change on restart");
        }

        // Transport
        services::GrpcEndpointConfig endpoint_config;
        endpoint_config.node_id = node_id;
        endpoint_config.cluster_id = config.cluster_id;
        endpoint_config.bind_address = config.bind_addr;
        endpoint_config.port = config.mesh_port;
        endpoint_config.relay_url = config.relay_url;
        endpoint_config.advertise_addresses = config.advertise;
        endpoint_config.server_idle_timeout = std::chrono::milliseconds(config.idle_timeout_ms);

        auto endpoint = std::make_shared<services::GrpcEndpoint>(endpoint_config);
        if (!endpoint->start()) {
            LOG_ERROR("Daemon", "Failed to start mesh transport on {}:{}",
                      config.bind_addr, config.mesh_port);
            return 1;
        }

        // Directory and local services
        auto directory = std::make_shared<core::StaticAddressDirectory>();
        auto scanner = std::make_shared<core::StaticClusterScanner>();
        for (const auto& service : config.exports) {
            scanner->upsertService(service);
        }

        core::ConnectionManagerConfig connection_config;
        connection_config.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
        connection_config.idle_timeout = std::chrono::milliseconds(config.idle_timeout_ms);
        connection_config.resolve_attempts = config.resolve_attempts;
        auto connections = std::make_shared<core::ConnectionManager>(endpoint, directory,
                                                                     connection_config);

        core::DiscoveryConfig discovery_config;
        discovery_config.local_cluster = config.cluster_id;
        discovery_config.cache_ttl = std::chrono::milliseconds(config.cache_ttl_ms);
        discovery_config.query_timeout = std::chrono::milliseconds(config.discovery_timeout_ms);
        auto discovery = std::make_shared<core::DiscoveryManager>(discovery_config, scanner,
                                                                  connections);

        // Statically configured peers: address, pinned identity, registry entry
        for (const auto& peer : config.peers) {
            if (!directory->publish(peer.first, peer.second)) {
                LOG_ERROR("Daemon", "Peer {} has an invalid node id", peer.first);
                return 1;
            }
            connections->pinIdentity(peer.first, peer.second.node_id);

            core::ClusterInfo info;
            info.cluster_id = peer.first;
            info.node_id = peer.second.node_id;
            info.relay_url = peer.second.relay_url;
            info.direct_addresses = peer.second.direct_addresses;
            discovery->registerCluster(info);
            LOG_INFO("Daemon", "Peer {}: {}", peer.first, peer.second.toString());
        }

        if (!connections->start()) {
            LOG_ERROR("Daemon", "Failed to start connection manager");
            return 1;
        }

        core::MeshAgentConfig agent_config;
        agent_config.cluster_id = config.cluster_id;
        agent_config.relay_url = config.relay_url;
        agent_config.advertise_addresses = config.advertise;
        agent_config.namespace_filter = config.namespace_filter;
        auto agent = std::make_shared<core::MeshAgent>(agent_config, endpoint, directory,
                                                       scanner, discovery);
        if (!agent->start()) {
            LOG_ERROR("Daemon", "Failed to start mesh agent");
            return 1;
        }

        // Traffic plane
        auto routes = std::make_shared<core::RouteTable>(discovery, *algorithm);

        core::BreakerConfig breaker_config;
        breaker_config.failure_threshold = config.breaker_threshold;
        breaker_config.window = std::chrono::milliseconds(config.breaker_window_ms);
        breaker_config.cooldown = std::chrono::milliseconds(config.breaker_cooldown_ms);

        core::TrafficPolicy policy;
        policy.max_retries = config.max_retries;
        policy.max_inflight = static_cast<size_t>(config.max_tasks);

        auto router = std::make_shared<core::TrafficRouter>(config.cluster_id, routes,
                                                            connections, discovery,
                                                            breaker_config, policy);
        router->setLocalForwarder(std::make_shared<services::HttpForwarder>());

        core::DiscoveryServerConfig server_config;
        server_config.max_tasks = static_cast<size_t>(config.max_tasks);
        core::DiscoveryServer discovery_server(endpoint, discovery, server_config);
        discovery_server.setInboundHandler(
            [router](const proxy::StreamHeader& header, core::Stream& stream,
                     core::FrameReader& reader) {
                router->serveInbound(header, stream, reader);
            });
        if (!discovery_server.start()) {
            LOG_ERROR("Daemon", "Failed to start discovery server");
            return 1;
        }

        services::HttpProxyConfig proxy_config;
        proxy_config.bind_address = config.proxy_bind_addr;
        proxy_config.port = config.proxy_port;
        auto interceptor = std::make_shared<services::HttpProxyInterceptor>(proxy_config);
        if (!router->attach(interceptor)) {
            LOG_ERROR("Daemon", "Failed to start HTTP interception on port {}", config.proxy_port);
            discovery_server.stop();
            return 1;
        }

        // Admin gRPC server
        auto admin_service = std::make_unique<services::AdminServiceImpl>(agent, connections,
                                                                          discovery, router);
        std::string admin_addr = config.bind_addr + ":" + std::to_string(config.admin_port);
        grpc::ServerBuilder admin_builder;
        admin_builder.AddListeningPort(admin_addr, grpc::InsecureServerCredentials());
        admin_builder.RegisterService(admin_service.get());
        auto admin_server = admin_builder.BuildAndStart();

        if (!admin_server) {
            LOG_ERROR("Daemon", "Failed to start admin server on {}", admin_addr);
            router->stop();
            discovery_server.stop();
            return 1;
        }
        LOG_INFO("Daemon", "Admin server listening on {}", admin_addr);
        LOG_INFO("Daemon", "CrossMesh is ready ({} services exported, {} peers)",
                 config.exports.size(), config.peers.size());

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        admin_server->Shutdown(deadline);

        router->stop();
        discovery_server.stop();
        agent->stop();
        connections->shutdown();
        endpoint->close();

        LOG_INFO("Daemon", "CrossMesh stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}

/**
 * @file discovery_manager.hpp
 * @brief Cross-cluster service resolution with a TTL cache.
 *
 * resolve() answers "service S in namespace N of cluster C":
 * - C is the local cluster: straight from the ClusterScanner snapshot
 * - cached and unexpired: from the cache
 * - otherwise: one DiscoveryQuery over the peer connection; concurrent
 *   misses for the same route share that query
 *
 * The manager also owns the ClusterInfo registry and answers queries
 * from peers (serveQuery).
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/cluster_scanner.hpp"
#include "crossmesh/core/connection_manager.hpp"
#include "crossmesh/core/export.hpp"
#include "crossmesh/core/sharded_map.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/core/types.hpp"

#include "crossmesh/proto/discovery.pb.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace crossmesh {
namespace core {

/**
 * @struct DiscoveryConfig
 * @brief Discovery manager settings.
 */
struct CROSSMESH_CORE_API DiscoveryConfig {
    ClusterId local_cluster;
    std::chrono::milliseconds cache_ttl{30000};
    std::chrono::milliseconds query_timeout{5000};
};

/**
 * @struct CacheEntryStatus
 * @brief One live cache entry, for the status surface.
 */
struct CROSSMESH_CORE_API CacheEntryStatus {
    std::string route;
    size_t endpoint_count = 0;
    std::chrono::milliseconds expires_in{0};
};

/**
 * @class DiscoveryManager
 * @brief Resolves CrossClusterRoutes to ServiceEndpoints.
 *
 * Usage:
 * @code
 * DiscoveryManager discovery(config, scanner, connections);
 *
 * CrossClusterRoute route{"cluster-b", "payment-service", "default", 0};
 * auto endpoints = discovery.resolve(route);   // throws MeshError
 * @endcode
 */
class CROSSMESH_CORE_API DiscoveryManager {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    DiscoveryManager(const DiscoveryConfig& config,
                     std::shared_ptr<ClusterScanner> scanner,
                     std::shared_ptr<ConnectionManager> connections);

    DiscoveryManager(const DiscoveryManager&) = delete;
    DiscoveryManager& operator=(const DiscoveryManager&) = delete;

    // =========================================================================
    // Resolution
    // =========================================================================

    /**
     * @brief Resolve a route to its instances.
     * @throws MeshError NOT_FOUND, UNREACHABLE or IDENTITY_MISMATCH.
     */
    std::vector<ServiceEndpoint> resolve(const CrossClusterRoute& route);

    /**
     * @brief Resolve within the caller's deadline.
     *
     * A peer query is bounded by the earlier of the deadline and the query
     * timeout. Once the caller's deadline has passed the failure is TIMEOUT.
     */
    std::vector<ServiceEndpoint> resolve(const CrossClusterRoute& route, const Deadline& deadline);

    /**
     * @brief Answer a query from a peer using the local catalogue.
     */
    discovery::DiscoveryResponse serveQuery(const discovery::DiscoveryQuery& query);

    /**
     * @brief Local services, optionally restricted to one namespace.
     */
    std::vector<ServiceInfo> discoverLocalServices(const std::string& nsFilter = "");

    // =========================================================================
    // Cluster registry
    // =========================================================================

    /**
     * @brief Store info, replacing any previous record for the cluster.
     * @return True if the record is new or differs from the previous one.
     */
    bool registerCluster(const ClusterInfo& info);

    /**
     * @brief Replace an existing record. False if the cluster is unknown.
     */
    bool updateCluster(const ClusterInfo& info);

    bool removeCluster(const ClusterId& cluster);

    std::optional<ClusterInfo> getClusterInfo(const ClusterId& cluster) const;

    std::vector<ClusterInfo> listClusters() const;

    /**
     * @brief Clusters known to export service name in namespace ns.
     */
    std::vector<ClusterId> findService(const std::string& name, const std::string& ns) const;

    // =========================================================================
    // Cache
    // =========================================================================

    void invalidate(const CrossClusterRoute& route);

    /**
     * @brief Drop every cache entry for one cluster.
     */
    void invalidateCluster(const ClusterId& cluster);

    /**
     * @brief Remove expired and failed entries.
     * @return Number of entries removed.
     */
    size_t purgeExpired();

    std::vector<CacheEntryStatus> cacheSnapshot() const;

    /// Remote queries sent so far.
    uint64_t queriesSent() const { return queriesSent_.load(); }

    uint64_t queriesServed() const { return queriesServed_.load(); }

    const ClusterId& localCluster() const { return config_.local_cluster; }

private:
    struct CacheEntry {
        std::mutex mutex;
        CrossClusterRoute route;
        std::vector<ServiceEndpoint> endpoints;
        TimePoint expires;
        bool valid = false;
        bool loading = false;
        std::shared_future<std::vector<ServiceEndpoint>> inflight;
    };

    DiscoveryConfig config_;
    std::shared_ptr<ClusterScanner> scanner_;
    std::shared_ptr<ConnectionManager> connections_;

    ShardedMap<std::string, CacheEntry> cache_;
    ShardedMap<ClusterId, ClusterInfo> clusters_;

    std::atomic<uint64_t> queriesSent_{0};
    std::atomic<uint64_t> queriesServed_{0};

    std::vector<ServiceEndpoint> resolveLocal(const CrossClusterRoute& route);
    std::vector<ServiceEndpoint> resolveRemote(const CrossClusterRoute& route,
                                               const Deadline* callerDeadline);

    // One query round trip; throws MeshError.
    std::vector<ServiceEndpoint> queryPeer(const CrossClusterRoute& route,
                                           const Deadline* callerDeadline);

    void absorbClusterInfo(const CrossClusterRoute& route, const discovery::ClusterInfo& info);
};

}  // namespace core
}  // namespace crossmesh

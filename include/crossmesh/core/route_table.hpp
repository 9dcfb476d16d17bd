/**
 * @file route_table.hpp
 * @brief Destination classification and per-route endpoint selection.
 *
 * A destination "host[:port]" maps to a CrossClusterRoute either through
 * an explicit entry or through the naming convention
 * "<service>.<namespace>.<cluster>.mesh".
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/discovery_manager.hpp"
#include "crossmesh/core/export.hpp"
#include "crossmesh/core/load_balancer.hpp"
#include "crossmesh/core/sharded_map.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/core/types.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crossmesh {
namespace core {

/// Domain suffix of convention-named hosts.
constexpr const char* MESH_DOMAIN_SUFFIX = ".mesh";

/**
 * @struct RouteEntry
 * @brief An explicit host -> route mapping.
 */
struct CROSSMESH_CORE_API RouteEntry {
    std::string host;  ///< Lowercase, without port
    CrossClusterRoute route;
    LoadBalancingAlgorithm algorithm = LoadBalancingAlgorithm::ROUND_ROBIN;
};

/**
 * @brief Split "host[:port]" and lowercase the host.
 * @return False if a port is present but invalid.
 */
CROSSMESH_CORE_API bool splitAuthority(const std::string& authority, std::string& host,
                                       uint16_t& port);

/**
 * @class RouteTable
 * @brief Classifies destinations and picks an endpoint for each request.
 *
 * Usage:
 * @code
 * RouteTable routes(discovery, LoadBalancingAlgorithm::ROUND_ROBIN);
 * auto route = routes.classify("payment-service.default.cluster-b.mesh:8080");
 * if (route) {
 *     ServiceEndpoint target = routes.select(*route);
 * }
 * @endcode
 */
class CROSSMESH_CORE_API RouteTable {
public:
    RouteTable(std::shared_ptr<DiscoveryManager> discovery,
               LoadBalancingAlgorithm defaultAlgorithm);

    RouteTable(const RouteTable&) = delete;
    RouteTable& operator=(const RouteTable&) = delete;

    /**
     * @brief Add or replace an explicit route for host.
     */
    void addRoute(const RouteEntry& entry);

    bool removeRoute(const std::string& host);

    std::vector<RouteEntry> routes() const;

    /**
     * @brief Map "host[:port]" to a route, or std::nullopt if it is not a mesh destination.
     */
    std::optional<CrossClusterRoute> classify(const std::string& authority) const;

    /**
     * @brief Resolve the route and apply its balancing policy.
     * @throws MeshError NO_ENDPOINTS, NOT_FOUND, UNREACHABLE, IDENTITY_MISMATCH.
     */
    ServiceEndpoint select(const CrossClusterRoute& route);

    /**
     * @brief As select(route), with resolution bounded by deadline.
     */
    ServiceEndpoint select(const CrossClusterRoute& route, const Deadline& deadline);

    EndpointMetrics& metrics() { return metrics_; }

    LoadBalancingAlgorithm algorithmFor(const CrossClusterRoute& route) const;

private:
    std::shared_ptr<DiscoveryManager> discovery_;
    LoadBalancingAlgorithm defaultAlgorithm_;

    mutable std::shared_mutex routesMutex_;
    std::unordered_map<std::string, RouteEntry> explicit_;
    std::unordered_map<std::string, LoadBalancingAlgorithm> algorithmByRoute_;

    ShardedMap<std::string, LoadBalancer> balancers_;
    EndpointMetrics metrics_;

    ServiceEndpoint pick(const CrossClusterRoute& route,
                         const std::vector<ServiceEndpoint>& candidates);

    // Caller holds routesMutex_.
    bool routeInUse(const std::string& routeKey) const;
};

}  // namespace core
}  // namespace crossmesh

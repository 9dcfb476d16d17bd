/**
 * @file types.hpp
 * @brief Value types shared by the mesh components.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace crossmesh {
namespace core {

/// Opaque, unique per cluster. Primary key for cluster-scoped state.
using ClusterId = std::string;

/// Public identity of a cluster's mesh node (64 lowercase hex characters).
using NodeId = std::string;

/**
 * @enum PathQuality
 * @brief How a peer connection currently reaches the remote node.
 */
enum class PathQuality {
    RELAYED,  ///< Traffic flows through the relay
    DIRECT    ///< Traffic flows over a direct address
};

inline const char* pathQualityToString(PathQuality quality) {
    switch (quality) {
        case PathQuality::RELAYED: return "relayed";
        case PathQuality::DIRECT: return "direct";
        default: return "unknown";
    }
}

/**
 * @struct NodeAddr
 * @brief Dialable address of a node: identity plus path hints.
 */
struct CROSSMESH_CORE_API NodeAddr {
    NodeId node_id;
    std::string relay_url;                      ///< Empty when no relay is known
    std::vector<std::string> direct_addresses;  ///< "host:port"

    bool hasRelay() const { return !relay_url.empty(); }

    std::string toString() const;
};

/**
 * @struct ServiceInfo
 * @brief A service exported by a cluster. Compared by value.
 */
struct CROSSMESH_CORE_API ServiceInfo {
    std::string name;
    std::string ns;
    uint16_t port = 0;
    std::string protocol = "http";

    ServiceInfo() = default;
    ServiceInfo(std::string name_, std::string ns_, uint16_t port_, std::string protocol_)
        : name(std::move(name_)), ns(std::move(ns_)), port(port_), protocol(std::move(protocol_)) {}

    /// "name.namespace:port/protocol"
    std::string key() const;

    bool operator==(const ServiceInfo& other) const {
        return name == other.name && ns == other.ns &&
               port == other.port && protocol == other.protocol;
    }
    bool operator!=(const ServiceInfo& other) const { return !(*this == other); }
    bool operator<(const ServiceInfo& other) const { return key() < other.key(); }
};

/**
 * @brief CRC64 over the sorted service keys. Order-independent.
 */
CROSSMESH_CORE_API uint64_t servicesFingerprint(const std::vector<ServiceInfo>& services);

/**
 * @struct ClusterInfo
 * @brief Everything known about one cluster. Replaced wholesale, never merged.
 */
struct CROSSMESH_CORE_API ClusterInfo {
    ClusterId cluster_id;
    NodeId node_id;
    std::string relay_url;
    std::vector<std::string> direct_addresses;
    std::vector<ServiceInfo> services;

    uint64_t fingerprint() const { return servicesFingerprint(services); }

    NodeAddr nodeAddr() const {
        return NodeAddr{node_id, relay_url, direct_addresses};
    }

    /// Same identity, paths and service set.
    bool sameAs(const ClusterInfo& other) const;
};

/**
 * @struct ServiceEndpoint
 * @brief One resolved instance of a service.
 */
struct CROSSMESH_CORE_API ServiceEndpoint {
    ClusterId cluster;
    std::string service;
    std::string ns;
    std::string address;
    uint16_t port = 0;
    std::string protocol = "http";
    uint32_t weight = 1;

    /// "address:port"; identifies the instance for load-balancing metrics.
    std::string key() const { return address + ":" + std::to_string(port); }

    bool operator==(const ServiceEndpoint& other) const {
        return cluster == other.cluster && service == other.service && ns == other.ns &&
               address == other.address && port == other.port;
    }
};

/**
 * @struct CrossClusterRoute
 * @brief "service S in namespace N of cluster C". Cache and lookup key.
 */
struct CROSSMESH_CORE_API CrossClusterRoute {
    ClusterId cluster;
    std::string service;
    std::string ns;
    uint16_t port = 0;  ///< 0 = the service's exported port

    /// "service.namespace.cluster:port"
    std::string key() const;

    /// Breaker key: one breaker per (cluster, service).
    std::string serviceKey() const { return cluster + "/" + ns + "/" + service; }

    bool operator==(const CrossClusterRoute& other) const {
        return cluster == other.cluster && service == other.service &&
               ns == other.ns && port == other.port;
    }
};

}  // namespace core
}  // namespace crossmesh

namespace std {
template<>
struct hash<crossmesh::core::CrossClusterRoute> {
    size_t operator()(const crossmesh::core::CrossClusterRoute& route) const {
        return std::hash<std::string>()(route.key());
    }
};
}  // namespace std

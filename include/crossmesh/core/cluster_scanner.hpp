/**
 * @file cluster_scanner.hpp
 * @brief Catalogue of the services running in the local cluster.
 *
 * Consumers receive immutable snapshots; an update publishes a new
 * snapshot and notifies watchers with it.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"
#include "crossmesh/core/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace crossmesh {
namespace core {

/**
 * @struct InstanceAddress
 * @brief Where one instance of a local service listens.
 */
struct CROSSMESH_CORE_API InstanceAddress {
    std::string address;
    uint16_t port = 0;
    uint32_t weight = 1;
};

/**
 * @struct LocalService
 * @brief A local service with its live instances.
 */
struct CROSSMESH_CORE_API LocalService {
    ServiceInfo info;
    std::vector<InstanceAddress> instances;
    std::map<std::string, std::string> metadata;
};

/**
 * @struct ServiceSnapshot
 * @brief Immutable view of the local catalogue at one version.
 */
struct CROSSMESH_CORE_API ServiceSnapshot {
    uint64_t version = 0;
    std::vector<LocalService> services;

    const LocalService* find(const std::string& name, const std::string& ns) const;

    std::vector<ServiceInfo> serviceInfos() const;
};

using SnapshotPtr = std::shared_ptr<const ServiceSnapshot>;

/**
 * @class ClusterScanner
 * @brief Source of local service snapshots and change events.
 */
class CROSSMESH_CORE_API ClusterScanner {
public:
    using ChangeCallback = std::function<void(const SnapshotPtr&)>;

    virtual ~ClusterScanner() = default;

    /**
     * @brief Current services, restricted to one namespace unless nsFilter is empty.
     */
    virtual SnapshotPtr listServices(const std::string& nsFilter = "") = 0;

    /**
     * @brief Subscribe to catalogue changes.
     * @return Token for unwatch().
     */
    virtual uint64_t watchChanges(ChangeCallback callback) = 0;

    virtual void unwatch(uint64_t token) = 0;
};

/**
 * @class StaticClusterScanner
 * @brief In-memory catalogue fed by configuration or tests.
 */
class CROSSMESH_CORE_API StaticClusterScanner : public ClusterScanner {
public:
    StaticClusterScanner();

    SnapshotPtr listServices(const std::string& nsFilter = "") override;
    uint64_t watchChanges(ChangeCallback callback) override;
    void unwatch(uint64_t token) override;

    /**
     * @brief Add or replace a service (matched by name and namespace).
     */
    void upsertService(const LocalService& service);

    bool removeService(const std::string& name, const std::string& ns);

private:
    std::mutex mutex_;
    SnapshotPtr current_;
    uint64_t nextToken_;
    std::map<uint64_t, ChangeCallback> watchers_;

    // Publish next and notify watchers. Must be called without mutex_ held.
    void publish(SnapshotPtr next);
};

}  // namespace core
}  // namespace crossmesh

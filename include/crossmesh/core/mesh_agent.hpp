/**
 * @file mesh_agent.hpp
 * @brief Periodic local discovery and self-registration of this cluster.
 *
 * The agent keeps this cluster's ClusterInfo current: it rescans the local
 * services on an interval (and whenever the scanner reports a change),
 * re-registers the ClusterInfo with the DiscoveryManager and republishes
 * the NodeAddr to the AddressDirectory. It also drives cache purging.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/address_directory.hpp"
#include "crossmesh/core/cluster_scanner.hpp"
#include "crossmesh/core/discovery_manager.hpp"
#include "crossmesh/core/export.hpp"
#include "crossmesh/core/transport.hpp"
#include "crossmesh/core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace crossmesh {
namespace core {

/**
 * @struct MeshAgentConfig
 * @brief Agent identity and schedule.
 */
struct CROSSMESH_CORE_API MeshAgentConfig {
    ClusterId cluster_id;
    std::string relay_url;
    std::vector<std::string> advertise_addresses;  ///< Empty = the endpoint's own
    std::string namespace_filter;                  ///< Empty = all namespaces
    std::chrono::milliseconds discovery_interval{30000};
    std::chrono::milliseconds registration_interval{60000};
    std::chrono::milliseconds purge_interval{5000};
};

/**
 * @class MeshAgent
 * @brief Background loop that keeps the local ClusterInfo published.
 */
class CROSSMESH_CORE_API MeshAgent {
public:
    MeshAgent(const MeshAgentConfig& config,
              std::shared_ptr<Endpoint> endpoint,
              std::shared_ptr<AddressDirectory> directory,
              std::shared_ptr<ClusterScanner> scanner,
              std::shared_ptr<DiscoveryManager> discovery);

    ~MeshAgent();

    MeshAgent(const MeshAgent&) = delete;
    MeshAgent& operator=(const MeshAgent&) = delete;

    /**
     * @brief Register once synchronously, then start the background loop.
     */
    bool start();

    void stop();

    /**
     * @brief Rescan local services.
     * @return True if the service set changed since the previous scan.
     */
    bool discoverOnce();

    /**
     * @brief Register and publish the current ClusterInfo.
     * @return False if publication to the directory failed.
     */
    bool registerOnce();

    ClusterInfo localClusterInfo() const;

    std::vector<ServiceInfo> localServices() const;

    uint64_t registrations() const { return registrations_.load(); }

private:
    MeshAgentConfig config_;
    std::shared_ptr<Endpoint> endpoint_;
    std::shared_ptr<AddressDirectory> directory_;
    std::shared_ptr<ClusterScanner> scanner_;
    std::shared_ptr<DiscoveryManager> discovery_;

    mutable std::mutex stateMutex_;
    std::vector<ServiceInfo> services_;
    uint64_t servicesFingerprint_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> rescanRequested_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    std::thread loopThread_;
    uint64_t watchToken_ = 0;

    std::atomic<uint64_t> registrations_{0};

    void loop();
};

}  // namespace core
}  // namespace crossmesh

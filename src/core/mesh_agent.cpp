/**
 * @file mesh_agent.cpp
 * @brief MeshAgent implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/mesh_agent.hpp"
#include "crossmesh/utils/logger.hpp"
#include "crossmesh/utils/node_identity.hpp"

#include <algorithm>

namespace crossmesh {
namespace core {

MeshAgent::MeshAgent(const MeshAgentConfig& config,
                     std::shared_ptr<Endpoint> endpoint,
                     std::shared_ptr<AddressDirectory> directory,
                     std::shared_ptr<ClusterScanner> scanner,
                     std::shared_ptr<DiscoveryManager> discovery)
    : config_(config)
    , endpoint_(std::move(endpoint))
    , directory_(std::move(directory))
    , scanner_(std::move(scanner))
    , discovery_(std::move(discovery))
{
    LOG_INFO("MeshAgent", "Cluster '{}' node {}", config_.cluster_id,
             utils::shortNodeId(endpoint_->nodeId()));
}

MeshAgent::~MeshAgent() {
    stop();
}

bool MeshAgent::start() {
    if (running_.load()) {
        LOG_WARN("MeshAgent", "Already running");
        return false;
    }

    discoverOnce();
    if (!registerOnce()) {
        LOG_WARN("MeshAgent", "Initial registration was not published; will retry");
    }

    watchToken_ = scanner_->watchChanges([this](const SnapshotPtr&) {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            rescanRequested_.store(true);
        }
        wakeCv_.notify_all();
    });

    running_.store(true);
    loopThread_ = std::thread(&MeshAgent::loop, this);

    LOG_INFO("MeshAgent", "Started (discovery every {}ms, registration every {}ms)",
             config_.discovery_interval.count(), config_.registration_interval.count());
    return true;
}

void MeshAgent::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wakeCv_.notify_all();

    scanner_->unwatch(watchToken_);
    if (loopThread_.joinable()) {
        loopThread_.join();
    }
    LOG_INFO("MeshAgent", "Stopped");
}

bool MeshAgent::discoverOnce() {
    auto services = discovery_->discoverLocalServices(config_.namespace_filter);
    std::sort(services.begin(), services.end());
    uint64_t fingerprint = servicesFingerprint(services);

    std::lock_guard<std::mutex> lock(stateMutex_);
    bool changed = fingerprint != servicesFingerprint_ || services.size() != services_.size();
    services_ = std::move(services);
    servicesFingerprint_ = fingerprint;

    if (changed) {
        LOG_INFO("MeshAgent", "Local services changed: {} exported", services_.size());
    }
    return changed;
}

ClusterInfo MeshAgent::localClusterInfo() const {
    ClusterInfo info;
    info.cluster_id = config_.cluster_id;
    info.node_id = endpoint_->nodeId();
    info.relay_url = config_.relay_url;
    info.direct_addresses = config_.advertise_addresses.empty()
                                ? endpoint_->localAddr().direct_addresses
                                : config_.advertise_addresses;

    std::lock_guard<std::mutex> lock(stateMutex_);
    info.services = services_;
    return info;
}

std::vector<ServiceInfo> MeshAgent::localServices() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return services_;
}

bool MeshAgent::registerOnce() {
    ClusterInfo info = localClusterInfo();
    discovery_->registerCluster(info);
    registrations_.fetch_add(1);

    if (!directory_->publish(config_.cluster_id, info.nodeAddr())) {
        LOG_WARN("MeshAgent", "Failed to publish address for '{}'", config_.cluster_id);
        return false;
    }
    LOG_DEBUG("MeshAgent", "Registered '{}' ({} services, fingerprint {})", info.cluster_id,
              info.services.size(), info.fingerprint());
    return true;
}

void MeshAgent::loop() {
    using Clock = std::chrono::steady_clock;

    auto nextDiscovery = Clock::now() + config_.discovery_interval;
    auto nextRegistration = Clock::now() + config_.registration_interval;
    auto nextPurge = Clock::now() + config_.purge_interval;

    while (running_.load()) {
        auto wakeAt = std::min({nextDiscovery, nextRegistration, nextPurge});
        {
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeCv_.wait_until(lock, wakeAt, [this] {
                return !running_.load() || rescanRequested_.load();
            });
        }
        if (!running_.load()) {
            break;
        }

        auto now = Clock::now();
        if (rescanRequested_.exchange(false) || now >= nextDiscovery) {
            if (discoverOnce()) {
                registerOnce();
                nextRegistration = now + config_.registration_interval;
            }
            nextDiscovery = now + config_.discovery_interval;
        }
        if (now >= nextRegistration) {
            registerOnce();
            nextRegistration = now + config_.registration_interval;
        }
        if (now >= nextPurge) {
            discovery_->purgeExpired();
            nextPurge = now + config_.purge_interval;
        }
    }
}

}  // namespace core
}  // namespace crossmesh

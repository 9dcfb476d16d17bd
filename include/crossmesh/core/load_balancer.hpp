/**
 * @file load_balancer.hpp
 * @brief Endpoint selection policies and the metrics they read.
 *
 * A LoadBalancer is stateful per route (round-robin cursors, smooth
 * weighted-round-robin weights); RouteTable keeps one instance per route.
 * EndpointMetrics are shared by all routes and updated by TrafficRouter.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"
#include "crossmesh/core/sharded_map.hpp"
#include "crossmesh/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crossmesh {
namespace core {

/**
 * @enum LoadBalancingAlgorithm
 */
enum class LoadBalancingAlgorithm {
    ROUND_ROBIN,
    LEAST_CONNECTIONS,
    WEIGHTED_ROUND_ROBIN,
    EWMA_LATENCY
};

CROSSMESH_CORE_API const char* algorithmToString(LoadBalancingAlgorithm algorithm);

/**
 * @brief Parse "round-robin", "least-connections", "weighted-round-robin"
 * or "ewma-latency".
 */
CROSSMESH_CORE_API std::optional<LoadBalancingAlgorithm> algorithmFromString(const std::string& name);

/**
 * @class EndpointMetrics
 * @brief Active request counts and EWMA latency per endpoint key.
 */
class CROSSMESH_CORE_API EndpointMetrics {
public:
    /// Weight of the newest sample.
    static constexpr double EWMA_ALPHA = 0.3;

    EndpointMetrics() = default;

    EndpointMetrics(const EndpointMetrics&) = delete;
    EndpointMetrics& operator=(const EndpointMetrics&) = delete;

    void requestStarted(const std::string& endpointKey);

    void requestFinished(const std::string& endpointKey, std::chrono::milliseconds latency,
                         bool success);

    int64_t activeRequests(const std::string& endpointKey) const;

    /// EWMA latency in ms, or std::nullopt before the first sample.
    std::optional<double> ewmaLatencyMs(const std::string& endpointKey) const;

    uint64_t failures(const std::string& endpointKey) const;

private:
    struct Stats {
        std::atomic<int64_t> active{0};
        std::atomic<uint64_t> failures{0};
        mutable std::mutex mutex;
        double ewma_ms = 0.0;
        bool sampled = false;
    };

    ShardedMap<std::string, Stats> stats_;

    std::shared_ptr<Stats> statsFor(const std::string& endpointKey);
};

/**
 * @class LoadBalancer
 * @brief Chooses one candidate. Throws MeshError(NO_ENDPOINTS) on an empty set.
 */
class CROSSMESH_CORE_API LoadBalancer {
public:
    virtual ~LoadBalancer() = default;

    virtual ServiceEndpoint select(const std::vector<ServiceEndpoint>& candidates,
                                   const EndpointMetrics& metrics) = 0;

    virtual LoadBalancingAlgorithm algorithm() const = 0;
};

class CROSSMESH_CORE_API RoundRobinBalancer : public LoadBalancer {
public:
    ServiceEndpoint select(const std::vector<ServiceEndpoint>& candidates,
                           const EndpointMetrics& metrics) override;

    LoadBalancingAlgorithm algorithm() const override {
        return LoadBalancingAlgorithm::ROUND_ROBIN;
    }

private:
    std::atomic<uint64_t> cursor_{0};
};

/**
 * @brief Fewest active requests; ties rotate.
 */
class CROSSMESH_CORE_API LeastConnectionsBalancer : public LoadBalancer {
public:
    ServiceEndpoint select(const std::vector<ServiceEndpoint>& candidates,
                           const EndpointMetrics& metrics) override;

    LoadBalancingAlgorithm algorithm() const override {
        return LoadBalancingAlgorithm::LEAST_CONNECTIONS;
    }

private:
    std::atomic<uint64_t> cursor_{0};
};

/**
 * @brief Smooth weighted round-robin: each pick adds every candidate's
 * weight to its running score, takes the highest, and subtracts the total.
 */
class CROSSMESH_CORE_API WeightedRoundRobinBalancer : public LoadBalancer {
public:
    ServiceEndpoint select(const std::vector<ServiceEndpoint>& candidates,
                           const EndpointMetrics& metrics) override;

    LoadBalancingAlgorithm algorithm() const override {
        return LoadBalancingAlgorithm::WEIGHTED_ROUND_ROBIN;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, int64_t> current_;
};

/**
 * @brief Lowest EWMA latency scaled by outstanding requests. Endpoints
 * without samples are tried first.
 */
class CROSSMESH_CORE_API EwmaLatencyBalancer : public LoadBalancer {
public:
    ServiceEndpoint select(const std::vector<ServiceEndpoint>& candidates,
                           const EndpointMetrics& metrics) override;

    LoadBalancingAlgorithm algorithm() const override {
        return LoadBalancingAlgorithm::EWMA_LATENCY;
    }

private:
    std::atomic<uint64_t> cursor_{0};
};

CROSSMESH_CORE_API std::unique_ptr<LoadBalancer> makeLoadBalancer(LoadBalancingAlgorithm algorithm);

}  // namespace core
}  // namespace crossmesh

/**
 * @file load_balancer.cpp
 * @brief Load-balancing policies.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/load_balancer.hpp"
#include "crossmesh/core/errors.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <unordered_set>

namespace crossmesh {
namespace core {

namespace {

void requireCandidates(const std::vector<ServiceEndpoint>& candidates) {
    if (candidates.empty()) {
        throw MeshError(ErrorKind::NO_ENDPOINTS, "no endpoints to choose from");
    }
}

// Index of the lowest score, scanning from a rotating start so that ties
// spread across candidates.
template<typename ScoreFn>
size_t pickLowest(size_t count, uint64_t start, ScoreFn&& score) {
    size_t best = start % count;
    double bestScore = std::numeric_limits<double>::max();
    for (size_t i = 0; i < count; ++i) {
        size_t index = (start + i) % count;
        double s = score(index);
        if (s < bestScore) {
            bestScore = s;
            best = index;
        }
    }
    return best;
}

}  // namespace

const char* algorithmToString(LoadBalancingAlgorithm algorithm) {
    switch (algorithm) {
        case LoadBalancingAlgorithm::ROUND_ROBIN: return "round-robin";
        case LoadBalancingAlgorithm::LEAST_CONNECTIONS: return "least-connections";
        case LoadBalancingAlgorithm::WEIGHTED_ROUND_ROBIN: return "weighted-round-robin";
        case LoadBalancingAlgorithm::EWMA_LATENCY: return "ewma-latency";
        default: return "unknown";
    }
}

std::optional<LoadBalancingAlgorithm> algorithmFromString(const std::string& name) {
    if (name == "round-robin" || name == "rr") {
        return LoadBalancingAlgorithm::ROUND_ROBIN;
    }
    if (name == "least-connections" || name == "least-conn") {
        return LoadBalancingAlgorithm::LEAST_CONNECTIONS;
    }
    if (name == "weighted-round-robin" || name == "wrr") {
        return LoadBalancingAlgorithm::WEIGHTED_ROUND_ROBIN;
    }
    if (name == "ewma-latency" || name == "ewma") {
        return LoadBalancingAlgorithm::EWMA_LATENCY;
    }
    return std::nullopt;
}

// =============================================================================
// EndpointMetrics
// =============================================================================

std::shared_ptr<EndpointMetrics::Stats> EndpointMetrics::statsFor(const std::string& endpointKey) {
    return stats_.getOrCreate(endpointKey, [] { return std::make_shared<Stats>(); });
}

void EndpointMetrics::requestStarted(const std::string& endpointKey) {
    statsFor(endpointKey)->active.fetch_add(1);
}

void EndpointMetrics::requestFinished(const std::string& endpointKey,
                                      std::chrono::milliseconds latency, bool success) {
    auto stats = statsFor(endpointKey);
    stats->active.fetch_sub(1);
    if (!success) {
        stats->failures.fetch_add(1);
    }

    double sample = static_cast<double>(latency.count());
    std::lock_guard<std::mutex> lock(stats->mutex);
    if (!stats->sampled) {
        stats->ewma_ms = sample;
        stats->sampled = true;
    } else {
        stats->ewma_ms = EWMA_ALPHA * sample + (1.0 - EWMA_ALPHA) * stats->ewma_ms;
    }
}

int64_t EndpointMetrics::activeRequests(const std::string& endpointKey) const {
    auto stats = stats_.find(endpointKey);
    return stats ? stats->active.load() : 0;
}

std::optional<double> EndpointMetrics::ewmaLatencyMs(const std::string& endpointKey) const {
    auto stats = stats_.find(endpointKey);
    if (!stats) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(stats->mutex);
    if (!stats->sampled) {
        return std::nullopt;
    }
    return stats->ewma_ms;
}

uint64_t EndpointMetrics::failures(const std::string& endpointKey) const {
    auto stats = stats_.find(endpointKey);
    return stats ? stats->failures.load() : 0;
}

// =============================================================================
// Policies
// =============================================================================

ServiceEndpoint RoundRobinBalancer::select(const std::vector<ServiceEndpoint>& candidates,
                                           const EndpointMetrics&) {
    requireCandidates(candidates);
    uint64_t turn = cursor_.fetch_add(1);
    return candidates[turn % candidates.size()];
}

ServiceEndpoint LeastConnectionsBalancer::select(const std::vector<ServiceEndpoint>& candidates,
                                                 const EndpointMetrics& metrics) {
    requireCandidates(candidates);
    size_t index = pickLowest(candidates.size(), cursor_.fetch_add(1), [&](size_t i) {
        return static_cast<double>(metrics.activeRequests(candidates[i].key()));
    });
    return candidates[index];
}

ServiceEndpoint WeightedRoundRobinBalancer::select(const std::vector<ServiceEndpoint>& candidates,
                                                   const EndpointMetrics&) {
    requireCandidates(candidates);

    std::lock_guard<std::mutex> lock(mutex_);

    // Forget endpoints that left the candidate set.
    std::unordered_set<std::string> live;
    for (const auto& candidate : candidates) {
        live.insert(candidate.key());
    }
    for (auto it = current_.begin(); it != current_.end();) {
        it = live.count(it->first) ? std::next(it) : current_.erase(it);
    }

    int64_t total = 0;
    size_t best = 0;
    int64_t bestWeight = std::numeric_limits<int64_t>::min();

    for (size_t i = 0; i < candidates.size(); ++i) {
        int64_t weight = std::max<int64_t>(1, candidates[i].weight);
        int64_t& current = current_[candidates[i].key()];
        current += weight;
        total += weight;
        if (current > bestWeight) {
            bestWeight = current;
            best = i;
        }
    }

    current_[candidates[best].key()] -= total;
    return candidates[best];
}

ServiceEndpoint EwmaLatencyBalancer::select(const std::vector<ServiceEndpoint>& candidates,
                                            const EndpointMetrics& metrics) {
    requireCandidates(candidates);
    size_t index = pickLowest(candidates.size(), cursor_.fetch_add(1), [&](size_t i) {
        const std::string key = candidates[i].key();
        auto latency = metrics.ewmaLatencyMs(key);
        if (!latency) {
            return -1.0;
        }
        return (*latency + 1.0) * static_cast<double>(metrics.activeRequests(key) + 1);
    });
    return candidates[index];
}

std::unique_ptr<LoadBalancer> makeLoadBalancer(LoadBalancingAlgorithm algorithm) {
    switch (algorithm) {
        case LoadBalancingAlgorithm::LEAST_CONNECTIONS:
            return std::make_unique<LeastConnectionsBalancer>();
        case LoadBalancingAlgorithm::WEIGHTED_ROUND_ROBIN:
            return std::make_unique<WeightedRoundRobinBalancer>();
        case LoadBalancingAlgorithm::EWMA_LATENCY:
            return std::make_unique<EwmaLatencyBalancer>();
        case LoadBalancingAlgorithm::ROUND_ROBIN:
        default:
            return std::make_unique<RoundRobinBalancer>();
    }
}

}  // namespace core
}  // namespace crossmesh

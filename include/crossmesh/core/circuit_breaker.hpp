/**
 * @file circuit_breaker.hpp
 * @brief Per (cluster, service) circuit breakers.
 *
 * CLOSED -> OPEN when failures inside the rolling window reach the
 * threshold; OPEN -> HALF_OPEN once the cooldown has passed; HALF_OPEN
 * admits exactly one trial call, which closes the breaker on success and
 * re-opens it on failure.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"
#include "crossmesh/core/sharded_map.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace crossmesh {
namespace core {

enum class BreakerState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

inline const char* breakerStateToString(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED: return "closed";
        case BreakerState::OPEN: return "open";
        case BreakerState::HALF_OPEN: return "half-open";
        default: return "unknown";
    }
}

struct CROSSMESH_CORE_API BreakerConfig {
    int failure_threshold = 5;
    std::chrono::milliseconds window{10000};
    std::chrono::milliseconds cooldown{30000};
};

/**
 * @class CircuitBreaker
 * @brief Thread-safe breaker for one target.
 *
 * Usage:
 * @code
 * if (!breaker.allowRequest()) {
 *     throw MeshError(ErrorKind::CIRCUIT_OPEN, "...");
 * }
 * bool ok = doCall();
 * ok ? breaker.recordSuccess() : breaker.recordFailure();
 * @endcode
 */
class CROSSMESH_CORE_API CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit CircuitBreaker(const BreakerConfig& config = BreakerConfig(),
                            std::string name = "breaker");

    /**
     * @brief Admission check. In HALF_OPEN only the first caller is admitted.
     */
    bool allowRequest();

    void recordSuccess();

    void recordFailure();

    BreakerState state() const;

    /// Failures currently inside the window.
    size_t recentFailures() const;

private:
    BreakerConfig config_;
    std::string name_;

    mutable std::mutex mutex_;
    BreakerState state_;
    std::deque<TimePoint> failures_;
    TimePoint openedAt_;
    bool trialInFlight_;

    void pruneLocked(TimePoint now);
    void openLocked(TimePoint now);
};

/**
 * @class BreakerRegistry
 * @brief Breakers keyed by "cluster/namespace/service".
 */
class CROSSMESH_CORE_API BreakerRegistry {
public:
    explicit BreakerRegistry(const BreakerConfig& config) : config_(config) {}

    std::shared_ptr<CircuitBreaker> get(const std::string& key);

    std::vector<std::pair<std::string, BreakerState>> snapshot() const;

private:
    BreakerConfig config_;
    ShardedMap<std::string, CircuitBreaker> breakers_;
};

}  // namespace core
}  // namespace crossmesh

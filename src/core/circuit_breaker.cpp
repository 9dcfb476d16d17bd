/**
 * @file circuit_breaker.cpp
 * @brief CircuitBreaker implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/circuit_breaker.hpp"
#include "crossmesh/utils/logger.hpp"

namespace crossmesh {
namespace core {

CircuitBreaker::CircuitBreaker(const BreakerConfig& config, std::string name)
    : config_(config)
    , name_(std::move(name))
    , state_(BreakerState::CLOSED)
    , openedAt_()
    , trialInFlight_(false)
{}

bool CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    switch (state_) {
        case BreakerState::CLOSED:
            return true;

        case BreakerState::OPEN:
            if (now - openedAt_ < config_.cooldown) {
                return false;
            }
            state_ = BreakerState::HALF_OPEN;
            trialInFlight_ = true;
            LOG_DEBUG("CircuitBreaker", "{}: cooldown elapsed, admitting trial call", name_);
            return true;

        case BreakerState::HALF_OPEN:
            if (trialInFlight_) {
                return false;
            }
            trialInFlight_ = true;
            return true;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BreakerState::HALF_OPEN) {
        state_ = BreakerState::CLOSED;
        trialInFlight_ = false;
        failures_.clear();
        LOG_INFO("CircuitBreaker", "{}: trial succeeded, breaker closed", name_);
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    switch (state_) {
        case BreakerState::CLOSED:
            failures_.push_back(now);
            pruneLocked(now);
            if (static_cast<int>(failures_.size()) >= config_.failure_threshold) {
                openLocked(now);
            }
            break;

        case BreakerState::HALF_OPEN:
            openLocked(now);
            break;

        case BreakerState::OPEN:
            // Late result from a call admitted before the trip.
            break;
    }
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t CircuitBreaker::recentFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    size_t count = 0;
    for (const auto& at : failures_) {
        if (now - at <= config_.window) {
            ++count;
        }
    }
    return count;
}

void CircuitBreaker::pruneLocked(TimePoint now) {
    while (!failures_.empty() && now - failures_.front() > config_.window) {
        failures_.pop_front();
    }
}

void CircuitBreaker::openLocked(TimePoint now) {
    state_ = BreakerState::OPEN;
    openedAt_ = now;
    trialInFlight_ = false;
    failures_.clear();
    LOG_WARN("CircuitBreaker", "{}: opened for {}ms", name_, config_.cooldown.count());
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::get(const std::string& key) {
    return breakers_.getOrCreate(key, [this, &key] { return std::make_shared<CircuitBreaker>(config_, key); });
}

std::vector<std::pair<std::string, BreakerState>> BreakerRegistry::snapshot() const {
    std::vector<std::pair<std::string, BreakerState>> out;
    for (const auto& [key, breaker] : breakers_.snapshot()) {
        out.emplace_back(key, breaker->state());
    }
    return out;
}

}  // namespace core
}  // namespace crossmesh

/**
 * @file timing.hpp
 * @brief Deadlines and bounded exponential backoff.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <chrono>

namespace crossmesh {
namespace core {

/**
 * @class Deadline
 * @brief Absolute point in time that every blocking call is bounded by.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    static Deadline after(std::chrono::milliseconds timeout) {
        return Deadline(Clock::now() + timeout);
    }

    explicit Deadline(Clock::time_point at) : at_(at) {}

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    /// True once less than a millisecond is left.
    bool expired() const { return remaining().count() == 0; }

    Clock::time_point at() const { return at_; }

private:
    Clock::time_point at_;
};

/**
 * @class ExponentialBackoff
 * @brief initial, 2*initial, 4*initial, ... capped at max.
 */
class ExponentialBackoff {
public:
    ExponentialBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
        : initial_(initial), max_(max), next_(initial) {}

    std::chrono::milliseconds next() {
        auto delay = next_;
        next_ = std::min(next_ * 2, max_);
        return delay;
    }

    void reset() { next_ = initial_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds next_;
};

}  // namespace core
}  // namespace crossmesh

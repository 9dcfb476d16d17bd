/**
 * @file task_group.hpp
 * @brief Owner of the background tasks spawned by accept loops.
 *
 * Every accepted connection, accepted stream and intercepted request runs
 * as its own task. A TaskGroup starts them on dedicated threads up to a
 * fixed number of concurrently running tasks, reaps finished ones and joins
 * the rest on shutdown so no task outlives the component that spawned it.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/utils/export.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace crossmesh {
namespace utils {

/**
 * @enum SpawnStatus
 * @brief Outcome of TaskGroup::spawn().
 */
enum class SpawnStatus {
    STARTED,      ///< Task is running
    AT_CAPACITY,  ///< Too many running tasks; caller sheds the work
    CLOSED        ///< Group is shutting down
};

inline const char* spawnStatusToString(SpawnStatus status) {
    switch (status) {
        case SpawnStatus::STARTED: return "started";
        case SpawnStatus::AT_CAPACITY: return "at-capacity";
        case SpawnStatus::CLOSED: return "closed";
        default: return "unknown";
    }
}

class CROSSMESH_UTILS_API TaskGroup {
public:
    static constexpr size_t DEFAULT_MAX_TASKS = 1024;

    explicit TaskGroup(std::string name, size_t maxTasks = DEFAULT_MAX_TASKS);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /**
     * @brief Run fn on a new thread. Exceptions escaping fn are logged.
     *
     * fn is not run unless the result is STARTED.
     */
    SpawnStatus spawn(std::function<void()> fn);

    /**
     * @brief Change the running-task limit. Running tasks are not affected.
     */
    void setMaxTasks(size_t maxTasks) { maxTasks_.store(maxTasks); }

    size_t maxTasks() const { return maxTasks_.load(); }

    /**
     * @brief Join tasks that have finished.
     * @return Number of tasks reaped.
     */
    size_t reap();

    /**
     * @brief Refuse new tasks and join all running ones.
     */
    void joinAll();

    /**
     * @brief Number of tasks not yet reaped.
     */
    size_t size() const;

    /**
     * @brief Number of tasks still running.
     */
    size_t active() const { return active_->load(); }

    uint64_t rejected() const { return rejected_.load(); }

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::string name_;
    std::atomic<size_t> maxTasks_;
    std::shared_ptr<std::atomic<size_t>> active_;
    std::atomic<uint64_t> rejected_{0};
    std::atomic<bool> closed_{false};
    mutable std::mutex mutex_;
    std::list<Task> tasks_;
};

}  // namespace utils
}  // namespace crossmesh

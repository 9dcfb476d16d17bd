/**
 * @file task_group.cpp
 * @brief TaskGroup implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/utils/task_group.hpp"
#include "crossmesh/utils/logger.hpp"

#include <exception>
#include <system_error>

namespace crossmesh {
namespace utils {

TaskGroup::TaskGroup(std::string name, size_t maxTasks)
    : name_(std::move(name))
    , maxTasks_(maxTasks)
    , active_(std::make_shared<std::atomic<size_t>>(0))
{}

TaskGroup::~TaskGroup() {
    joinAll();
}

SpawnStatus TaskGroup::spawn(std::function<void()> fn) {
    if (closed_.load()) {
        return SpawnStatus::CLOSED;
    }

    reap();

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto active = active_;
    std::string name = name_;

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.load()) {
        return SpawnStatus::CLOSED;
    }
    if (active->load() >= maxTasks_.load()) {
        rejected_.fetch_add(1);
        LOG_WARN("TaskGroup", "{} is at capacity ({} running tasks)", name_, active->load());
        return SpawnStatus::AT_CAPACITY;
    }

    active->fetch_add(1);
    Task task;
    task.done = done;
    try {
        task.thread = std::thread([fn = std::move(fn), done, active, name]() {
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_ERROR("TaskGroup", "Task in {} failed: {}", name, e.what());
            }
            active->fetch_sub(1);
            done->store(true);
        });
    } catch (const std::system_error& e) {
        active->fetch_sub(1);
        rejected_.fetch_add(1);
        LOG_ERROR("TaskGroup", "Could not start a task in {}: {}", name_, e.what());
        return SpawnStatus::AT_CAPACITY;
    }
    tasks_.push_back(std::move(task));
    return SpawnStatus::STARTED;
}

size_t TaskGroup::reap() {
    std::list<Task> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end(); ) {
            if (it->done->load()) {
                finished.splice(finished.end(), tasks_, it++);
            } else {
                ++it;
            }
        }
    }

    for (auto& task : finished) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
    return finished.size();
}

void TaskGroup::joinAll() {
    closed_.store(true);

    std::list<Task> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(tasks_);
    }

    if (!remaining.empty()) {
        LOG_DEBUG("TaskGroup", "Joining {} tasks in {}", remaining.size(), name_);
    }

    for (auto& task : remaining) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
}

size_t TaskGroup::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace utils
}  // namespace crossmesh

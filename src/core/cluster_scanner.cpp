/**
 * @file cluster_scanner.cpp
 * @brief Snapshot helpers and StaticClusterScanner.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/cluster_scanner.hpp"
#include "crossmesh/utils/logger.hpp"

#include <algorithm>

namespace crossmesh {
namespace core {

const LocalService* ServiceSnapshot::find(const std::string& name, const std::string& ns) const {
    for (const auto& service : services) {
        if (service.info.name == name && service.info.ns == ns) {
            return &service;
        }
    }
    return nullptr;
}

std::vector<ServiceInfo> ServiceSnapshot::serviceInfos() const {
    std::vector<ServiceInfo> out;
    out.reserve(services.size());
    for (const auto& service : services) {
        out.push_back(service.info);
    }
    return out;
}

StaticClusterScanner::StaticClusterScanner()
    : current_(std::make_shared<const ServiceSnapshot>())
    , nextToken_(1)
{}

SnapshotPtr StaticClusterScanner::listServices(const std::string& nsFilter) {
    SnapshotPtr snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = current_;
    }
    if (nsFilter.empty()) {
        return snapshot;
    }

    auto filtered = std::make_shared<ServiceSnapshot>();
    filtered->version = snapshot->version;
    for (const auto& service : snapshot->services) {
        if (service.info.ns == nsFilter) {
            filtered->services.push_back(service);
        }
    }
    return filtered;
}

uint64_t StaticClusterScanner::watchChanges(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t token = nextToken_++;
    watchers_[token] = std::move(callback);
    return token;
}

void StaticClusterScanner::unwatch(uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    watchers_.erase(token);
}

void StaticClusterScanner::upsertService(const LocalService& service) {
    SnapshotPtr next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto copy = std::make_shared<ServiceSnapshot>(*current_);
        copy->version = current_->version + 1;

        auto it = std::find_if(copy->services.begin(), copy->services.end(),
                               [&](const LocalService& s) {
                                   return s.info.name == service.info.name &&
                                          s.info.ns == service.info.ns;
                               });
        if (it == copy->services.end()) {
            copy->services.push_back(service);
        } else {
            *it = service;
        }
        current_ = copy;
        next = copy;
    }

    LOG_DEBUG("ClusterScanner", "Service {} updated ({} instances)",
              service.info.key(), service.instances.size());
    publish(next);
}

bool StaticClusterScanner::removeService(const std::string& name, const std::string& ns) {
    SnapshotPtr next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto copy = std::make_shared<ServiceSnapshot>(*current_);
        auto it = std::remove_if(copy->services.begin(), copy->services.end(),
                                 [&](const LocalService& s) {
                                     return s.info.name == name && s.info.ns == ns;
                                 });
        if (it == copy->services.end()) {
            return false;
        }
        copy->services.erase(it, copy->services.end());
        copy->version = current_->version + 1;
        current_ = copy;
        next = copy;
    }

    LOG_DEBUG("ClusterScanner", "Service {}.{} removed", name, ns);
    publish(next);
    return true;
}

void StaticClusterScanner::publish(SnapshotPtr next) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& watcher : watchers_) {
            callbacks.push_back(watcher.second);
        }
    }
    for (const auto& callback : callbacks) {
        callback(next);
    }
}

}  // namespace core
}  // namespace crossmesh

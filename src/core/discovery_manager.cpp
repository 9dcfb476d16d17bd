/**
 * @file discovery_manager.cpp
 * @brief DiscoveryManager implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/discovery_manager.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/core/framing.hpp"
#include "crossmesh/core/proto_convert.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/utils/logger.hpp"

#include <algorithm>

namespace crossmesh {
namespace core {

DiscoveryManager::DiscoveryManager(const DiscoveryConfig& config,
                                   std::shared_ptr<ClusterScanner> scanner,
                                   std::shared_ptr<ConnectionManager> connections)
    : config_(config)
    , scanner_(std::move(scanner))
    , connections_(std::move(connections))
{
    LOG_INFO("DiscoveryManager", "Created for cluster '{}' (cache TTL {}ms)",
             config_.local_cluster, config_.cache_ttl.count());
}

// =============================================================================
// Resolution
// =============================================================================

std::vector<ServiceEndpoint> DiscoveryManager::resolve(const CrossClusterRoute& route) {
    if (route.cluster == config_.local_cluster) {
        return resolveLocal(route);
    }
    return resolveRemote(route, nullptr);
}

std::vector<ServiceEndpoint> DiscoveryManager::resolve(const CrossClusterRoute& route,
                                                       const Deadline& deadline) {
    if (route.cluster == config_.local_cluster) {
        return resolveLocal(route);
    }
    return resolveRemote(route, &deadline);
}

std::vector<ServiceEndpoint> DiscoveryManager::resolveLocal(const CrossClusterRoute& route) {
    auto snapshot = scanner_->listServices(route.ns);
    const LocalService* service = snapshot->find(route.service, route.ns);
    if (!service) {
        throw MeshError(ErrorKind::NOT_FOUND,
                        "service " + route.service + "." + route.ns + " not found locally");
    }

    std::vector<ServiceEndpoint> endpoints;
    endpoints.reserve(service->instances.size());
    for (const auto& instance : service->instances) {
        ServiceEndpoint ep;
        ep.cluster = config_.local_cluster;
        ep.service = route.service;
        ep.ns = route.ns;
        ep.address = instance.address;
        ep.port = instance.port;
        ep.protocol = service->info.protocol;
        ep.weight = std::max<uint32_t>(1, instance.weight);
        endpoints.push_back(std::move(ep));
    }
    return endpoints;
}

std::vector<ServiceEndpoint> DiscoveryManager::resolveRemote(const CrossClusterRoute& route,
                                                             const Deadline* callerDeadline) {
    const std::string key = route.key();
    std::shared_ptr<CacheEntry> entry = cache_.getOrCreate(key, [&route] {
        auto created = std::make_shared<CacheEntry>();
        created->route = route;
        return created;
    });

    std::promise<std::vector<ServiceEndpoint>> promise;
    std::shared_future<std::vector<ServiceEndpoint>> waiter;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->valid && Clock::now() < entry->expires) {
            LOG_TRACE("DiscoveryManager", "Cache hit for {}", key);
            return entry->endpoints;
        }
        if (entry->loading) {
            waiter = entry->inflight;
        } else {
            leader = true;
            entry->valid = false;
            entry->loading = true;
            entry->inflight = promise.get_future().share();
        }
    }

    if (!leader) {
        if (callerDeadline &&
            waiter.wait_until(callerDeadline->at()) != std::future_status::ready) {
            throw MeshError(ErrorKind::TIMEOUT, "deadline passed waiting for discovery of " + key);
        }
        return waiter.get();
    }

    try {
        auto endpoints = queryPeer(route, callerDeadline);
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->endpoints = endpoints;
            entry->expires = Clock::now() + config_.cache_ttl;
            entry->valid = true;
            entry->loading = false;
        }
        promise.set_value(endpoints);
        return endpoints;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->valid = false;
            entry->loading = false;
            entry->endpoints.clear();
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::vector<ServiceEndpoint> DiscoveryManager::queryPeer(const CrossClusterRoute& route,
                                                         const Deadline* callerDeadline) {
    Deadline deadline = Deadline::after(config_.query_timeout);
    if (callerDeadline && callerDeadline->at() < deadline.at()) {
        deadline = *callerDeadline;
    }
    discovery::DiscoveryResponse response;

    queriesSent_.fetch_add(1);
    LOG_DEBUG("DiscoveryManager", "Querying {} for {}.{}", route.cluster, route.service, route.ns);

    try {
        auto connection = connections_->getConnection(route.cluster, deadline);
        auto stream = connection->openStream(deadline.remaining());

        writeStreamHeader(*stream, proxy::STREAM_DISCOVERY, config_.local_cluster);

        discovery::DiscoveryQuery query;
        query.set_service(route.service);
        query.set_namespace_(route.ns);
        query.set_source_cluster(config_.local_cluster);
        writeMessage(*stream, query);
        stream->finish();

        FrameReader reader(*stream);
        if (!reader.readMessage(response, deadline)) {
            stream->close();
            throw MeshError(ErrorKind::CONNECTION_CLOSED,
                            "peer closed the discovery stream without answering");
        }
        stream->close();
    } catch (const MeshError& e) {
        if (e.kind() == ErrorKind::IDENTITY_MISMATCH) {
            throw;
        }
        if (e.kind() == ErrorKind::CONNECTION_CLOSED) {
            connections_->invalidate(route.cluster);
        }
        LOG_WARN("DiscoveryManager", "Discovery of {} in {} failed: {}",
                 route.service, route.cluster, e.what());
        if (callerDeadline && callerDeadline->expired()) {
            throw MeshError(ErrorKind::TIMEOUT,
                            "deadline passed querying " + route.cluster + ": " + e.what());
        }
        throw MeshError(ErrorKind::UNREACHABLE,
                        "discovery query to " + route.cluster + " failed: " + e.what());
    }

    if (response.status() == discovery::DiscoveryResponse::NOT_FOUND) {
        throw MeshError(ErrorKind::NOT_FOUND, "service " + route.service + "." + route.ns +
                                                  " not found in cluster " + route.cluster);
    }

    if (response.has_cluster()) {
        absorbClusterInfo(route, response.cluster());
    }

    std::vector<ServiceEndpoint> endpoints;
    endpoints.reserve(static_cast<size_t>(response.endpoints_size()));
    for (const auto& remote : response.endpoints()) {
        ServiceEndpoint ep;
        ep.cluster = route.cluster;
        ep.service = route.service;
        ep.ns = route.ns;
        ep.address = remote.address();
        ep.port = static_cast<uint16_t>(remote.port());
        ep.protocol = response.protocol().empty() ? "http" : response.protocol();
        ep.weight = std::max<uint32_t>(1, remote.weight());
        endpoints.push_back(std::move(ep));
    }

    LOG_DEBUG("DiscoveryManager", "Resolved {} to {} endpoint(s)", route.key(), endpoints.size());
    return endpoints;
}

void DiscoveryManager::absorbClusterInfo(const CrossClusterRoute& route,
                                         const discovery::ClusterInfo& wire) {
    ClusterInfo info = fromProto(wire);
    if (info.cluster_id != route.cluster) {
        LOG_WARN("DiscoveryManager", "Ignoring ClusterInfo for '{}' on a query to '{}'",
                 info.cluster_id, route.cluster);
        return;
    }

    auto existing = clusters_.find(info.cluster_id);
    if (existing && !existing->node_id.empty() && existing->node_id != info.node_id) {
        LOG_ERROR("DiscoveryManager", "ALERT cluster {} advertised node {} but is bound to {}",
                  info.cluster_id, info.node_id, existing->node_id);
        return;
    }

    registerCluster(info);
}

discovery::DiscoveryResponse DiscoveryManager::serveQuery(const discovery::DiscoveryQuery& query) {
    queriesServed_.fetch_add(1);

    discovery::DiscoveryResponse response;
    auto snapshot = scanner_->listServices(query.namespace_());
    const LocalService* service = snapshot->find(query.service(), query.namespace_());

    if (!service) {
        LOG_DEBUG("DiscoveryManager", "Query from '{}' for {}.{}: not found",
                  query.source_cluster(), query.service(), query.namespace_());
        response.set_status(discovery::DiscoveryResponse::NOT_FOUND);
        return response;
    }

    response.set_status(discovery::DiscoveryResponse::FOUND);
    response.set_protocol(service->info.protocol);
    for (const auto& instance : service->instances) {
        auto* ep = response.add_endpoints();
        ep->set_address(instance.address);
        ep->set_port(instance.port);
        ep->set_weight(instance.weight);
    }
    for (const auto& [key, value] : service->metadata) {
        (*response.mutable_metadata())[key] = value;
    }

    auto self = clusters_.find(config_.local_cluster);
    if (self) {
        toProto(*self, response.mutable_cluster());
    }

    LOG_DEBUG("DiscoveryManager", "Query from '{}' for {}.{}: {} endpoint(s)",
              query.source_cluster(), query.service(), query.namespace_(),
              service->instances.size());
    return response;
}

std::vector<ServiceInfo> DiscoveryManager::discoverLocalServices(const std::string& nsFilter) {
    return scanner_->listServices(nsFilter)->serviceInfos();
}

// =============================================================================
// Cluster registry
// =============================================================================

bool DiscoveryManager::registerCluster(const ClusterInfo& info) {
    auto previous = clusters_.find(info.cluster_id);
    clusters_.put(info.cluster_id, std::make_shared<ClusterInfo>(info));

    if (!previous) {
        LOG_INFO("DiscoveryManager", "Registered cluster '{}' ({} services)",
                 info.cluster_id, info.services.size());
        return true;
    }
    if (previous->sameAs(info)) {
        LOG_TRACE("DiscoveryManager", "Cluster '{}' unchanged", info.cluster_id);
        return false;
    }

    LOG_DEBUG("DiscoveryManager", "Cluster '{}' changed: fingerprint {} -> {}",
              info.cluster_id, previous->fingerprint(), info.fingerprint());
    return true;
}

bool DiscoveryManager::updateCluster(const ClusterInfo& info) {
    if (!clusters_.find(info.cluster_id)) {
        return false;
    }
    registerCluster(info);
    return true;
}

bool DiscoveryManager::removeCluster(const ClusterId& cluster) {
    bool removed = clusters_.erase(cluster);
    if (removed) {
        invalidateCluster(cluster);
        LOG_INFO("DiscoveryManager", "Removed cluster '{}'", cluster);
    }
    return removed;
}

std::optional<ClusterInfo> DiscoveryManager::getClusterInfo(const ClusterId& cluster) const {
    auto info = clusters_.find(cluster);
    if (!info) {
        return std::nullopt;
    }
    return *info;
}

std::vector<ClusterInfo> DiscoveryManager::listClusters() const {
    std::vector<ClusterInfo> out;
    for (const auto& entry : clusters_.snapshot()) {
        out.push_back(*entry.second);
    }
    std::sort(out.begin(), out.end(), [](const ClusterInfo& a, const ClusterInfo& b) {
        return a.cluster_id < b.cluster_id;
    });
    return out;
}

std::vector<ClusterId> DiscoveryManager::findService(const std::string& name,
                                                     const std::string& ns) const {
    std::vector<ClusterId> out;
    for (const auto& info : listClusters()) {
        for (const auto& service : info.services) {
            if (service.name == name && service.ns == ns) {
                out.push_back(info.cluster_id);
                break;
            }
        }
    }
    return out;
}

// =============================================================================
// Cache
// =============================================================================

void DiscoveryManager::invalidate(const CrossClusterRoute& route) {
    auto entry = cache_.find(route.key());
    if (!entry) {
        return;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->valid = false;
}

void DiscoveryManager::invalidateCluster(const ClusterId& cluster) {
    for (const auto& [key, entry] : cache_.snapshot()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->route.cluster == cluster) {
            entry->valid = false;
        }
    }
}

size_t DiscoveryManager::purgeExpired() {
    auto now = Clock::now();
    auto removed = cache_.removeWhere([now](const std::string&, const std::shared_ptr<CacheEntry>& entry) {
        // Held outside the map: a resolver is between lookup and lock, and
        // the shard write lock keeps new holders out while this is checked.
        if (entry.use_count() > 1) {
            return false;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->loading) {
            return false;
        }
        return !entry->valid || now >= entry->expires;
    });

    if (!removed.empty()) {
        LOG_DEBUG("DiscoveryManager", "Purged {} cache entries", removed.size());
    }
    return removed.size();
}

std::vector<CacheEntryStatus> DiscoveryManager::cacheSnapshot() const {
    auto now = Clock::now();
    std::vector<CacheEntryStatus> out;

    for (const auto& [key, entry] : cache_.snapshot()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->valid || now >= entry->expires) {
            continue;
        }
        CacheEntryStatus status;
        status.route = key;
        status.endpoint_count = entry->endpoints.size();
        status.expires_in = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry->expires - now);
        out.push_back(std::move(status));
    }
    return out;
}

}  // namespace core
}  // namespace crossmesh

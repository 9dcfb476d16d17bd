/**
 * @file route_table.cpp
 * @brief RouteTable implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/route_table.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>

namespace crossmesh {
namespace core {

bool splitAuthority(const std::string& authority, std::string& host, uint16_t& port) {
    host = authority;
    port = 0;

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        if (portText.empty() || portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
        unsigned long value = std::stoul(portText);
        if (value == 0 || value > 65535) {
            return false;
        }
        port = static_cast<uint16_t>(value);
        host = authority.substr(0, colon);
    }

    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    return !host.empty();
}

RouteTable::RouteTable(std::shared_ptr<DiscoveryManager> discovery,
                       LoadBalancingAlgorithm defaultAlgorithm)
    : discovery_(std::move(discovery))
    , defaultAlgorithm_(defaultAlgorithm)
{}

void RouteTable::addRoute(const RouteEntry& entry) {
    std::string host;
    uint16_t ignored = 0;
    if (!splitAuthority(entry.host, host, ignored)) {
        LOG_WARN("RouteTable", "Ignoring route with invalid host '{}'", entry.host);
        return;
    }

    RouteEntry stored = entry;
    stored.host = host;

    std::string replacedKey;
    {
        std::unique_lock<std::shared_mutex> lock(routesMutex_);
        auto previous = explicit_.find(host);
        if (previous != explicit_.end() && previous->second.route.key() != stored.route.key()) {
            replacedKey = previous->second.route.key();
        }
        explicit_[host] = stored;
        algorithmByRoute_[stored.route.key()] = stored.algorithm;
        if (!replacedKey.empty() && !routeInUse(replacedKey)) {
            algorithmByRoute_.erase(replacedKey);
        }
    }
    balancers_.erase(stored.route.key());
    if (!replacedKey.empty()) {
        balancers_.erase(replacedKey);
    }
    LOG_INFO("RouteTable", "Route {} -> {} ({})", host, stored.route.key(),
             algorithmToString(stored.algorithm));
}

bool RouteTable::removeRoute(const std::string& host) {
    std::string routeKey;
    {
        std::unique_lock<std::shared_mutex> lock(routesMutex_);
        auto it = explicit_.find(host);
        if (it == explicit_.end()) {
            return false;
        }
        routeKey = it->second.route.key();
        explicit_.erase(it);
        if (!routeInUse(routeKey)) {
            algorithmByRoute_.erase(routeKey);
        }
    }
    balancers_.erase(routeKey);
    LOG_INFO("RouteTable", "Removed route {}", host);
    return true;
}

bool RouteTable::routeInUse(const std::string& routeKey) const {
    for (const auto& entry : explicit_) {
        if (entry.second.route.key() == routeKey) {
            return true;
        }
    }
    return false;
}

std::vector<RouteEntry> RouteTable::routes() const {
    std::shared_lock<std::shared_mutex> lock(routesMutex_);
    std::vector<RouteEntry> out;
    out.reserve(explicit_.size());
    for (const auto& entry : explicit_) {
        out.push_back(entry.second);
    }
    return out;
}

std::optional<CrossClusterRoute> RouteTable::classify(const std::string& authority) const {
    std::string host;
    uint16_t port = 0;
    if (!splitAuthority(authority, host, port)) {
        return std::nullopt;
    }

    {
        std::shared_lock<std::shared_mutex> lock(routesMutex_);
        auto it = explicit_.find(host);
        if (it != explicit_.end()) {
            CrossClusterRoute route = it->second.route;
            if (port != 0 && route.port == 0) {
                route.port = port;
            }
            return route;
        }
    }

    // <service>.<namespace>.<cluster>.mesh
    const size_t suffixLength = std::strlen(MESH_DOMAIN_SUFFIX);
    if (host.size() <= suffixLength ||
        host.compare(host.size() - suffixLength, suffixLength, MESH_DOMAIN_SUFFIX) != 0) {
        return std::nullopt;
    }
    std::string name = host.substr(0, host.size() - suffixLength);

    auto firstDot = name.find('.');
    if (firstDot == std::string::npos || firstDot == 0) {
        return std::nullopt;
    }
    auto secondDot = name.find('.', firstDot + 1);
    if (secondDot == std::string::npos || secondDot == firstDot + 1 ||
        secondDot + 1 >= name.size()) {
        return std::nullopt;
    }

    CrossClusterRoute route;
    route.service = name.substr(0, firstDot);
    route.ns = name.substr(firstDot + 1, secondDot - firstDot - 1);
    route.cluster = name.substr(secondDot + 1);
    route.port = port;
    return route;
}

LoadBalancingAlgorithm RouteTable::algorithmFor(const CrossClusterRoute& route) const {
    std::shared_lock<std::shared_mutex> lock(routesMutex_);
    auto it = algorithmByRoute_.find(route.key());
    return it == algorithmByRoute_.end() ? defaultAlgorithm_ : it->second;
}

ServiceEndpoint RouteTable::select(const CrossClusterRoute& route) {
    return pick(route, discovery_->resolve(route));
}

ServiceEndpoint RouteTable::select(const CrossClusterRoute& route, const Deadline& deadline) {
    return pick(route, discovery_->resolve(route, deadline));
}

ServiceEndpoint RouteTable::pick(const CrossClusterRoute& route,
                                 const std::vector<ServiceEndpoint>& candidates) {
    if (candidates.empty()) {
        throw MeshError(ErrorKind::NO_ENDPOINTS, "no endpoints for " + route.key());
    }

    LoadBalancingAlgorithm algorithm = algorithmFor(route);
    auto balancer = balancers_.getOrCreate(route.key(), [algorithm] {
        return std::shared_ptr<LoadBalancer>(makeLoadBalancer(algorithm));
    });

    ServiceEndpoint chosen = balancer->select(candidates, metrics_);
    LOG_TRACE("RouteTable", "{} -> {} ({})", route.key(), chosen.key(),
              algorithmToString(algorithm));
    return chosen;
}

}  // namespace core
}  // namespace crossmesh

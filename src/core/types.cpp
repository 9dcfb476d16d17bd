/**
 * @file types.cpp
 * @brief Value type helpers.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/types.hpp"
#include "crossmesh/utils/crc64.hpp"

#include <algorithm>

namespace crossmesh {
namespace core {

std::string NodeAddr::toString() const {
    std::string out = node_id.substr(0, 10);
    if (hasRelay()) {
        out += " relay=" + relay_url;
    }
    if (!direct_addresses.empty()) {
        out += " direct=";
        for (size_t i = 0; i < direct_addresses.size(); ++i) {
            if (i > 0) {
                out += ",";
            }
            out += direct_addresses[i];
        }
    }
    return out;
}

std::string ServiceInfo::key() const {
    return name + "." + ns + ":" + std::to_string(port) + "/" + protocol;
}

uint64_t servicesFingerprint(const std::vector<ServiceInfo>& services) {
    std::vector<std::string> keys;
    keys.reserve(services.size());
    for (const auto& service : services) {
        keys.push_back(service.key());
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return utils::crc64Fields(keys);
}

bool ClusterInfo::sameAs(const ClusterInfo& other) const {
    if (cluster_id != other.cluster_id || node_id != other.node_id ||
        relay_url != other.relay_url) {
        return false;
    }

    auto lhs = direct_addresses;
    auto rhs = other.direct_addresses;
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    return lhs == rhs && fingerprint() == other.fingerprint();
}

std::string CrossClusterRoute::key() const {
    std::string out = service + "." + ns + "." + cluster;
    if (port != 0) {
        out += ":" + std::to_string(port);
    }
    return out;
}

}  // namespace core
}  // namespace crossmesh

/**
 * @file address_directory.cpp
 * @brief StaticAddressDirectory implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/address_directory.hpp"
#include "crossmesh/utils/logger.hpp"
#include "crossmesh/utils/node_identity.hpp"

#include <algorithm>
#include <mutex>

namespace crossmesh {
namespace core {

std::optional<NodeAddr> StaticAddressDirectory::resolve(const std::string& name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool StaticAddressDirectory::publish(const std::string& name, const NodeAddr& addr) {
    if (name.empty() || !utils::isValidNodeId(addr.node_id)) {
        LOG_WARN("AddressDirectory", "Rejecting record for '{}': invalid node id", name);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_[name] = addr;
    LOG_DEBUG("AddressDirectory", "Published {} -> {}", name, addr.toString());
    return true;
}

bool StaticAddressDirectory::remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return records_.erase(name) > 0;
}

std::vector<std::string> StaticAddressDirectory::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        out.push_back(record.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace core
}  // namespace crossmesh

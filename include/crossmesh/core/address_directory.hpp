/**
 * @file address_directory.hpp
 * @brief Name -> NodeAddr publication and lookup.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"
#include "crossmesh/core/types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crossmesh {
namespace core {

/**
 * @class AddressDirectory
 * @brief Where clusters publish, and peers find, their NodeAddr.
 */
class CROSSMESH_CORE_API AddressDirectory {
public:
    virtual ~AddressDirectory() = default;

    /**
     * @brief Look up the address published under name.
     * @return std::nullopt when nothing is published (a miss).
     */
    virtual std::optional<NodeAddr> resolve(const std::string& name) = 0;

    /**
     * @brief Publish addr under name, replacing any previous record.
     * @return False when the record could not be stored.
     */
    virtual bool publish(const std::string& name, const NodeAddr& addr) = 0;
};

/**
 * @class StaticAddressDirectory
 * @brief In-process directory seeded from configuration.
 */
class CROSSMESH_CORE_API StaticAddressDirectory : public AddressDirectory {
public:
    StaticAddressDirectory() = default;

    std::optional<NodeAddr> resolve(const std::string& name) override;
    bool publish(const std::string& name, const NodeAddr& addr) override;

    bool remove(const std::string& name);

    std::vector<std::string> names() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, NodeAddr> records_;
};

}  // namespace core
}  // namespace crossmesh

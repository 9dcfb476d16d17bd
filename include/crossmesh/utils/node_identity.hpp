/**
 * @file node_identity.hpp
 * @brief Node identity generation and persistence.
 *
 * A NodeId is 32 random bytes rendered as 64 lowercase hex digits. The
 * daemon keeps its identity in a key file so that restarts present the same
 * NodeId to peers that already pinned it.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/utils/export.hpp"

#include <cstddef>
#include <string>

namespace crossmesh {
namespace utils {

constexpr size_t NODE_ID_BYTES = 32;
constexpr size_t NODE_ID_HEX_LENGTH = NODE_ID_BYTES * 2;

/**
 * @brief Generate a fresh random NodeId.
 */
CROSSMESH_UTILS_API std::string generateNodeId();

/**
 * @brief Check that a string is 64 hex digits.
 */
CROSSMESH_UTILS_API bool isValidNodeId(const std::string& nodeId);

/**
 * @brief Abbreviated form for log lines.
 */
CROSSMESH_UTILS_API std::string shortNodeId(const std::string& nodeId);

/**
 * @brief Read the NodeId stored at path, creating the file with a new
 * identity when it does not exist.
 * @throws std::runtime_error if the file holds an invalid identity or
 *         cannot be written.
 */
CROSSMESH_UTILS_API std::string loadOrCreateNodeId(const std::string& path);

}  // namespace utils
}  // namespace crossmesh

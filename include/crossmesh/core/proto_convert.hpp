/**
 * @file proto_convert.hpp
 * @brief Conversions between core value types and their wire messages.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"
#include "crossmesh/core/types.hpp"

#include "crossmesh/proto/discovery.pb.h"

namespace crossmesh {
namespace core {

CROSSMESH_CORE_API void toProto(const ServiceInfo& in, discovery::ServiceInfo* out);
CROSSMESH_CORE_API ServiceInfo fromProto(const discovery::ServiceInfo& in);

/// Also fills services_fingerprint.
CROSSMESH_CORE_API void toProto(const ClusterInfo& in, discovery::ClusterInfo* out);
CROSSMESH_CORE_API ClusterInfo fromProto(const discovery::ClusterInfo& in);

}  // namespace core
}  // namespace crossmesh

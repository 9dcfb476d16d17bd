/**
 * @file admin_service.hpp
 * @brief gRPC service implementation for the read-only status surface.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/services/export.hpp"
#include "crossmesh/core/connection_manager.hpp"
#include "crossmesh/core/discovery_manager.hpp"
#include "crossmesh/core/mesh_agent.hpp"
#include "crossmesh/core/traffic_router.hpp"

#include "crossmesh/proto/admin.grpc.pb.h"
#include "crossmesh/proto/admin.pb.h"

#include <grpcpp/grpcpp.h>

#include <memory>

namespace crossmesh {
namespace services {

/**
 * @class AdminServiceImpl
 * @brief Implementation of the MeshAdmin gRPC service.
 *
 * GetStatus reports the local cluster, exported services, known peer
 * clusters, connection records, cache entries, breaker states and traffic
 * counters. Nothing here mutates mesh state.
 *
 * Usage:
 * @code
 * AdminServiceImpl admin(agent, connections, discovery, router);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:15002", grpc::InsecureServerCredentials());
 * builder.RegisterService(&admin);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class CROSSMESH_SERVICES_API AdminServiceImpl final : public admin::MeshAdmin::CallbackService {
public:
    /**
     * @param router May be null when the traffic plane is not running.
     */
    AdminServiceImpl(std::shared_ptr<core::MeshAgent> agent,
                     std::shared_ptr<core::ConnectionManager> connections,
                     std::shared_ptr<core::DiscoveryManager> discovery,
                     std::shared_ptr<core::TrafficRouter> router);

    ~AdminServiceImpl() override = default;

    AdminServiceImpl(const AdminServiceImpl&) = delete;
    AdminServiceImpl& operator=(const AdminServiceImpl&) = delete;

    grpc::ServerUnaryReactor* GetStatus(grpc::CallbackServerContext* context,
                                        const admin::StatusRequest* request,
                                        admin::StatusResponse* response) override;

    /// Fill a status report from the current mesh state.
    void buildStatus(admin::StatusResponse& response) const;

private:
    std::shared_ptr<core::MeshAgent> agent_;
    std::shared_ptr<core::ConnectionManager> connections_;
    std::shared_ptr<core::DiscoveryManager> discovery_;
    std::shared_ptr<core::TrafficRouter> router_;
};

}  // namespace services
}  // namespace crossmesh

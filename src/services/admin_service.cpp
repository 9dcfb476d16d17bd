/**
 * @file admin_service.cpp
 * @brief AdminServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/services/admin_service.hpp"
#include "crossmesh/core/proto_convert.hpp"
#include "crossmesh/utils/logger.hpp"

namespace crossmesh {
namespace services {

AdminServiceImpl::AdminServiceImpl(std::shared_ptr<core::MeshAgent> agent,
                                   std::shared_ptr<core::ConnectionManager> connections,
                                   std::shared_ptr<core::DiscoveryManager> discovery,
                                   std::shared_ptr<core::TrafficRouter> router)
    : agent_(std::move(agent))
    , connections_(std::move(connections))
    , discovery_(std::move(discovery))
    , router_(std::move(router))
{
    LOG_INFO("AdminService", "Created admin service");
}

void AdminServiceImpl::buildStatus(admin::StatusResponse& response) const {
    core::ClusterInfo local = agent_->localClusterInfo();
    response.set_cluster_id(local.cluster_id);
    response.set_node_id(local.node_id);
    response.set_node_addr(local.nodeAddr().toString());
    for (const auto& service : local.services) {
        core::toProto(service, response.add_services());
    }

    for (const auto& cluster : discovery_->listClusters()) {
        if (cluster.cluster_id != local.cluster_id) {
            response.add_peer_clusters(cluster.cluster_id);
        }
    }

    for (const auto& record : connections_->snapshot()) {
        auto* entry = response.add_connections();
        entry->set_cluster_id(record.cluster);
        entry->set_state(core::connectionStateToString(record.state));
        entry->set_path(core::pathQualityToString(record.quality));
        entry->set_node_id(record.node_id);
        entry->set_idle_ms(record.idle.count());
    }

    for (const auto& cached : discovery_->cacheSnapshot()) {
        auto* entry = response.add_cache();
        entry->set_route(cached.route);
        entry->set_endpoint_count(static_cast<int32_t>(cached.endpoint_count));
        entry->set_expires_in_ms(cached.expires_in.count());
    }

    response.set_identity_alerts(connections_->identityAlerts());

    auto* counters = response.mutable_counters();
    counters->set_queries_sent(discovery_->queriesSent());
    counters->set_queries_served(discovery_->queriesServed());

    if (router_) {
        for (const auto& breaker : router_->breakers().snapshot()) {
            auto* entry = response.add_breakers();
            entry->set_key(breaker.first);
            entry->set_state(core::breakerStateToString(breaker.second));
        }
        counters->set_requests_routed(router_->requestsRouted());
        counters->set_requests_failed(router_->requestsFailed());
        counters->set_retries(router_->retries());
        counters->set_inbound_served(router_->inboundServed());
    }
}

// =============================================================================
// GetStatus
// =============================================================================

class GetStatusReactor : public grpc::ServerUnaryReactor {
public:
    GetStatusReactor(const AdminServiceImpl* service, admin::StatusResponse* response) {
        service->buildStatus(*response);
        LOG_DEBUG("AdminService", "GetStatus: {} connections, {} cache entries",
                  response->connections_size(), response->cache_size());
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* AdminServiceImpl::GetStatus(grpc::CallbackServerContext* /*context*/,
                                                      const admin::StatusRequest* /*request*/,
                                                      admin::StatusResponse* response) {
    return new GetStatusReactor(this, response);
}

}  // namespace services
}  // namespace crossmesh

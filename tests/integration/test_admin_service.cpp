/**
 * @file test_admin_service.cpp
 * @brief Integration test: MeshAdmin.GetStatus over a real gRPC server
 */

#include <gtest/gtest.h>
#include <crossmesh/core/address_directory.hpp>
#include <crossmesh/core/cluster_scanner.hpp>
#include <crossmesh/core/connection_manager.hpp>
#include <crossmesh/core/discovery_manager.hpp>
#include <crossmesh/core/mesh_agent.hpp>
#include <crossmesh/core/route_table.hpp>
#include <crossmesh/core/traffic_router.hpp>
#include <crossmesh/services/admin_service.hpp>
#include <crossmesh/utils/logger.hpp>

#include "support/memory_transport.hpp"

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <chrono>
#include <memory>

using namespace crossmesh;
using namespace crossmesh::core;
using namespace crossmesh::testsupport;
using namespace std::chrono_literals;

class AdminServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::OFF);

        network_ = std::make_shared<MemoryNetwork>();
        auto endpoint = MemoryEndpoint::create(
            network_, NodeAddr{fakeNodeId('a'), "", {"10.0.0.1:15003"}});
        auto directory = std::make_shared<StaticAddressDirectory>();
        auto scanner = std::make_shared<StaticClusterScanner>();

        LocalService frontend;
        frontend.info = ServiceInfo("frontend", "web", 3000, "http");
        frontend.instances.push_back(InstanceAddress{"127.0.0.1", 3000, 1});
        scanner->upsertService(frontend);

        connections_ = std::make_shared<ConnectionManager>(endpoint, directory);

        DiscoveryConfig discoveryConfig;
        discoveryConfig.local_cluster = "cluster-a";
        discovery_ = std::make_shared<DiscoveryManager>(discoveryConfig, scanner, connections_);

        ClusterInfo peer;
        peer.cluster_id = "cluster-b";
        peer.node_id = fakeNodeId('b');
        discovery_->registerCluster(peer);

        MeshAgentConfig agentConfig;
        agentConfig.cluster_id = "cluster-a";
        agentConfig.relay_url = "relay.example.com:443";
        agent_ = std::make_shared<MeshAgent>(agentConfig, endpoint, directory, scanner, discovery_);
        agent_->discoverOnce();
        agent_->registerOnce();

        router_ = std::make_shared<TrafficRouter>(
            "cluster-a", std::make_shared<RouteTable>(discovery_, LoadBalancingAlgorithm::ROUND_ROBIN),
            connections_, discovery_);

        service_ = std::make_unique<services::AdminServiceImpl>(agent_, connections_, discovery_,
                                                                router_);
        int port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_NE(port, 0);

        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(port),
                                           grpc::InsecureChannelCredentials());
        stub_ = admin::MeshAdmin::NewStub(channel);
    }

    void TearDown() override {
        server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
        connections_->shutdown();
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    grpc::Status getStatus(admin::StatusResponse& response) {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
        admin::StatusRequest request;
        return stub_->GetStatus(&context, request, &response);
    }

    std::shared_ptr<MemoryNetwork> network_;
    std::shared_ptr<ConnectionManager> connections_;
    std::shared_ptr<DiscoveryManager> discovery_;
    std::shared_ptr<MeshAgent> agent_;
    std::shared_ptr<TrafficRouter> router_;
    std::unique_ptr<services::AdminServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<admin::MeshAdmin::Stub> stub_;
};

TEST_F(AdminServiceTest, ReportsLocalCluster) {
    admin::StatusResponse response;
    ASSERT_TRUE(getStatus(response).ok());

    EXPECT_EQ(response.cluster_id(), "cluster-a");
    EXPECT_EQ(response.node_id(), fakeNodeId('a'));
    EXPECT_NE(response.node_addr().find("relay=relay.example.com:443"), std::string::npos);
    ASSERT_EQ(response.services_size(), 1);
    EXPECT_EQ(response.services(0).name(), "frontend");
}

TEST_F(AdminServiceTest, ListsPeersButNotSelf) {
    admin::StatusResponse response;
    ASSERT_TRUE(getStatus(response).ok());

    ASSERT_EQ(response.peer_clusters_size(), 1);
    EXPECT_EQ(response.peer_clusters(0), "cluster-b");
}

TEST_F(AdminServiceTest, ReportsTrafficState) {
    proxy::ProxyRequest request;
    request.set_method("GET");
    request.set_host("missing.web.cluster-a.mesh");
    EXPECT_EQ(router_->handleOrError(request).status(), 404);

    admin::StatusResponse response;
    ASSERT_TRUE(getStatus(response).ok());

    EXPECT_EQ(response.counters().requests_failed(), 1u);
    EXPECT_EQ(response.counters().requests_routed(), 0u);
    ASSERT_EQ(response.breakers_size(), 1);
    EXPECT_EQ(response.breakers(0).key(), "cluster-a/web/missing");
    EXPECT_EQ(response.breakers(0).state(), "closed");
    EXPECT_EQ(response.connections_size(), 0);
    EXPECT_EQ(response.identity_alerts(), 0u);
}

/**
 * @file test_grpc_endpoint.cpp
 * @brief Integration test: gRPC mesh transport over localhost
 */

#include <gtest/gtest.h>
#include <crossmesh/core/errors.hpp>
#include <crossmesh/services/grpc_endpoint.hpp>
#include <crossmesh/utils/logger.hpp>
#include <crossmesh/utils/node_identity.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace crossmesh;
using namespace crossmesh::core;
using namespace crossmesh::services;
using namespace std::chrono_literals;

namespace {

template<typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

std::string readAll(Stream& stream) {
    std::string out;
    std::string chunk;
    while (stream.read(chunk, 2s)) {
        out += chunk;
    }
    return out;
}

}  // namespace

class GrpcEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::OFF);

        GrpcEndpointConfig serverConfig;
        serverConfig.node_id = utils::generateNodeId();
        serverConfig.cluster_id = "cluster-b";
        serverConfig.bind_address = "127.0.0.1";
        serverConfig.port = 0;
        server_ = std::make_unique<GrpcEndpoint>(serverConfig);
        ASSERT_TRUE(server_->start());

        clientConfig_.node_id = utils::generateNodeId();
        clientConfig_.cluster_id = "cluster-a";
        clientConfig_.bind_address = "127.0.0.1";
        clientConfig_.port = 0;
        clientConfig_.upgrade_interval = 200ms;
    }

    void TearDown() override {
        if (client_) {
            client_->close();
        }
        server_->close();
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    GrpcEndpoint& client() {
        if (!client_) {
            client_ = std::make_unique<GrpcEndpoint>(clientConfig_);
        }
        return *client_;
    }

    std::string serverAddress() const {
        return "127.0.0.1:" + std::to_string(server_->boundPort());
    }

    ErrorKind connectFailure(const NodeAddr& addr, ConnectPath path) {
        try {
            client().connect(addr, path, 500ms);
        } catch (const MeshError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "connect to " << addr.toString() << " did not fail";
        return ErrorKind::MALFORMED;
    }

    std::unique_ptr<GrpcEndpoint> server_;
    std::unique_ptr<GrpcEndpoint> client_;
    GrpcEndpointConfig clientConfig_;
};

// =============================================================================
// Status mapping
// =============================================================================

TEST(GrpcStatusMappingTest, MapsCodesToErrorKinds) {
    EXPECT_EQ(toMeshError(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, ""), "x").kind(),
              ErrorKind::TIMEOUT);
    EXPECT_EQ(toMeshError(grpc::Status(grpc::StatusCode::UNAVAILABLE, ""), "x").kind(),
              ErrorKind::UNREACHABLE);
    EXPECT_EQ(toMeshError(grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, ""), "x").kind(),
              ErrorKind::IDENTITY_MISMATCH);
    EXPECT_EQ(toMeshError(grpc::Status(grpc::StatusCode::INTERNAL, ""), "x").kind(),
              ErrorKind::CONNECTION_CLOSED);
}

// =============================================================================
// Listener
// =============================================================================

TEST_F(GrpcEndpointTest, BindsEphemeralPort) {
    EXPECT_NE(server_->boundPort(), 0);

    auto addr = server_->localAddr();
    EXPECT_EQ(addr.node_id, server_->nodeId());
    ASSERT_EQ(addr.direct_addresses.size(), 1u);
    EXPECT_EQ(addr.direct_addresses[0], serverAddress());
}

TEST_F(GrpcEndpointTest, AdvertisedAddressesWin) {
    clientConfig_.advertise_addresses = {"203.0.113.9:15003"};
    clientConfig_.relay_url = "relay.example.com:443";
    auto addr = client().localAddr();
    ASSERT_EQ(addr.direct_addresses.size(), 1u);
    EXPECT_EQ(addr.direct_addresses[0], "203.0.113.9:15003");
    EXPECT_EQ(addr.relay_url, "relay.example.com:443");
}

// =============================================================================
// Connections and streams
// =============================================================================

TEST_F(GrpcEndpointTest, DirectConnectProvesIdentity) {
    auto connection = client().connect(server_->localAddr(), ConnectPath::DIRECT, 2s);
    ASSERT_NE(connection, nullptr);
    EXPECT_EQ(connection->remoteNodeId(), server_->nodeId());
    EXPECT_EQ(connection->quality(), PathQuality::DIRECT);

    auto inbound = server_->accept(2s);
    ASSERT_NE(inbound, nullptr);
    EXPECT_EQ(inbound->remoteNodeId(), client().nodeId());
    EXPECT_EQ(server_->inboundConnectionCount(), 1u);
}

TEST_F(GrpcEndpointTest, StreamCarriesBytesBothWays) {
    auto connection = client().connect(server_->localAddr(), ConnectPath::DIRECT, 2s);
    auto inbound = server_->accept(2s);
    ASSERT_NE(inbound, nullptr);

    auto outgoing = connection->openStream(2s);
    outgoing->write("ping ");
    outgoing->write("payload");
    outgoing->finish();

    auto incoming = inbound->acceptStream(2s);
    ASSERT_NE(incoming, nullptr);
    EXPECT_EQ(readAll(*incoming), "ping payload");

    incoming->write("pong");
    incoming->finish();
    EXPECT_EQ(readAll(*outgoing), "pong");
}

TEST_F(GrpcEndpointTest, ManyStreamsShareOneConnection) {
    auto connection = client().connect(server_->localAddr(), ConnectPath::DIRECT, 2s);
    auto inbound = server_->accept(2s);
    ASSERT_NE(inbound, nullptr);

    std::atomic<int> served{0};
    std::thread responder([&inbound, &served] {
        for (int i = 0; i < 5; ++i) {
            auto stream = inbound->acceptStream(2s);
            if (!stream) {
                return;
            }
            std::string request = readAll(*stream);
            stream->write("echo " + request);
            stream->finish();
            served.fetch_add(1);
        }
    });

    std::vector<std::string> replies;
    for (int i = 0; i < 5; ++i) {
        auto stream = connection->openStream(2s);
        stream->write(std::to_string(i));
        stream->finish();
        replies.push_back(readAll(*stream));
    }
    responder.join();

    EXPECT_EQ(served.load(), 5);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(replies[static_cast<size_t>(i)], "echo " + std::to_string(i));
    }
    EXPECT_EQ(server_->inboundConnectionCount(), 1u);
}

TEST_F(GrpcEndpointTest, WrongIdentityIsRejected) {
    NodeAddr addr = server_->localAddr();
    addr.node_id = utils::generateNodeId();
    EXPECT_EQ(connectFailure(addr, ConnectPath::DIRECT), ErrorKind::IDENTITY_MISMATCH);
    EXPECT_EQ(server_->inboundConnectionCount(), 0u);
}

TEST_F(GrpcEndpointTest, NothingListeningIsTransportFailure) {
    NodeAddr addr{server_->nodeId(), "", {"127.0.0.1:1"}};
    ErrorKind kind = connectFailure(addr, ConnectPath::DIRECT);
    EXPECT_TRUE(isTransportFailure(kind)) << errorKindToString(kind);
}

TEST_F(GrpcEndpointTest, RelayNeedsRelayUrl) {
    NodeAddr addr{server_->nodeId(), "", {serverAddress()}};
    EXPECT_EQ(connectFailure(addr, ConnectPath::RELAY), ErrorKind::UNREACHABLE);
}

TEST_F(GrpcEndpointTest, RelayedConnectionUpgradesToDirect) {
    NodeAddr addr{server_->nodeId(), serverAddress(), {serverAddress()}};
    auto connection = client().connect(addr, ConnectPath::RELAY, 2s);
    ASSERT_EQ(connection->quality(), PathQuality::RELAYED);

    std::atomic<bool> upgraded{false};
    connection->onPathChange([&upgraded](PathQuality quality) {
        if (quality == PathQuality::DIRECT) {
            upgraded.store(true);
        }
    });

    auto inbound = server_->accept(2s);
    ASSERT_NE(inbound, nullptr);
    EXPECT_EQ(inbound->quality(), PathQuality::RELAYED);

    EXPECT_TRUE(waitFor([&upgraded] { return upgraded.load(); }, 3s));
    EXPECT_EQ(connection->quality(), PathQuality::DIRECT);
    EXPECT_TRUE(waitFor([&inbound] { return inbound->quality() == PathQuality::DIRECT; }, 3s));

    auto stream = connection->openStream(2s);
    stream->write("after upgrade");
    stream->finish();
    auto incoming = inbound->acceptStream(2s);
    ASSERT_NE(incoming, nullptr);
    EXPECT_EQ(readAll(*incoming), "after upgrade");
    EXPECT_EQ(server_->inboundConnectionCount(), 1u);
}

TEST_F(GrpcEndpointTest, InFlightStreamSurvivesUpgrade) {
    NodeAddr addr{server_->nodeId(), serverAddress(), {serverAddress()}};
    auto connection = client().connect(addr, ConnectPath::RELAY, 2s);
    ASSERT_EQ(connection->quality(), PathQuality::RELAYED);

    std::atomic<bool> upgraded{false};
    connection->onPathChange([&upgraded](PathQuality quality) {
        if (quality == PathQuality::DIRECT) {
            upgraded.store(true);
        }
    });

    auto inbound = server_->accept(2s);
    ASSERT_NE(inbound, nullptr);

    // Half a request goes out over the relayed path
    auto stream = connection->openStream(5s);
    stream->write("GET /ledger ");
    auto incoming = inbound->acceptStream(2s);
    ASSERT_NE(incoming, nullptr);
    std::string received;
    ASSERT_TRUE(incoming->read(received, 2s));
    EXPECT_EQ(received, "GET /ledger ");

    ASSERT_TRUE(waitFor([&upgraded] { return upgraded.load(); }, 3s));
    EXPECT_EQ(connection->quality(), PathQuality::DIRECT);

    stream->write("HTTP/1.1");
    stream->finish();
    received += readAll(*incoming);
    EXPECT_EQ(received, "GET /ledger HTTP/1.1");

    incoming->write("200 OK");
    incoming->finish();
    EXPECT_EQ(readAll(*stream), "200 OK");
    EXPECT_EQ(server_->inboundConnectionCount(), 1u);
    EXPECT_FALSE(connection->isClosed());
}

TEST_F(GrpcEndpointTest, ClientCloseReachesServer) {
    auto connection = client().connect(server_->localAddr(), ConnectPath::DIRECT, 2s);
    auto inbound = server_->accept(2s);
    ASSERT_NE(inbound, nullptr);

    connection->close();
    EXPECT_TRUE(connection->isClosed());
    EXPECT_TRUE(waitFor([&inbound] { return inbound->isClosed(); }, 2s));
    EXPECT_THROW(connection->openStream(1s), MeshError);
}

TEST_F(GrpcEndpointTest, ClosedEndpointRefusesWork) {
    client().close();
    try {
        client().connect(server_->localAddr(), ConnectPath::DIRECT, 1s);
        FAIL() << "expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CONNECTION_CLOSED);
    }

    server_->close();
    try {
        server_->accept(100ms);
        FAIL() << "expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CONNECTION_CLOSED);
    }
}

/**
 * @file test_discovery_server.cpp
 * @brief Unit tests for the peer-facing stream dispatcher
 */

#include <gtest/gtest.h>
#include <crossmesh/core/address_directory.hpp>
#include <crossmesh/core/cluster_scanner.hpp>
#include <crossmesh/core/connection_manager.hpp>
#include <crossmesh/core/discovery_manager.hpp>
#include <crossmesh/core/discovery_server.hpp>
#include <crossmesh/core/errors.hpp>
#include <crossmesh/core/framing.hpp>
#include <crossmesh/utils/logger.hpp>

#include "support/memory_transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace crossmesh;
using namespace crossmesh::core;
using namespace crossmesh::testsupport;
using namespace std::chrono_literals;

class DiscoveryServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::OFF);

        network_ = std::make_shared<MemoryNetwork>();
        serverAddr_ = NodeAddr{fakeNodeId('b'), "", {"server"}};
        serverEndpoint_ = MemoryEndpoint::create(network_, serverAddr_);
        clientEndpoint_ = MemoryEndpoint::create(network_, NodeAddr{fakeNodeId('a'), "", {"client"}});

        auto scanner = std::make_shared<StaticClusterScanner>();
        LocalService service;
        service.info = ServiceInfo("payment-service", "production", 8080, "http");
        service.instances.push_back(InstanceAddress{"10.0.0.5", 8080, 1});
        scanner->upsertService(service);

        DiscoveryConfig config;
        config.local_cluster = "cluster-b";
        discovery_ = std::make_shared<DiscoveryManager>(
            config, scanner,
            std::make_shared<ConnectionManager>(serverEndpoint_,
                                                std::make_shared<StaticAddressDirectory>()));

        DiscoveryServerConfig serverConfig;
        serverConfig.poll_interval = 50ms;
        serverConfig.stream_timeout = 500ms;
        server_ = std::make_unique<DiscoveryServer>(serverEndpoint_, discovery_, serverConfig);
    }

    void TearDown() override {
        server_->stop();
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    std::shared_ptr<Stream> openStream() {
        if (!connection_) {
            connection_ = clientEndpoint_->connect(serverAddr_, ConnectPath::DIRECT, 500ms);
        }
        return connection_->openStream(500ms);
    }

    static void sendQuery(Stream& stream, const std::string& service, const std::string& ns) {
        writeStreamHeader(stream, proxy::STREAM_DISCOVERY, "cluster-a");
        discovery::DiscoveryQuery query;
        query.set_service(service);
        query.set_namespace_(ns);
        query.set_source_cluster("cluster-a");
        writeMessage(stream, query);
        stream.finish();
    }

    // Read until the server finishes or aborts the stream.
    static bool readResponse(Stream& stream, discovery::DiscoveryResponse& response) {
        FrameReader reader(stream);
        try {
            return reader.readMessage(response, Deadline::after(1s));
        } catch (const MeshError&) {
            return false;
        }
    }

    static bool waitFor(const std::function<bool()>& predicate) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!predicate()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    std::shared_ptr<MemoryNetwork> network_;
    NodeAddr serverAddr_;
    std::shared_ptr<MemoryEndpoint> serverEndpoint_;
    std::shared_ptr<MemoryEndpoint> clientEndpoint_;
    std::shared_ptr<DiscoveryManager> discovery_;
    std::unique_ptr<DiscoveryServer> server_;
    std::shared_ptr<Connection> connection_;
};

TEST_F(DiscoveryServerTest, StartStop) {
    EXPECT_FALSE(server_->isRunning());
    ASSERT_TRUE(server_->start());
    EXPECT_TRUE(server_->isRunning());
    EXPECT_FALSE(server_->start());
    server_->stop();
    EXPECT_FALSE(server_->isRunning());
}

TEST_F(DiscoveryServerTest, AnswersDiscoveryQuery) {
    ASSERT_TRUE(server_->start());

    auto stream = openStream();
    sendQuery(*stream, "payment-service", "production");

    discovery::DiscoveryResponse response;
    ASSERT_TRUE(readResponse(*stream, response));
    EXPECT_EQ(response.status(), discovery::DiscoveryResponse::FOUND);
    ASSERT_EQ(response.endpoints_size(), 1);
    EXPECT_EQ(response.endpoints(0).address(), "10.0.0.5");

    EXPECT_TRUE(waitFor([this] { return server_->queriesAnswered() == 1; }));
    EXPECT_EQ(server_->connectionsAccepted(), 1u);
}

TEST_F(DiscoveryServerTest, ManyStreamsOnOneConnection) {
    ASSERT_TRUE(server_->start());

    for (int i = 0; i < 5; ++i) {
        auto stream = openStream();
        sendQuery(*stream, "payment-service", "production");
        discovery::DiscoveryResponse response;
        ASSERT_TRUE(readResponse(*stream, response));
    }

    EXPECT_TRUE(waitFor([this] { return server_->queriesAnswered() == 5; }));
    EXPECT_EQ(server_->connectionsAccepted(), 1u);
}

TEST_F(DiscoveryServerTest, AuthorizationHookDenies) {
    std::atomic<int> calls{0};
    server_->setAuthorizationHook([&calls](const NodeId& peer, const discovery::DiscoveryQuery& query) {
        calls.fetch_add(1);
        return peer == fakeNodeId('a') && query.namespace_() != "production";
    });
    ASSERT_TRUE(server_->start());

    auto stream = openStream();
    sendQuery(*stream, "payment-service", "production");

    discovery::DiscoveryResponse response;
    EXPECT_FALSE(readResponse(*stream, response));
    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(waitFor([this] { return server_->streamsRejected() == 1; }));
    EXPECT_EQ(server_->queriesAnswered(), 0u);
}

TEST_F(DiscoveryServerTest, QueryWithoutServiceIsRejected) {
    ASSERT_TRUE(server_->start());

    auto stream = openStream();
    sendQuery(*stream, "", "production");

    discovery::DiscoveryResponse response;
    EXPECT_FALSE(readResponse(*stream, response));
    EXPECT_TRUE(waitFor([this] { return server_->streamsRejected() == 1; }));
}

TEST_F(DiscoveryServerTest, UnknownStreamKindIsRejected) {
    ASSERT_TRUE(server_->start());

    auto stream = openStream();
    writeStreamHeader(*stream, proxy::STREAM_UNKNOWN, "cluster-a");
    stream->finish();

    discovery::DiscoveryResponse response;
    EXPECT_FALSE(readResponse(*stream, response));
    EXPECT_TRUE(waitFor([this] { return server_->streamsRejected() == 1; }));
}

TEST_F(DiscoveryServerTest, ProxyStreamWithoutHandlerIsRejected) {
    ASSERT_TRUE(server_->start());

    auto stream = openStream();
    writeStreamHeader(*stream, proxy::STREAM_PROXY, "cluster-a");

    EXPECT_TRUE(waitFor([this] { return server_->streamsRejected() == 1; }));
}

TEST_F(DiscoveryServerTest, ProxyStreamGoesToInboundHandler) {
    std::atomic<bool> handled{false};
    server_->setInboundHandler([&handled](const proxy::StreamHeader& header, Stream& stream,
                                          FrameReader& reader) {
        EXPECT_EQ(header.source_cluster(), "cluster-a");
        proxy::ProxyRequest request;
        ASSERT_TRUE(reader.readMessage(request, Deadline::after(1s)));

        proxy::ProxyResponse response;
        response.set_request_id(request.request_id());
        response.set_status(200);
        response.set_body("handled " + request.path());
        writeMessage(stream, response);
        stream.finish();
        handled.store(true);
    });
    ASSERT_TRUE(server_->start());

    auto stream = openStream();
    writeStreamHeader(*stream, proxy::STREAM_PROXY, "cluster-a");
    proxy::ProxyRequest request;
    request.set_request_id("req-1");
    request.set_path("/pay");
    writeMessage(*stream, request);
    stream->finish();

    FrameReader reader(*stream);
    proxy::ProxyResponse response;
    ASSERT_TRUE(reader.readMessage(response, Deadline::after(1s)));
    EXPECT_EQ(response.status(), 200);
    EXPECT_EQ(response.body(), "handled /pay");
    EXPECT_TRUE(handled.load());
}

TEST_F(DiscoveryServerTest, StopClosesAcceptedConnections) {
    ASSERT_TRUE(server_->start());
    auto stream = openStream();
    sendQuery(*stream, "payment-service", "production");
    discovery::DiscoveryResponse response;
    ASSERT_TRUE(readResponse(*stream, response));

    server_->stop();
    EXPECT_TRUE(connection_->isClosed());
}

TEST_F(DiscoveryServerTest, FailingInboundHandlerClosesStream) {
    server_->setInboundHandler([](const proxy::StreamHeader&, Stream&, FrameReader&) {
        throw std::runtime_error("handler exploded");
    });
    ASSERT_TRUE(server_->start());

    auto stream = openStream();
    writeStreamHeader(*stream, proxy::STREAM_PROXY, "cluster-a");
    stream->finish();

    auto started = std::chrono::steady_clock::now();
    discovery::DiscoveryResponse response;
    EXPECT_FALSE(readResponse(*stream, response));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    EXPECT_LT(elapsed.count(), 500);
    EXPECT_TRUE(waitFor([this] { return server_->streamsRejected() == 1; }));
}

// =============================================================================
// Capacity
// =============================================================================

TEST_F(DiscoveryServerTest, StreamsBeyondCapacityAreShed) {
    DiscoveryServerConfig capped;
    capped.poll_interval = 50ms;
    capped.stream_timeout = 500ms;
    capped.max_tasks = 2;  // the connection plus one stream
    server_ = std::make_unique<DiscoveryServer>(serverEndpoint_, discovery_, capped);

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    server_->setInboundHandler([&entered, &release](const proxy::StreamHeader&, Stream& stream,
                                                    FrameReader&) {
        entered.store(true);
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!release.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        stream.finish();
    });
    ASSERT_TRUE(server_->start());

    auto busy = openStream();
    writeStreamHeader(*busy, proxy::STREAM_PROXY, "cluster-a");
    ASSERT_TRUE(waitFor([&entered] { return entered.load(); }));

    auto shed = openStream();
    sendQuery(*shed, "payment-service", "production");
    discovery::DiscoveryResponse response;
    EXPECT_FALSE(readResponse(*shed, response));
    EXPECT_EQ(server_->streamsRejected(), 1u);
    EXPECT_EQ(server_->queriesAnswered(), 0u);

    release.store(true);
    busy->close();

    ASSERT_TRUE(waitFor([this] {
        auto retry = openStream();
        sendQuery(*retry, "payment-service", "production");
        discovery::DiscoveryResponse answer;
        return readResponse(*retry, answer);
    }));
    EXPECT_GE(server_->queriesAnswered(), 1u);
}

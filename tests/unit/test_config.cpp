/**
 * @file test_config.cpp
 * @brief Unit tests for daemon configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing
 * - Peer and export specifications
 * - Error handling
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <crossmesh/daemon/config.hpp>

#include <vector>
#include <string>
#include <cstring>

using namespace crossmesh;
using namespace crossmesh::daemon;

namespace {
const std::string NODE_A(64, 'a');
const std::string NODE_B(64, 'b');
}

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

    Config parse(const std::vector<std::string>& args) {
        auto [argc, argv] = makeArgs(args);
        return parseArgs(argc, argv.data());
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.cluster_id, "default");
    EXPECT_EQ(config.bind_addr, "0.0.0.0");
    EXPECT_EQ(config.mesh_port, 15003);
    EXPECT_EQ(config.proxy_port, 15001);
    EXPECT_EQ(config.admin_port, 15002);
    EXPECT_EQ(config.proxy_bind_addr, "127.0.0.1");
    EXPECT_TRUE(config.key_file.empty());
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_EQ(config.cache_ttl_ms, 30000);
    EXPECT_EQ(config.discovery_timeout_ms, 5000);
    EXPECT_EQ(config.connect_timeout_ms, 5000);
    EXPECT_EQ(config.max_retries, 2);
    EXPECT_EQ(config.breaker_threshold, 5);
    EXPECT_EQ(config.lb_algorithm, "round-robin");
    EXPECT_TRUE(config.peers.empty());
    EXPECT_TRUE(config.exports.empty());
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.error);
}

TEST_F(ConfigTest, NoArgumentsKeepsDefaults) {
    Config config = parse({"crossmeshd"});
    EXPECT_EQ(config.cluster_id, "default");
    EXPECT_FALSE(config.help);
}

// =============================================================================
// Basic Options
// =============================================================================

TEST_F(ConfigTest, ParsesBasicOptions) {
    Config config = parse({"crossmeshd",
                           "--cluster", "east",
                           "--bind", "10.0.0.1",
                           "--mesh-port", "16003",
                           "--proxy-port", "16001",
                           "--admin-port", "16002",
                           "--key-file", "/tmp/node.key",
                           "--relay", "relay.example:443",
                           "--advertise", "10.0.0.1:16003,192.168.1.1:16003",
                           "--namespace", "production",
                           "--log-level", "DEBUG"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.cluster_id, "east");
    EXPECT_EQ(config.bind_addr, "10.0.0.1");
    EXPECT_EQ(config.mesh_port, 16003);
    EXPECT_EQ(config.proxy_port, 16001);
    EXPECT_EQ(config.admin_port, 16002);
    EXPECT_EQ(config.key_file, "/tmp/node.key");
    EXPECT_EQ(config.relay_url, "relay.example:443");
    EXPECT_THAT(config.advertise, ::testing::ElementsAre("10.0.0.1:16003", "192.168.1.1:16003"));
    EXPECT_EQ(config.namespace_filter, "production");
    EXPECT_EQ(config.log_level, "DEBUG");
}

TEST_F(ConfigTest, ParsesTuningOptions) {
    Config config = parse({"crossmeshd",
                           "--cache-ttl-ms", "1000",
                           "--discovery-timeout-ms", "2000",
                           "--connect-timeout-ms", "3000",
                           "--idle-timeout-ms", "4000",
                           "--resolve-attempts", "6",
                           "--max-retries", "0",
                           "--breaker-threshold", "3",
                           "--breaker-window-ms", "5000",
                           "--breaker-cooldown-ms", "7000",
                           "--lb", "ewma-latency",
                           "--max-tasks", "64"});

    EXPECT_FALSE(config.error);
    EXPECT_EQ(config.cache_ttl_ms, 1000);
    EXPECT_EQ(config.discovery_timeout_ms, 2000);
    EXPECT_EQ(config.connect_timeout_ms, 3000);
    EXPECT_EQ(config.idle_timeout_ms, 4000);
    EXPECT_EQ(config.resolve_attempts, 6);
    EXPECT_EQ(config.max_retries, 0);
    EXPECT_EQ(config.breaker_threshold, 3);
    EXPECT_EQ(config.breaker_window_ms, 5000);
    EXPECT_EQ(config.breaker_cooldown_ms, 7000);
    EXPECT_EQ(config.lb_algorithm, "ewma-latency");
    EXPECT_EQ(config.max_tasks, 64);
}

TEST_F(ConfigTest, HelpFlag) {
    Config config = parse({"crossmeshd", "--help"});
    EXPECT_TRUE(config.help);
    EXPECT_FALSE(config.error);

    Config short_form = parse({"crossmeshd", "-h"});
    EXPECT_TRUE(short_form.help);
}

// =============================================================================
// Peers
// =============================================================================

TEST_F(ConfigTest, PeerWithDirectAddresses) {
    Config config = parse({"crossmeshd",
                           "--peer", "west=" + NODE_A + "@10.1.0.2:15003,10.1.0.3:15003"});

    ASSERT_EQ(config.peers.count("west"), 1u);
    const auto& peer = config.peers.at("west");
    EXPECT_EQ(peer.node_id, NODE_A);
    EXPECT_THAT(peer.direct_addresses, ::testing::ElementsAre("10.1.0.2:15003", "10.1.0.3:15003"));
    EXPECT_TRUE(peer.relay_url.empty());
}

TEST_F(ConfigTest, PeerRelayMergesWithPeer) {
    Config config = parse({"crossmeshd",
                           "--peer-relay", "west=relay.example:443",
                           "--peer", "west=" + NODE_A + "@",
                           "--peer", "north=" + NODE_B + "@10.2.0.1:15003"});

    ASSERT_EQ(config.peers.size(), 2u);
    const auto& west = config.peers.at("west");
    EXPECT_EQ(west.node_id, NODE_A);
    EXPECT_TRUE(west.direct_addresses.empty());
    EXPECT_EQ(west.relay_url, "relay.example:443");
    EXPECT_EQ(config.peers.at("north").node_id, NODE_B);
}

TEST_F(ConfigTest, PeerSpecRejectsMalformedInput) {
    core::ClusterId cluster;
    core::NodeAddr addr;
    EXPECT_FALSE(parsePeerSpec("west", cluster, addr));
    EXPECT_FALSE(parsePeerSpec("=abc@1.2.3.4:1", cluster, addr));
    EXPECT_FALSE(parsePeerSpec("west=@1.2.3.4:1", cluster, addr));
    EXPECT_FALSE(parsePeerSpec("west=abc", cluster, addr));

    std::string relay;
    EXPECT_FALSE(parsePeerRelaySpec("west=", cluster, relay));
    EXPECT_FALSE(parsePeerRelaySpec("=relay:1", cluster, relay));
}

TEST_F(ConfigTest, InvalidPeerSetsError) {
    Config config = parse({"crossmeshd", "--peer", "garbage"});
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

// =============================================================================
// Exports
// =============================================================================

TEST_F(ConfigTest, ExportWithProtocolAndInstances) {
    Config config = parse({"crossmeshd",
                           "--export", "payment-service.production:8080/grpc=10.0.0.5:9090,10.0.0.6:9090"});

    ASSERT_EQ(config.exports.size(), 1u);
    const auto& service = config.exports[0];
    EXPECT_EQ(service.info.name, "payment-service");
    EXPECT_EQ(service.info.ns, "production");
    EXPECT_EQ(service.info.port, 8080);
    EXPECT_EQ(service.info.protocol, "grpc");
    ASSERT_EQ(service.instances.size(), 2u);
    EXPECT_EQ(service.instances[0].address, "10.0.0.5");
    EXPECT_EQ(service.instances[0].port, 9090);
    EXPECT_EQ(service.instances[1].address, "10.0.0.6");
}

TEST_F(ConfigTest, ExportProtocolDefaultsToHttp) {
    core::LocalService service;
    ASSERT_TRUE(parseExportSpec("orders.shop:80=127.0.0.1:8081", service));
    EXPECT_EQ(service.info.protocol, "http");
    EXPECT_EQ(service.info.key(), "orders.shop:80/http");
}

TEST_F(ConfigTest, ExportSpecRejectsMalformedInput) {
    core::LocalService service;
    EXPECT_FALSE(parseExportSpec("orders.shop:80", service));
    EXPECT_FALSE(parseExportSpec("orders:80=1.2.3.4:80", service));
    EXPECT_FALSE(parseExportSpec("orders.shop:80=", service));
    EXPECT_FALSE(parseExportSpec("orders.shop:0=1.2.3.4:80", service));
    EXPECT_FALSE(parseExportSpec("orders.shop:80=1.2.3.4:70000", service));
    EXPECT_FALSE(parseExportSpec(".shop:80=1.2.3.4:80", service));
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, MissingValueSetsError) {
    Config config = parse({"crossmeshd", "--cluster"});
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, UnknownOptionSetsError) {
    Config config = parse({"crossmeshd", "--bogus", "1"});
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, NonNumericValueSetsError) {
    Config config = parse({"crossmeshd", "--mesh-port", "abc"});
    EXPECT_TRUE(config.error);

    Config bad_export = parse({"crossmeshd", "--export", "a.b:xx=1.2.3.4:80"});
    EXPECT_TRUE(bad_export.error);
}

TEST_F(ConfigTest, MaxTasksMustBePositive) {
    EXPECT_TRUE(parse({"crossmeshd", "--max-tasks", "0"}).error);
    EXPECT_TRUE(parse({"crossmeshd", "--max-tasks", "-3"}).error);
}

TEST_F(ConfigTest, SplitListDropsEmptyPieces) {
    EXPECT_THAT(splitList("a,,b,", ','), ::testing::ElementsAre("a", "b"));
    EXPECT_TRUE(splitList("", ',').empty());
}

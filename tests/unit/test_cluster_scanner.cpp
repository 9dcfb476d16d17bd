/**
 * @file test_cluster_scanner.cpp
 * @brief Unit tests for the local service catalogue
 */

#include <gtest/gtest.h>
#include <crossmesh/core/cluster_scanner.hpp>
#include <crossmesh/utils/logger.hpp>

#include <vector>

using namespace crossmesh::core;

class ClusterScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        crossmesh::utils::Logger::instance().setLevel(crossmesh::utils::LogLevel::OFF);
    }

    void TearDown() override {
        crossmesh::utils::Logger::instance().setLevel(crossmesh::utils::LogLevel::INFO);
    }

    static LocalService makeService(const std::string& name, const std::string& ns,
                                    std::initializer_list<const char*> addresses) {
        LocalService service;
        service.info = ServiceInfo(name, ns, 8080, "http");
        for (const char* address : addresses) {
            InstanceAddress instance;
            instance.address = address;
            instance.port = 8080;
            service.instances.push_back(instance);
        }
        return service;
    }

    StaticClusterScanner scanner_;
};

TEST_F(ClusterScannerTest, StartsEmpty) {
    auto snapshot = scanner_.listServices();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->version, 0u);
    EXPECT_TRUE(snapshot->services.empty());
}

TEST_F(ClusterScannerTest, UpsertAddsThenReplaces) {
    scanner_.upsertService(makeService("payment-service", "production", {"10.0.0.5"}));
    scanner_.upsertService(makeService("payment-service", "production", {"10.0.0.5", "10.0.0.6"}));

    auto snapshot = scanner_.listServices();
    ASSERT_EQ(snapshot->services.size(), 1u);
    EXPECT_EQ(snapshot->version, 2u);

    const LocalService* found = snapshot->find("payment-service", "production");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->instances.size(), 2u);
    EXPECT_EQ(snapshot->find("payment-service", "staging"), nullptr);
}

TEST_F(ClusterScannerTest, SnapshotsAreImmutable) {
    scanner_.upsertService(makeService("a", "ns", {"10.0.0.1"}));
    auto before = scanner_.listServices();

    scanner_.upsertService(makeService("b", "ns", {"10.0.0.2"}));

    EXPECT_EQ(before->services.size(), 1u);
    EXPECT_EQ(scanner_.listServices()->services.size(), 2u);
}

TEST_F(ClusterScannerTest, NamespaceFilter) {
    scanner_.upsertService(makeService("a", "production", {"10.0.0.1"}));
    scanner_.upsertService(makeService("b", "staging", {"10.0.0.2"}));

    auto production = scanner_.listServices("production");
    ASSERT_EQ(production->services.size(), 1u);
    EXPECT_EQ(production->services[0].info.name, "a");
    EXPECT_TRUE(scanner_.listServices("absent")->services.empty());
    EXPECT_EQ(scanner_.listServices()->services.size(), 2u);
}

TEST_F(ClusterScannerTest, RemoveService) {
    scanner_.upsertService(makeService("a", "ns", {"10.0.0.1"}));
    EXPECT_FALSE(scanner_.removeService("a", "other"));
    EXPECT_TRUE(scanner_.removeService("a", "ns"));
    EXPECT_TRUE(scanner_.listServices()->services.empty());
}

TEST_F(ClusterScannerTest, WatchersSeeEveryChange) {
    std::vector<uint64_t> versions;
    uint64_t token = scanner_.watchChanges([&versions](const SnapshotPtr& snapshot) {
        versions.push_back(snapshot->version);
    });

    scanner_.upsertService(makeService("a", "ns", {"10.0.0.1"}));
    scanner_.removeService("a", "ns");
    scanner_.unwatch(token);
    scanner_.upsertService(makeService("b", "ns", {"10.0.0.2"}));

    EXPECT_EQ(versions, (std::vector<uint64_t>{1, 2}));
}

TEST_F(ClusterScannerTest, ServiceInfosListsExports) {
    scanner_.upsertService(makeService("a", "ns", {"10.0.0.1"}));
    scanner_.upsertService(makeService("b", "ns", {"10.0.0.2"}));

    auto infos = scanner_.listServices()->serviceInfos();
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_EQ(infos[0].key(), "a.ns:8080/http");
    EXPECT_EQ(infos[1].key(), "b.ns:8080/http");
}

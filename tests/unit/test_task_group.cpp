/**
 * @file test_task_group.cpp
 * @brief Unit tests for the per-connection task group
 */

#include <gtest/gtest.h>
#include <crossmesh/utils/logger.hpp>
#include <crossmesh/utils/task_group.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace crossmesh::utils;

class TaskGroupTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::OFF);
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::INFO);
    }
};

TEST_F(TaskGroupTest, RunsSpawnedTasks) {
    std::atomic<int> counter{0};
    TaskGroup group("test");

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(group.spawn([&counter]() { counter.fetch_add(1); }), SpawnStatus::STARTED);
    }
    group.joinAll();

    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(group.size(), 0u);
}

TEST_F(TaskGroupTest, ReapJoinsOnlyFinishedTasks) {
    std::atomic<bool> release{false};
    TaskGroup group("test");

    group.spawn([]() {});
    group.spawn([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    // Wait for the quick task to finish
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    size_t reaped = 0;
    while (reaped == 0 && std::chrono::steady_clock::now() < deadline) {
        reaped = group.reap();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_EQ(reaped, 1u);
    EXPECT_EQ(group.size(), 1u);

    release.store(true);
    group.joinAll();
    EXPECT_EQ(group.size(), 0u);
}

TEST_F(TaskGroupTest, RefusesTasksAfterJoinAll) {
    TaskGroup group("test");
    group.joinAll();

    bool ran = false;
    EXPECT_EQ(group.spawn([&ran]() { ran = true; }), SpawnStatus::CLOSED);
    EXPECT_FALSE(ran);
}

TEST_F(TaskGroupTest, ThrowingTaskDoesNotTerminate) {
    std::atomic<bool> after{false};
    TaskGroup group("test");

    group.spawn([]() { throw std::runtime_error("boom"); });
    group.spawn([&after]() { after.store(true); });
    group.joinAll();

    EXPECT_TRUE(after.load());
}

TEST_F(TaskGroupTest, DestructorJoinsRunningTasks) {
    std::atomic<bool> finished{false};
    {
        TaskGroup group("test");
        group.spawn([&finished]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            finished.store(true);
        });
    }
    EXPECT_TRUE(finished.load());
}

// =============================================================================
// Capacity
// =============================================================================

TEST_F(TaskGroupTest, RejectsTasksBeyondCapacity) {
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};
    TaskGroup group("test", 3);

    auto blocker = [&release, &ran]() {
        ran.fetch_add(1);
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    };

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(group.spawn(blocker), SpawnStatus::STARTED);
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(group.spawn(blocker), SpawnStatus::AT_CAPACITY);
    }

    EXPECT_EQ(group.active(), 3u);
    EXPECT_EQ(group.size(), 3u);
    EXPECT_EQ(group.rejected(), 5u);

    release.store(true);
    group.joinAll();
    EXPECT_EQ(ran.load(), 3);
    EXPECT_EQ(group.active(), 0u);
}

TEST_F(TaskGroupTest, CapacityFreesAsTasksFinish) {
    std::atomic<bool> release{false};
    TaskGroup group("test", 1);

    EXPECT_EQ(group.spawn([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }), SpawnStatus::STARTED);
    EXPECT_EQ(group.spawn([]() {}), SpawnStatus::AT_CAPACITY);

    release.store(true);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (group.active() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_EQ(group.spawn([]() {}), SpawnStatus::STARTED);
    group.joinAll();
    EXPECT_EQ(group.size(), 0u);
}

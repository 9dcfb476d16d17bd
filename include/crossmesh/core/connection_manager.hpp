/**
 * @file connection_manager.hpp
 * @brief One logical peer connection per remote cluster.
 *
 * Per ClusterId the manager drives
 *   IDLE -> RESOLVING -> CONNECTING -> RELAYED -> DIRECT
 * with CLOSED on failure, idle timeout or invalidation. A CLOSED record is
 * re-established lazily on the next getConnection(). Concurrent callers
 * during establishment share a single attempt and its outcome.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/address_directory.hpp"
#include "crossmesh/core/export.hpp"
#include "crossmesh/core/sharded_map.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/core/transport.hpp"
#include "crossmesh/core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace crossmesh {
namespace core {

/**
 * @enum ConnectionState
 * @brief Lifecycle of a per-cluster connection record.
 */
enum class ConnectionState {
    IDLE,        ///< Never connected
    RESOLVING,   ///< Looking up the NodeAddr
    CONNECTING,  ///< Dialing direct, then relay
    RELAYED,     ///< Usable through the relay
    DIRECT,      ///< Usable over a direct path
    CLOSED       ///< Failed, idle or invalidated; re-established on demand
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::IDLE: return "idle";
        case ConnectionState::RESOLVING: return "resolving";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::RELAYED: return "relayed";
        case ConnectionState::DIRECT: return "direct";
        case ConnectionState::CLOSED: return "closed";
        default: return "unknown";
    }
}

/**
 * @struct ConnectionManagerConfig
 * @brief Tunables for establishment and reclamation.
 */
struct CROSSMESH_CORE_API ConnectionManagerConfig {
    std::chrono::milliseconds connect_timeout{5000};     ///< Per path attempt
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::milliseconds sweep_interval{10000};
    int resolve_attempts = 4;
    std::chrono::milliseconds resolve_backoff_initial{100};
    std::chrono::milliseconds resolve_backoff_max{2000};
};

/**
 * @struct ConnectionStatus
 * @brief Point-in-time view of one record, for the status surface.
 */
struct CROSSMESH_CORE_API ConnectionStatus {
    ClusterId cluster;
    ConnectionState state = ConnectionState::IDLE;
    PathQuality quality = PathQuality::RELAYED;
    NodeId node_id;
    std::chrono::milliseconds idle{0};
};

/**
 * @class ConnectionManager
 * @brief Get-or-establish access to peer connections keyed by ClusterId.
 *
 * Usage:
 * @code
 * ConnectionManager manager(endpoint, directory, config);
 * manager.pinIdentity("cluster-b", "9f3c...");
 * manager.start();
 *
 * auto conn = manager.getConnection("cluster-b");   // throws MeshError
 * auto stream = conn->openStream(std::chrono::seconds(5));
 * @endcode
 */
class CROSSMESH_CORE_API ConnectionManager {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    ConnectionManager(std::shared_ptr<Endpoint> endpoint,
                      std::shared_ptr<AddressDirectory> directory,
                      const ConnectionManagerConfig& config = ConnectionManagerConfig());

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Return the live connection for cluster, establishing it if needed.
     * @throws MeshError UNREACHABLE, TIMEOUT or IDENTITY_MISMATCH.
     */
    std::shared_ptr<Connection> getConnection(const ClusterId& cluster);

    /**
     * @brief As getConnection(cluster), bounded by deadline.
     *
     * Resolve backoff and every path attempt are capped by the time left.
     * A caller joining another caller's attempt stops waiting at the deadline.
     *
     * @throws MeshError TIMEOUT once the deadline passes.
     */
    std::shared_ptr<Connection> getConnection(const ClusterId& cluster, const Deadline& deadline);

    /**
     * @brief Bind cluster to nodeId ahead of the first connection.
     * @return False if a different NodeId is already pinned.
     */
    bool pinIdentity(const ClusterId& cluster, const NodeId& nodeId);

    std::optional<NodeId> pinnedIdentity(const ClusterId& cluster) const;

    /**
     * @brief Report a dead connection; the next caller re-establishes.
     */
    void invalidate(const ClusterId& cluster);

    ConnectionState state(const ClusterId& cluster) const;

    /**
     * @brief Close connections unused for longer than the idle timeout.
     * @return Number of connections closed.
     */
    size_t sweepIdle();

    std::vector<ConnectionStatus> snapshot() const;

    uint64_t identityAlerts() const { return identityAlerts_.load(); }

    /**
     * @brief Start the periodic idle sweep.
     */
    bool start();

    void stop();

    /**
     * @brief Stop the sweep and close every connection.
     */
    void shutdown();

private:
    struct Record {
        std::mutex mutex;
        ConnectionState state = ConnectionState::IDLE;
        std::shared_ptr<Connection> connection;
        PathQuality quality = PathQuality::RELAYED;
        NodeId pinned;
        TimePoint last_activity = Clock::now();
        bool establishing = false;
        std::shared_future<std::shared_ptr<Connection>> inflight;
    };

    using RecordPtr = std::shared_ptr<Record>;

    std::shared_ptr<Endpoint> endpoint_;
    std::shared_ptr<AddressDirectory> directory_;
    ConnectionManagerConfig config_;

    ShardedMap<ClusterId, Record> records_;
    std::atomic<uint64_t> identityAlerts_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> shuttingDown_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    std::thread sweepThread_;

    RecordPtr recordFor(const ClusterId& cluster);

    // deadline may be null for an attempt bounded only by the config.
    std::shared_ptr<Connection> acquire(const ClusterId& cluster, const Deadline* deadline);

    // Runs the RESOLVING -> CONNECTING part for the single-flight leader.
    std::shared_ptr<Connection> establish(const ClusterId& cluster, const RecordPtr& record,
                                          const Deadline* deadline);

    NodeAddr resolveWithBackoff(const ClusterId& cluster, const Deadline* deadline);

    [[noreturn]] void identityFailure(const ClusterId& cluster, const NodeId& expected,
                                      const NodeId& presented);

    void watchPathChanges(const ClusterId& cluster, const RecordPtr& record,
                          const std::shared_ptr<Connection>& connection);

    // Sleep up to duration; false when shutting down.
    bool interruptibleSleep(std::chrono::milliseconds duration);

    void sweepLoop();

    static bool usable(ConnectionState state) {
        return state == ConnectionState::RELAYED || state == ConnectionState::DIRECT;
    }
};

}  // namespace core
}  // namespace crossmesh

/**
 * @file connection_manager.cpp
 * @brief ConnectionManager implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/connection_manager.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/utils/logger.hpp"
#include "crossmesh/utils/node_identity.hpp"

#include <algorithm>

namespace crossmesh {
namespace core {

ConnectionManager::ConnectionManager(std::shared_ptr<Endpoint> endpoint,
                                     std::shared_ptr<AddressDirectory> directory,
                                     const ConnectionManagerConfig& config)
    : endpoint_(std::move(endpoint))
    , directory_(std::move(directory))
    , config_(config)
{
    LOG_INFO("ConnectionManager", "Created (connect timeout {}ms, idle timeout {}ms)",
             config_.connect_timeout.count(), config_.idle_timeout.count());
}

ConnectionManager::~ConnectionManager() {
    shutdown();
}

ConnectionManager::RecordPtr ConnectionManager::recordFor(const ClusterId& cluster) {
    return records_.getOrCreate(cluster, [] { return std::make_shared<Record>(); });
}

// =============================================================================
// Establishment
// =============================================================================

std::shared_ptr<Connection> ConnectionManager::getConnection(const ClusterId& cluster) {
    return acquire(cluster, nullptr);
}

std::shared_ptr<Connection> ConnectionManager::getConnection(const ClusterId& cluster,
                                                             const Deadline& deadline) {
    return acquire(cluster, &deadline);
}

std::shared_ptr<Connection> ConnectionManager::acquire(const ClusterId& cluster,
                                                       const Deadline* deadline) {
    if (shuttingDown_.load()) {
        throw MeshError(ErrorKind::CONNECTION_CLOSED, "connection manager is shut down");
    }

    RecordPtr record = recordFor(cluster);
    std::shared_future<std::shared_ptr<Connection>> waiter;
    std::promise<std::shared_ptr<Connection>> promise;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(record->mutex);

        if (usable(record->state) && record->connection) {
            if (!record->connection->isClosed()) {
                record->last_activity = Clock::now();
                return record->connection;
            }
            LOG_INFO("ConnectionManager", "Connection to {} was closed by the transport", cluster);
            record->state = ConnectionState::CLOSED;
            record->connection.reset();
        }

        if (record->establishing) {
            waiter = record->inflight;
        } else {
            leader = true;
            record->establishing = true;
            record->state = ConnectionState::RESOLVING;
            record->inflight = promise.get_future().share();
        }
    }

    if (!leader) {
        LOG_TRACE("ConnectionManager", "Joining in-flight establishment for {}", cluster);
        if (deadline && waiter.wait_until(deadline->at()) != std::future_status::ready) {
            throw MeshError(ErrorKind::TIMEOUT,
                            "deadline passed waiting for the connection to " + cluster);
        }
        return waiter.get();
    }

    try {
        auto connection = establish(cluster, record, deadline);
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            record->connection = connection;
            record->quality = connection->quality();
            record->state = record->quality == PathQuality::DIRECT
                                ? ConnectionState::DIRECT
                                : ConnectionState::RELAYED;
            record->last_activity = Clock::now();
            record->establishing = false;
        }
        watchPathChanges(cluster, record, connection);
        promise.set_value(connection);

        LOG_INFO("ConnectionManager", "Connected to {} ({}, node {})", cluster,
                 pathQualityToString(connection->quality()),
                 utils::shortNodeId(connection->remoteNodeId()));
        return connection;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            record->state = ConnectionState::CLOSED;
            record->connection.reset();
            record->establishing = false;
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::shared_ptr<Connection> ConnectionManager::establish(const ClusterId& cluster,
                                                         const RecordPtr& record,
                                                         const Deadline* deadline) {
    NodeAddr addr = resolveWithBackoff(cluster, deadline);

    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (!record->pinned.empty() && record->pinned != addr.node_id) {
            NodeId pinned = record->pinned;
            identityFailure(cluster, pinned, addr.node_id);
        }
        record->state = ConnectionState::CONNECTING;
    }

    std::vector<ConnectPath> paths;
    if (!addr.direct_addresses.empty()) {
        paths.push_back(ConnectPath::DIRECT);
    }
    if (addr.hasRelay()) {
        paths.push_back(ConnectPath::RELAY);
    }
    if (paths.empty()) {
        throw MeshError(ErrorKind::UNREACHABLE, "no direct address or relay known for " + cluster);
    }

    ErrorKind lastFailure = ErrorKind::UNREACHABLE;
    std::string lastMessage;

    for (ConnectPath path : paths) {
        auto timeout = config_.connect_timeout;
        if (deadline) {
            if (deadline->expired()) {
                throw MeshError(ErrorKind::TIMEOUT, "deadline passed connecting to " + cluster +
                                                        (lastMessage.empty() ? "" : ": " + lastMessage));
            }
            timeout = std::min(timeout, deadline->remaining());
        }

        std::shared_ptr<Connection> connection;
        try {
            LOG_DEBUG("ConnectionManager", "Dialing {} via {} ({}ms)", cluster,
                      connectPathToString(path), timeout.count());
            connection = endpoint_->connect(addr, path, timeout);
        } catch (const MeshError& e) {
            if (e.kind() == ErrorKind::IDENTITY_MISMATCH) {
                identityFailure(cluster, addr.node_id, "(rejected by transport)");
            }
            LOG_WARN("ConnectionManager", "{} path to {} failed: {}",
                     connectPathToString(path), cluster, e.what());
            lastFailure = e.kind();
            lastMessage = e.what();
            continue;
        }

        if (!connection) {
            lastFailure = ErrorKind::UNREACHABLE;
            lastMessage = "transport returned no connection";
            continue;
        }

        if (connection->remoteNodeId() != addr.node_id) {
            NodeId presented = connection->remoteNodeId();
            connection->close();
            identityFailure(cluster, addr.node_id, presented);
        }

        {
            std::lock_guard<std::mutex> lock(record->mutex);
            if (record->pinned.empty()) {
                record->pinned = addr.node_id;
            }
        }
        return connection;
    }

    bool timedOut = lastFailure == ErrorKind::TIMEOUT || (deadline && deadline->expired());
    ErrorKind surfaced = timedOut ? ErrorKind::TIMEOUT : ErrorKind::UNREACHABLE;
    throw MeshError(surfaced, "all paths to " + cluster + " failed: " + lastMessage);
}

NodeAddr ConnectionManager::resolveWithBackoff(const ClusterId& cluster,
                                               const Deadline* deadline) {
    ExponentialBackoff backoff(config_.resolve_backoff_initial, config_.resolve_backoff_max);
    int attempts = std::max(1, config_.resolve_attempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto addr = directory_->resolve(cluster);
        if (addr) {
            return *addr;
        }
        if (attempt == attempts) {
            break;
        }

        auto delay = backoff.next();
        if (deadline) {
            if (deadline->expired()) {
                throw MeshError(ErrorKind::TIMEOUT, "deadline passed resolving " + cluster);
            }
            delay = std::min(delay, deadline->remaining());
        }
        LOG_DEBUG("ConnectionManager", "No address for {} (attempt {}/{}), retrying in {}ms",
                  cluster, attempt, attempts, delay.count());
        if (!interruptibleSleep(delay)) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "connection manager is shutting down");
        }
    }

    throw MeshError(ErrorKind::UNREACHABLE,
                    "no address record for " + cluster + " after " +
                        std::to_string(attempts) + " attempts");
}

void ConnectionManager::identityFailure(const ClusterId& cluster, const NodeId& expected,
                                        const NodeId& presented) {
    identityAlerts_.fetch_add(1);
    LOG_ERROR("ConnectionManager", "ALERT identity mismatch for cluster {}: expected {} got {}",
              cluster, expected, presented);
    throw MeshError(ErrorKind::IDENTITY_MISMATCH,
                    "cluster " + cluster + " presented an unexpected node id");
}

void ConnectionManager::watchPathChanges(const ClusterId& cluster, const RecordPtr& record,
                                         const std::shared_ptr<Connection>& connection) {
    std::weak_ptr<Record> weakRecord = record;
    Connection* raw = connection.get();

    connection->onPathChange([weakRecord, raw, cluster](PathQuality quality) {
        auto rec = weakRecord.lock();
        if (!rec) {
            return;
        }
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (rec->connection.get() != raw || !usable(rec->state)) {
            return;
        }
        rec->quality = quality;
        rec->state = quality == PathQuality::DIRECT ? ConnectionState::DIRECT
                                                    : ConnectionState::RELAYED;
        LOG_INFO("ConnectionManager", "Connection to {} is now {}", cluster,
                 pathQualityToString(quality));
    });
}

// =============================================================================
// Identity and invalidation
// =============================================================================

bool ConnectionManager::pinIdentity(const ClusterId& cluster, const NodeId& nodeId) {
    if (!utils::isValidNodeId(nodeId)) {
        LOG_WARN("ConnectionManager", "Refusing to pin malformed node id for {}", cluster);
        return false;
    }

    RecordPtr record = recordFor(cluster);
    std::lock_guard<std::mutex> lock(record->mutex);
    if (!record->pinned.empty() && record->pinned != nodeId) {
        LOG_ERROR("ConnectionManager", "ALERT cluster {} is already bound to {}", cluster,
                  utils::shortNodeId(record->pinned));
        identityAlerts_.fetch_add(1);
        return false;
    }
    record->pinned = nodeId;
    return true;
}

std::optional<NodeId> ConnectionManager::pinnedIdentity(const ClusterId& cluster) const {
    RecordPtr record = records_.find(cluster);
    if (!record) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    if (record->pinned.empty()) {
        return std::nullopt;
    }
    return record->pinned;
}

void ConnectionManager::invalidate(const ClusterId& cluster) {
    RecordPtr record = records_.find(cluster);
    if (!record) {
        return;
    }

    std::shared_ptr<Connection> doomed;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (record->establishing) {
            return;
        }
        doomed = std::move(record->connection);
        if (record->state != ConnectionState::IDLE) {
            record->state = ConnectionState::CLOSED;
        }
    }

    if (doomed) {
        LOG_INFO("ConnectionManager", "Invalidated connection to {}", cluster);
        doomed->close();
    }
}

ConnectionState ConnectionManager::state(const ClusterId& cluster) const {
    RecordPtr record = records_.find(cluster);
    if (!record) {
        return ConnectionState::IDLE;
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    return record->state;
}

// =============================================================================
// Reclamation
// =============================================================================

size_t ConnectionManager::sweepIdle() {
    auto now = Clock::now();
    size_t closed = 0;

    for (const auto& [cluster, record] : records_.snapshot()) {
        std::shared_ptr<Connection> doomed;
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            if (!usable(record->state) || !record->connection) {
                continue;
            }
            bool idle = now - record->last_activity > config_.idle_timeout;
            if (!idle && !record->connection->isClosed()) {
                continue;
            }
            doomed = std::move(record->connection);
            record->state = ConnectionState::CLOSED;
        }

        LOG_INFO("ConnectionManager", "Reclaiming idle connection to {}", cluster);
        doomed->close();
        ++closed;
    }
    return closed;
}

std::vector<ConnectionStatus> ConnectionManager::snapshot() const {
    auto now = Clock::now();
    std::vector<ConnectionStatus> out;

    for (const auto& [cluster, record] : records_.snapshot()) {
        std::lock_guard<std::mutex> lock(record->mutex);
        ConnectionStatus status;
        status.cluster = cluster;
        status.state = record->state;
        status.quality = record->quality;
        status.node_id = record->pinned;
        status.idle = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - record->last_activity);
        out.push_back(std::move(status));
    }
    return out;
}

bool ConnectionManager::start() {
    if (running_.load()) {
        LOG_WARN("ConnectionManager", "Sweeper already running");
        return false;
    }
    running_.store(true);
    sweepThread_ = std::thread(&ConnectionManager::sweepLoop, this);
    return true;
}

void ConnectionManager::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wakeCv_.notify_all();
    if (sweepThread_.joinable()) {
        sweepThread_.join();
    }
}

void ConnectionManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        shuttingDown_.store(true);
    }
    wakeCv_.notify_all();
    stop();

    for (const auto& [cluster, record] : records_.snapshot()) {
        std::shared_ptr<Connection> doomed;
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            doomed = std::move(record->connection);
            if (record->state != ConnectionState::IDLE) {
                record->state = ConnectionState::CLOSED;
            }
        }
        if (doomed) {
            LOG_DEBUG("ConnectionManager", "Closing connection to {}", cluster);
            doomed->close();
        }
    }
}

bool ConnectionManager::interruptibleSleep(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    return !wakeCv_.wait_for(lock, duration, [this] { return shuttingDown_.load(); });
}

void ConnectionManager::sweepLoop() {
    LOG_DEBUG("ConnectionManager", "Idle sweeper started");

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeCv_.wait_for(lock, config_.sweep_interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }
        sweepIdle();
    }

    LOG_DEBUG("ConnectionManager", "Idle sweeper stopped");
}

}  // namespace core
}  // namespace crossmesh

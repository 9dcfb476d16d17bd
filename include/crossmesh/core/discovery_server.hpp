/**
 * @file discovery_server.hpp
 * @brief Peer-facing accept loop.
 *
 * Pulls incoming connections from the Endpoint, runs one task per
 * connection and one task per stream. Each stream opens with a
 * StreamHeader: discovery streams are answered here, proxy streams are
 * handed to the registered inbound handler. A bad stream is closed on its
 * own; the connection it came from stays up.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/discovery_manager.hpp"
#include "crossmesh/core/export.hpp"
#include "crossmesh/core/framing.hpp"
#include "crossmesh/core/transport.hpp"
#include "crossmesh/utils/task_group.hpp"

#include "crossmesh/proto/discovery.pb.h"
#include "crossmesh/proto/proxy.pb.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace crossmesh {
namespace core {

/// Decides whether peer may run query. Absent hook = allow all.
using AuthorizationHook =
    std::function<bool(const NodeId& peer, const discovery::DiscoveryQuery& query)>;

/**
 * @brief Serves one proxy stream. reader holds bytes already buffered past
 * the header.
 */
using InboundStreamHandler =
    std::function<void(const proxy::StreamHeader& header, Stream& stream, FrameReader& reader)>;

struct CROSSMESH_CORE_API DiscoveryServerConfig {
    std::chrono::milliseconds stream_timeout{10000};  ///< Per stream, header to reply
    std::chrono::milliseconds poll_interval{500};     ///< accept() wake-up for stop()
    size_t max_tasks = utils::TaskGroup::DEFAULT_MAX_TASKS;  ///< Connections plus streams in service
};

/**
 * @class DiscoveryServer
 * @brief Accepts peers and dispatches their streams.
 */
class CROSSMESH_CORE_API DiscoveryServer {
public:
    DiscoveryServer(std::shared_ptr<Endpoint> endpoint,
                    std::shared_ptr<DiscoveryManager> discovery,
                    const DiscoveryServerConfig& config = DiscoveryServerConfig());

    ~DiscoveryServer();

    DiscoveryServer(const DiscoveryServer&) = delete;
    DiscoveryServer& operator=(const DiscoveryServer&) = delete;

    /// Set before start().
    void setAuthorizationHook(AuthorizationHook hook);

    /// Set before start().
    void setInboundHandler(InboundStreamHandler handler);

    bool start();

    /**
     * @brief Stop accepting, close accepted connections and join all tasks.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    uint64_t connectionsAccepted() const { return connectionsAccepted_.load(); }
    uint64_t queriesAnswered() const { return queriesAnswered_.load(); }
    uint64_t streamsRejected() const { return streamsRejected_.load(); }

private:
    std::shared_ptr<Endpoint> endpoint_;
    std::shared_ptr<DiscoveryManager> discovery_;
    DiscoveryServerConfig config_;

    AuthorizationHook authorize_;
    InboundStreamHandler inbound_;

    std::atomic<bool> running_{false};
    std::thread acceptThread_;
    utils::TaskGroup tasks_;

    std::mutex connectionsMutex_;
    std::list<std::weak_ptr<Connection>> connections_;

    std::atomic<uint64_t> connectionsAccepted_{0};
    std::atomic<uint64_t> queriesAnswered_{0};
    std::atomic<uint64_t> streamsRejected_{0};

    void acceptLoop();
    void serveConnection(std::shared_ptr<Connection> connection);
    void serveStream(NodeId peer, std::shared_ptr<Stream> stream);
    void serveDiscovery(const NodeId& peer, Stream& stream, FrameReader& reader,
                        const Deadline& deadline);
};

}  // namespace core
}  // namespace crossmesh

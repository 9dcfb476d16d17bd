/**
 * @file discovery_server.cpp
 * @brief DiscoveryServer implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/discovery_server.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/utils/logger.hpp"
#include "crossmesh/utils/node_identity.hpp"

namespace crossmesh {
namespace core {

DiscoveryServer::DiscoveryServer(std::shared_ptr<Endpoint> endpoint,
                                 std::shared_ptr<DiscoveryManager> discovery,
                                 const DiscoveryServerConfig& config)
    : endpoint_(std::move(endpoint))
    , discovery_(std::move(discovery))
    , config_(config)
    , tasks_("DiscoveryServer", config.max_tasks)
{}

DiscoveryServer::~DiscoveryServer() {
    stop();
}

void DiscoveryServer::setAuthorizationHook(AuthorizationHook hook) {
    authorize_ = std::move(hook);
}

void DiscoveryServer::setInboundHandler(InboundStreamHandler handler) {
    inbound_ = std::move(handler);
}

bool DiscoveryServer::start() {
    if (running_.load()) {
        LOG_WARN("DiscoveryServer", "Already running");
        return false;
    }

    running_.store(true);
    acceptThread_ = std::thread(&DiscoveryServer::acceptLoop, this);

    LOG_INFO("DiscoveryServer", "Accepting peers as node {}",
             utils::shortNodeId(endpoint_->nodeId()));
    return true;
}

void DiscoveryServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("DiscoveryServer", "Stopping...");

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto& weak : connections_) {
            if (auto connection = weak.lock()) {
                connection->close();
            }
        }
        connections_.clear();
    }

    tasks_.joinAll();
    LOG_INFO("DiscoveryServer", "Stopped");
}

void DiscoveryServer::acceptLoop() {
    LOG_DEBUG("DiscoveryServer", "Accept loop started");

    while (running_.load()) {
        std::shared_ptr<Connection> connection;
        try {
            connection = endpoint_->accept(config_.poll_interval);
        } catch (const MeshError& e) {
            if (running_.load()) {
                LOG_ERROR("DiscoveryServer", "Endpoint stopped accepting: {}", e.what());
            }
            break;
        }

        if (!connection) {
            continue;
        }

        connectionsAccepted_.fetch_add(1);
        LOG_DEBUG("DiscoveryServer", "Accepted connection from node {}",
                  utils::shortNodeId(connection->remoteNodeId()));

        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            connections_.remove_if([](const std::weak_ptr<Connection>& w) { return w.expired(); });
            connections_.push_back(connection);
        }

        auto spawned = tasks_.spawn([this, connection] { serveConnection(connection); });
        if (spawned != utils::SpawnStatus::STARTED) {
            connection->close();
            if (spawned == utils::SpawnStatus::CLOSED) {
                break;
            }
            LOG_WARN("DiscoveryServer", "Shedding connection from node {}",
                     utils::shortNodeId(connection->remoteNodeId()));
        }
    }

    LOG_DEBUG("DiscoveryServer", "Accept loop stopped");
}

void DiscoveryServer::serveConnection(std::shared_ptr<Connection> connection) {
    NodeId peer = connection->remoteNodeId();

    while (running_.load() && !connection->isClosed()) {
        std::shared_ptr<Stream> stream;
        try {
            stream = connection->acceptStream(config_.poll_interval);
        } catch (const MeshError& e) {
            LOG_DEBUG("DiscoveryServer", "Connection from {} ended: {}",
                      utils::shortNodeId(peer), e.what());
            break;
        }

        if (!stream) {
            continue;
        }
        auto spawned = tasks_.spawn([this, peer, stream] { serveStream(peer, stream); });
        if (spawned == utils::SpawnStatus::CLOSED) {
            stream->close();
            break;
        }
        if (spawned == utils::SpawnStatus::AT_CAPACITY) {
            streamsRejected_.fetch_add(1);
            stream->close();
        }
    }
}

void DiscoveryServer::serveStream(NodeId peer, std::shared_ptr<Stream> stream) {
    Deadline deadline = Deadline::after(config_.stream_timeout);
    FrameReader reader(*stream);

    try {
        proxy::StreamHeader header;
        if (!reader.readMessage(header, deadline)) {
            stream->close();
            return;
        }

        switch (header.kind()) {
            case proxy::STREAM_DISCOVERY:
                serveDiscovery(peer, *stream, reader, deadline);
                break;

            case proxy::STREAM_PROXY:
                if (!inbound_) {
                    LOG_WARN("DiscoveryServer", "No inbound handler; dropping proxy stream from {}",
                             header.source_cluster());
                    streamsRejected_.fetch_add(1);
                    stream->close();
                    return;
                }
                inbound_(header, *stream, reader);
                break;

            default:
                LOG_WARN("DiscoveryServer", "Unknown stream kind {} from {}",
                         static_cast<int>(header.kind()), header.source_cluster());
                streamsRejected_.fetch_add(1);
                stream->close();
                return;
        }
    } catch (const MeshError& e) {
        LOG_DEBUG("DiscoveryServer", "Stream from {} closed: {} ({})", utils::shortNodeId(peer),
                  e.what(), errorKindToString(e.kind()));
        streamsRejected_.fetch_add(1);
        stream->close();
    } catch (const std::exception& e) {
        LOG_ERROR("DiscoveryServer", "Stream from {} failed: {}", utils::shortNodeId(peer),
                  e.what());
        streamsRejected_.fetch_add(1);
        stream->close();
    }
}

void DiscoveryServer::serveDiscovery(const NodeId& peer, Stream& stream, FrameReader& reader,
                                     const Deadline& deadline) {
    discovery::DiscoveryQuery query;
    if (!reader.readMessage(query, deadline)) {
        throw MeshError(ErrorKind::MALFORMED, "discovery stream ended before the query");
    }
    if (query.service().empty()) {
        throw MeshError(ErrorKind::MALFORMED, "discovery query without a service name");
    }

    if (authorize_ && !authorize_(peer, query)) {
        LOG_WARN("DiscoveryServer", "Denied query from {} ({}) for {}.{}",
                 query.source_cluster(), utils::shortNodeId(peer), query.service(),
                 query.namespace_());
        throw MeshError(ErrorKind::UNAUTHORIZED, "query denied");
    }

    auto response = discovery_->serveQuery(query);
    writeMessage(stream, response);
    stream.finish();
    queriesAnswered_.fetch_add(1);
}

}  // namespace core
}  // namespace crossmesh

/**
 * @file grpc_endpoint.hpp
 * @brief Mesh transport over gRPC channels.
 *
 * Implements core::Endpoint with the MeshTransport service:
 * - connect() dials a direct address or the relay, then runs Handshake so
 *   the peer proves its NodeId before the connection is handed out
 * - every core::Stream is one bidirectional OpenStream call
 * - relayed connections keep probing the direct addresses and switch
 *   new streams over in place once one answers
 *
 * The server side groups incoming OpenStream calls into connections by the
 * connection id presented at handshake time and queues them for accept().
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/services/export.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/core/transport.hpp"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crossmesh {
namespace services {

/**
 * @struct GrpcEndpointConfig
 * @brief Listener and path settings for a GrpcEndpoint.
 */
struct CROSSMESH_SERVICES_API GrpcEndpointConfig {
    core::NodeId node_id;
    core::ClusterId cluster_id;
    std::string bind_address = "0.0.0.0";
    uint16_t port = 15003;                        ///< 0 picks a free port
    std::string relay_url;                        ///< Advertised relay, may be empty
    std::vector<std::string> advertise_addresses; ///< Advertised direct addresses
    std::chrono::milliseconds upgrade_interval{5000};
    int upgrade_attempts = 12;
    std::chrono::milliseconds stream_lifetime{600000};
    std::chrono::milliseconds server_idle_timeout{300000};
};

/**
 * @brief Map a failed gRPC status onto a MeshError.
 *
 * DEADLINE_EXCEEDED is TIMEOUT, UNAVAILABLE is UNREACHABLE,
 * FAILED_PRECONDITION is IDENTITY_MISMATCH; anything else is
 * CONNECTION_CLOSED.
 */
CROSSMESH_SERVICES_API core::MeshError toMeshError(const grpc::Status& status,
                                                   const std::string& what);

class ServerConnection;

/**
 * @class GrpcEndpoint
 * @brief core::Endpoint backed by a gRPC server and per-connection channels.
 */
class CROSSMESH_SERVICES_API GrpcEndpoint : public core::Endpoint {
public:
    explicit GrpcEndpoint(const GrpcEndpointConfig& config);
    ~GrpcEndpoint() override;

    GrpcEndpoint(const GrpcEndpoint&) = delete;
    GrpcEndpoint& operator=(const GrpcEndpoint&) = delete;

    /**
     * @brief Start the MeshTransport server.
     * @return False if the listener could not be bound.
     */
    bool start();

    /// Port the server listens on; valid after start().
    uint16_t boundPort() const { return boundPort_; }

    core::NodeId nodeId() const override { return config_.node_id; }
    core::NodeAddr localAddr() const override;

    std::shared_ptr<core::Connection> connect(const core::NodeAddr& addr,
                                              core::ConnectPath path,
                                              std::chrono::milliseconds timeout) override;

    std::shared_ptr<core::Connection> accept(std::chrono::milliseconds timeout) override;

    void close() override;

    /// Incoming connections currently tracked by the server side.
    size_t inboundConnectionCount() const;

private:
    class TransportService;
    friend class TransportService;

    // Handshake arrived: find or create the server-side connection.
    std::shared_ptr<ServerConnection> registerInbound(const std::string& connectionId,
                                                      const core::NodeId& peer,
                                                      bool relayed,
                                                      bool& created);
    std::shared_ptr<ServerConnection> findInbound(const std::string& connectionId) const;
    void dropInbound(const std::string& connectionId);

    GrpcEndpointConfig config_;
    std::unique_ptr<TransportService> service_;
    std::unique_ptr<grpc::Server> server_;
    uint16_t boundPort_ = 0;

    mutable std::mutex inboundMutex_;
    std::unordered_map<std::string, std::shared_ptr<ServerConnection>> inbound_;

    std::mutex acceptMutex_;
    std::condition_variable acceptCv_;
    std::deque<std::shared_ptr<core::Connection>> acceptQueue_;

    std::atomic<bool> closed_{false};
};

}  // namespace services
}  // namespace crossmesh

/**
 * @file transport.hpp
 * @brief Secure multiplexed transport consumed by the mesh core.
 *
 * An Endpoint dials and accepts Connections to other nodes; a Connection
 * carries any number of independent byte Streams. The concrete transport
 * (gRPC channels in the daemon, in-memory pipes in tests) lives outside
 * the core.
 *
 * Failures are raised as MeshError:
 * - connect(): TIMEOUT, REFUSED, UNREACHABLE, IDENTITY_MISMATCH
 * - streams: CONNECTION_CLOSED, TIMEOUT
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"
#include "crossmesh/core/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace crossmesh {
namespace core {

/**
 * @enum ConnectPath
 * @brief Which hints of a NodeAddr a connect attempt uses.
 */
enum class ConnectPath {
    DIRECT,  ///< Dial the direct addresses
    RELAY    ///< Go through the relay; direct addresses stay upgrade candidates
};

inline const char* connectPathToString(ConnectPath path) {
    return path == ConnectPath::DIRECT ? "direct" : "relay";
}

/**
 * @class Stream
 * @brief One bidirectional, ordered byte stream inside a Connection.
 */
class CROSSMESH_CORE_API Stream {
public:
    virtual ~Stream() = default;

    /**
     * @brief Send bytes. Throws MeshError(CONNECTION_CLOSED) after close.
     */
    virtual void write(const std::string& data) = 0;

    /**
     * @brief Receive the next chunk of bytes.
     * @return False at end of stream (peer called finish()).
     * @throws MeshError TIMEOUT when nothing arrives within the timeout,
     *         CONNECTION_CLOSED when the stream was aborted.
     */
    virtual bool read(std::string& out, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Half-close: no more writes from this side.
     */
    virtual void finish() = 0;

    /**
     * @brief Abort both directions.
     */
    virtual void close() = 0;
};

/**
 * @class Connection
 * @brief A live, authenticated link to one remote node.
 */
class CROSSMESH_CORE_API Connection {
public:
    using PathChangeCallback = std::function<void(PathQuality)>;

    virtual ~Connection() = default;

    /**
     * @brief Open an outgoing stream.
     * @throws MeshError CONNECTION_CLOSED or TIMEOUT.
     */
    virtual std::shared_ptr<Stream> openStream(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Wait for a stream opened by the peer.
     * @return The stream, or nullptr on timeout.
     * @throws MeshError CONNECTION_CLOSED once the connection is gone.
     */
    virtual std::shared_ptr<Stream> acceptStream(std::chrono::milliseconds timeout) = 0;

    /// Identity the remote node proved during the handshake.
    virtual NodeId remoteNodeId() const = 0;

    virtual PathQuality quality() const = 0;

    /**
     * @brief Register a listener for in-place path changes (Relayed -> Direct).
     * Streams already open keep working across the change.
     */
    virtual void onPathChange(PathChangeCallback callback) = 0;

    virtual void close() = 0;

    virtual bool isClosed() const = 0;
};

/**
 * @class Endpoint
 * @brief Local side of the transport: dials and accepts Connections.
 */
class CROSSMESH_CORE_API Endpoint {
public:
    virtual ~Endpoint() = default;

    virtual NodeId nodeId() const = 0;

    /// Address other nodes use to reach this one.
    virtual NodeAddr localAddr() const = 0;

    /**
     * @brief Dial a node over the given path.
     * The connection is only returned once the peer proved addr.node_id.
     */
    virtual std::shared_ptr<Connection> connect(const NodeAddr& addr, ConnectPath path,
                                                std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Next incoming connection.
     * @return The connection, or nullptr on timeout.
     * @throws MeshError CONNECTION_CLOSED once the endpoint is closed.
     */
    virtual std::shared_ptr<Connection> accept(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

}  // namespace core
}  // namespace crossmesh

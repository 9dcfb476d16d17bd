/**
 * @file tcp_socket.hpp
 * @brief Cross-platform TCP stream socket.
 *
 * RAII wrapper used by the HTTP interception listener and by the peer-side
 * forwarder that delivers proxied requests to local service instances.
 * Every blocking call takes a timeout and is implemented with select().
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/net/export.hpp"
#include "crossmesh/net/platform.hpp"

#include <cstdint>
#include <string>

namespace crossmesh {
namespace net {

/**
 * @struct SocketAddress
 * @brief Host (name or IPv4 literal) and port pair.
 */
struct CROSSMESH_NET_API SocketAddress {
    std::string host;
    uint16_t port;

    SocketAddress() : host("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& host_, uint16_t port_) : host(host_), port(port_) {}

    std::string toString() const { return host + ":" + std::to_string(port); }

    /**
     * @brief Parse "host:port". Returns false if the port is missing or invalid.
     */
    static bool parse(const std::string& text, SocketAddress& out);

    bool operator==(const SocketAddress& other) const {
        return host == other.host && port == other.port;
    }
};

/**
 * @class TcpSocket
 * @brief RAII TCP socket wrapper.
 *
 * Usage:
 * @code
 * TcpSocket listener;
 * listener.setReuseAddress(true);
 * listener.bind(15001);
 * listener.listen();
 *
 * TcpSocket client;
 * SocketAddress peer;
 * if (listener.accept(client, peer, 500) > 0) {
 *     char buf[4096];
 *     int n = client.receive(buf, sizeof(buf), 1000);
 * }
 * @endcode
 */
class CROSSMESH_NET_API TcpSocket {
public:
    /**
     * @brief Create an unconnected IPv4 stream socket.
     */
    TcpSocket();

    /**
     * @brief Adopt an already connected handle (from accept()).
     */
    explicit TcpSocket(SocketHandle handle);

    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Enable SO_REUSEADDR. Call before bind().
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Disable Nagle's algorithm.
     */
    bool setNoDelay(bool enable);

    /**
     * @brief Bind to a local port (0 for auto-assign).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    bool listen(int backlog = 128);

    uint16_t getLocalPort() const;

    /**
     * @brief Accept one pending connection.
     * @param client Output: the accepted socket.
     * @param peer Output: the remote address.
     * @param timeoutMs Timeout in milliseconds (-1 = infinite).
     * @return 1 when a connection was accepted, 0 on timeout, -1 on error.
     */
    int accept(TcpSocket& client, SocketAddress& peer, int timeoutMs);

    /**
     * @brief Connect to a remote address, resolving host names.
     * @return True when connected within the timeout.
     */
    bool connect(const SocketAddress& dest, int timeoutMs);

    /**
     * @brief Send the whole buffer, waiting at most timeoutMs in total.
     */
    bool sendAll(const void* data, size_t length, int timeoutMs);

    bool sendAll(const std::string& data, int timeoutMs) {
        return sendAll(data.data(), data.size(), timeoutMs);
    }

    /**
     * @brief Receive available bytes.
     * @param timeoutMs Timeout in milliseconds (0 = non-blocking, -1 = infinite).
     * @return Bytes received, 0 on timeout, -1 on error or when the peer
     *         closed the connection (see isPeerClosed()).
     */
    int receive(void* buffer, size_t bufferSize, int timeoutMs);

    bool isPeerClosed() const { return peerClosed_; }

    /**
     * @brief Stop both directions without releasing the handle.
     * Wakes a thread blocked in receive() on another thread.
     */
    void shutdown();

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;
    bool peerClosed_;

    void setLastError();

    // 1 ready, 0 timeout, -1 error
    int waitReady(bool forWrite, int timeoutMs);
};

}  // namespace net
}  // namespace crossmesh

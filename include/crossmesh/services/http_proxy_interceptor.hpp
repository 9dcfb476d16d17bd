/**
 * @file http_proxy_interceptor.hpp
 * @brief HTTP/1.1 listener that captures application requests for the mesh.
 *
 * Applications send requests for "service.ns.cluster.mesh" to this
 * listener (as an HTTP proxy or with the Host header set). Each request is
 * queued as an InterceptedRequest; the client connection waits for the
 * router's answer and then reads the next request on the same connection.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/services/export.hpp"
#include "crossmesh/core/interceptor.hpp"
#include "crossmesh/net/tcp_socket.hpp"
#include "crossmesh/utils/task_group.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace crossmesh {
namespace services {

struct CROSSMESH_SERVICES_API HttpProxyConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 15001;                       ///< 0 picks a free port
    std::chrono::milliseconds idle_timeout{30000};      ///< Between requests on a connection
    std::chrono::milliseconds response_timeout{35000};  ///< Router answer budget
    size_t max_pending = 1024;                   ///< Queued requests before 503
    size_t max_clients = 256;                    ///< Open client connections
};

/**
 * @class HttpProxyInterceptor
 * @brief core::Interceptor fed by a plain HTTP/1.1 listener.
 */
class CROSSMESH_SERVICES_API HttpProxyInterceptor : public core::Interceptor {
public:
    explicit HttpProxyInterceptor(const HttpProxyConfig& config);
    ~HttpProxyInterceptor() override;

    HttpProxyInterceptor(const HttpProxyInterceptor&) = delete;
    HttpProxyInterceptor& operator=(const HttpProxyInterceptor&) = delete;

    bool start() override;
    void stop() override;

    std::unique_ptr<core::InterceptedRequest> next(std::chrono::milliseconds timeout) override;

    /// Port the listener is bound to; valid after start().
    uint16_t boundPort() const { return boundPort_; }

    uint64_t requestsCaptured() const { return requestsCaptured_.load(); }

private:
    void acceptLoop();
    void serveClient(std::shared_ptr<net::TcpSocket> client, net::SocketAddress peer);
    bool enqueue(std::unique_ptr<core::InterceptedRequest> request);

    HttpProxyConfig config_;
    net::TcpSocket listener_;
    uint16_t boundPort_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::thread acceptThread_;
    utils::TaskGroup clients_;

    std::mutex clientsMutex_;
    std::set<std::shared_ptr<net::TcpSocket>> openClients_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<std::unique_ptr<core::InterceptedRequest>> queue_;

    std::atomic<uint64_t> requestsCaptured_{0};
    std::atomic<uint64_t> nextRequestId_{1};
};

}  // namespace services
}  // namespace crossmesh

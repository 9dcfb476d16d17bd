/**
 * @file traffic_router.hpp
 * @brief End-to-end handling of intercepted requests.
 *
 * Outbound: classify the destination, pass the breaker, pick an endpoint,
 * carry the request over a PROXY stream to the owning cluster, retry
 * idempotent requests on transport failures. Inbound: answer PROXY
 * streams from peers by delivering to the local instance.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/circuit_breaker.hpp"
#include "crossmesh/core/connection_manager.hpp"
#include "crossmesh/core/discovery_manager.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/core/export.hpp"
#include "crossmesh/core/framing.hpp"
#include "crossmesh/core/interceptor.hpp"
#include "crossmesh/core/route_table.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/utils/task_group.hpp"

#include "crossmesh/proto/proxy.pb.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace crossmesh {
namespace core {

/// Response header naming the ErrorKind of a failed request.
constexpr const char* MESH_ERROR_HEADER = "x-crossmesh-error";

/**
 * @struct TrafficPolicy
 * @brief Retry and deadline settings.
 */
struct CROSSMESH_CORE_API TrafficPolicy {
    int max_retries = 2;
    std::chrono::milliseconds retry_backoff_initial{50};
    std::chrono::milliseconds retry_backoff_max{1000};
    std::chrono::milliseconds request_timeout{30000};
    bool retry_non_idempotent = false;
    size_t max_inflight = utils::TaskGroup::DEFAULT_MAX_TASKS;  ///< Intercepted requests in service
};

/**
 * @class TrafficRouter
 * @brief Routes intercepted requests across clusters.
 *
 * Usage:
 * @code
 * TrafficRouter router("cluster-a", routes, connections, discovery, breakers, policy);
 * router.setLocalForwarder(forwarder);
 * server.setInboundHandler([&](auto& header, auto& stream, auto& reader) {
 *     router.serveInbound(header, stream, reader);
 * });
 * router.attach(interceptor);
 * @endcode
 */
class CROSSMESH_CORE_API TrafficRouter {
public:
    TrafficRouter(ClusterId localCluster,
                  std::shared_ptr<RouteTable> routes,
                  std::shared_ptr<ConnectionManager> connections,
                  std::shared_ptr<DiscoveryManager> discovery,
                  const BreakerConfig& breakerConfig = BreakerConfig(),
                  const TrafficPolicy& policy = TrafficPolicy());

    ~TrafficRouter();

    TrafficRouter(const TrafficRouter&) = delete;
    TrafficRouter& operator=(const TrafficRouter&) = delete;

    /**
     * @brief Route one request to its cluster and return the peer's answer.
     * @throws MeshError NOT_FOUND, CIRCUIT_OPEN, NO_ENDPOINTS, TIMEOUT,
     *         UNREACHABLE, IDENTITY_MISMATCH.
     */
    proxy::ProxyResponse handle(const proxy::ProxyRequest& request);

    /**
     * @brief handle(), with failures turned into error responses.
     */
    proxy::ProxyResponse handleOrError(const proxy::ProxyRequest& request);

    /**
     * @brief Serve one PROXY stream opened by a peer.
     */
    void serveInbound(const proxy::StreamHeader& header, Stream& stream, FrameReader& reader);

    void setLocalForwarder(std::shared_ptr<LocalForwarder> forwarder);

    /**
     * @brief Pull requests from interceptor, one task per request.
     */
    bool attach(std::shared_ptr<Interceptor> interceptor);

    void stop();

    BreakerRegistry& breakers() { return breakers_; }

    uint64_t requestsRouted() const { return requestsRouted_.load(); }
    uint64_t requestsFailed() const { return requestsFailed_.load(); }
    uint64_t retries() const { return retries_.load(); }
    uint64_t inboundServed() const { return inboundServed_.load(); }

    static bool isIdempotent(const std::string& method);

    /**
     * @brief The response the interception edge returns for error.
     */
    static proxy::ProxyResponse errorResponse(const MeshError& error);

private:
    ClusterId localCluster_;
    std::shared_ptr<RouteTable> routes_;
    std::shared_ptr<ConnectionManager> connections_;
    std::shared_ptr<DiscoveryManager> discovery_;
    std::shared_ptr<LocalForwarder> forwarder_;
    BreakerRegistry breakers_;
    TrafficPolicy policy_;

    std::shared_ptr<Interceptor> interceptor_;
    std::atomic<bool> running_{false};
    std::thread pumpThread_;
    utils::TaskGroup tasks_;

    std::atomic<uint64_t> requestsRouted_{0};
    std::atomic<uint64_t> requestsFailed_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> inboundServed_{0};

    proxy::ProxyResponse exchange(const CrossClusterRoute& route, const ServiceEndpoint& target,
                                  const proxy::ProxyRequest& request, const Deadline& deadline);

    // True when target names an exported instance of this cluster.
    bool isLocalInstance(const proxy::TargetEndpoint& target);

    void pumpLoop();
};

}  // namespace core
}  // namespace crossmesh

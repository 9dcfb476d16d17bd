/**
 * @file traffic_router.cpp
 * @brief TrafficRouter implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/traffic_router.hpp"
#include "crossmesh/utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>

namespace crossmesh {
namespace core {

namespace {

const char* reasonFor(int status) {
    switch (status) {
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Bad Gateway";
    }
}

std::string nextRequestId() {
    static std::atomic<uint64_t> counter{0};
    return "req-" + std::to_string(counter.fetch_add(1) + 1);
}

}  // namespace

TrafficRouter::TrafficRouter(ClusterId localCluster,
                             std::shared_ptr<RouteTable> routes,
                             std::shared_ptr<ConnectionManager> connections,
                             std::shared_ptr<DiscoveryManager> discovery,
                             const BreakerConfig& breakerConfig,
                             const TrafficPolicy& policy)
    : localCluster_(std::move(localCluster))
    , routes_(std::move(routes))
    , connections_(std::move(connections))
    , discovery_(std::move(discovery))
    , breakers_(breakerConfig)
    , policy_(policy)
    , tasks_("TrafficRouter", policy.max_inflight)
{}

TrafficRouter::~TrafficRouter() {
    stop();
}

bool TrafficRouter::isIdempotent(const std::string& method) {
    std::string upper = method;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "GET" || upper == "HEAD" || upper == "OPTIONS" ||
           upper == "PUT" || upper == "DELETE" || upper == "TRACE";
}

proxy::ProxyResponse TrafficRouter::errorResponse(const MeshError& error) {
    proxy::ProxyResponse response;
    int status = httpStatusForError(error.kind());
    response.set_status(status);
    response.set_reason(reasonFor(status));

    auto* kind = response.add_headers();
    kind->set_name(MESH_ERROR_HEADER);
    kind->set_value(errorKindToString(error.kind()));

    auto* type = response.add_headers();
    type->set_name("Content-Type");
    type->set_value("text/plain");

    response.set_body(std::string(error.what()) + "\n");
    return response;
}

// =============================================================================
// Outbound
// =============================================================================

proxy::ProxyResponse TrafficRouter::handle(const proxy::ProxyRequest& request) {
    auto route = routes_->classify(request.host());
    if (!route) {
        throw MeshError(ErrorKind::NOT_FOUND, "'" + request.host() + "' is not a mesh destination");
    }

    auto breaker = breakers_.get(route->serviceKey());
    if (!breaker->allowRequest()) {
        throw MeshError(ErrorKind::CIRCUIT_OPEN, "circuit open for " + route->serviceKey());
    }

    auto timeout = request.timeout_ms() > 0 ? std::chrono::milliseconds(request.timeout_ms())
                                            : policy_.request_timeout;
    Deadline deadline = Deadline::after(timeout);

    bool retryable = policy_.retry_non_idempotent || isIdempotent(request.method());
    int attempts = 1 + (retryable ? std::max(0, policy_.max_retries) : 0);
    ExponentialBackoff backoff(policy_.retry_backoff_initial, policy_.retry_backoff_max);

    for (int attempt = 1;; ++attempt) {
        std::string endpointKey;
        auto started = std::chrono::steady_clock::now();

        try {
            ServiceEndpoint target = routes_->select(*route, deadline);
            endpointKey = target.key();
            routes_->metrics().requestStarted(endpointKey);

            auto response = exchange(*route, target, request, deadline);

            routes_->metrics().requestFinished(
                endpointKey,
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started),
                true);
            breaker->recordSuccess();
            requestsRouted_.fetch_add(1);
            return response;
        } catch (const MeshError& e) {
            if (!endpointKey.empty()) {
                routes_->metrics().requestFinished(
                    endpointKey,
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started),
                    false);
            }

            bool transport = isTransportFailure(e.kind());
            bool again = transport && attempt < attempts && !deadline.expired();
            if (again) {
                auto delay = std::min(backoff.next(), deadline.remaining());
                LOG_DEBUG("TrafficRouter", "{} {} attempt {}/{} failed ({}), retrying in {}ms",
                          request.method(), route->key(), attempt, attempts, e.what(),
                          delay.count());
                retries_.fetch_add(1);
                std::this_thread::sleep_for(delay);
                continue;
            }

            if (transport) {
                breaker->recordFailure();
            } else {
                breaker->recordSuccess();
            }
            requestsFailed_.fetch_add(1);
            LOG_WARN("TrafficRouter", "{} {}{} failed: {} ({})", request.method(), request.host(),
                     request.path(), e.what(), errorKindToString(e.kind()));
            throw;
        } catch (const std::exception& e) {
            if (!endpointKey.empty()) {
                routes_->metrics().requestFinished(endpointKey, std::chrono::milliseconds(0), false);
            }
            breaker->recordFailure();
            requestsFailed_.fetch_add(1);
            LOG_ERROR("TrafficRouter", "{} {}{} failed unexpectedly: {}", request.method(),
                      request.host(), request.path(), e.what());
            throw;
        }
    }
}

proxy::ProxyResponse TrafficRouter::exchange(const CrossClusterRoute& route,
                                             const ServiceEndpoint& target,
                                             const proxy::ProxyRequest& request,
                                             const Deadline& deadline) {
    if (deadline.expired()) {
        throw MeshError(ErrorKind::TIMEOUT, "request deadline expired before dispatch");
    }

    auto connection = connections_->getConnection(route.cluster, deadline);

    try {
        auto stream = connection->openStream(deadline.remaining());
        writeStreamHeader(*stream, proxy::STREAM_PROXY, localCluster_);

        proxy::ProxyRequest outbound = request;
        if (outbound.request_id().empty()) {
            outbound.set_request_id(nextRequestId());
        }
        auto* dest = outbound.mutable_target();
        dest->set_service(target.service);
        dest->set_namespace_(target.ns);
        dest->set_address(target.address);
        dest->set_port(target.port);
        outbound.set_timeout_ms(deadline.remaining().count());

        writeMessage(*stream, outbound);
        stream->finish();

        FrameReader reader(*stream);
        proxy::ProxyResponse response;
        if (!reader.readMessage(response, deadline)) {
            stream->close();
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "peer ended the stream without a response");
        }
        stream->close();
        return response;
    } catch (const MeshError& e) {
        if (e.kind() == ErrorKind::CONNECTION_CLOSED) {
            connections_->invalidate(route.cluster);
        }
        throw;
    }
}

proxy::ProxyResponse TrafficRouter::handleOrError(const proxy::ProxyRequest& request) {
    try {
        return handle(request);
    } catch (const MeshError& e) {
        return errorResponse(e);
    } catch (const std::exception& e) {
        return errorResponse(MeshError(ErrorKind::UNREACHABLE, e.what()));
    }
}

// =============================================================================
// Inbound
// =============================================================================

bool TrafficRouter::isLocalInstance(const proxy::TargetEndpoint& target) {
    CrossClusterRoute local{localCluster_, target.service(), target.namespace_(), 0};
    try {
        for (const auto& ep : discovery_->resolve(local)) {
            if (ep.address == target.address() && ep.port == target.port()) {
                return true;
            }
        }
    } catch (const MeshError& e) {
        LOG_DEBUG("TrafficRouter", "Inbound target {}.{} not exported: {}",
                  target.service(), target.namespace_(), e.what());
    }
    return false;
}

void TrafficRouter::serveInbound(const proxy::StreamHeader& header, Stream& stream,
                                 FrameReader& reader) {
    Deadline deadline = Deadline::after(policy_.request_timeout);

    proxy::ProxyRequest request;
    if (!reader.readMessage(request, deadline)) {
        throw MeshError(ErrorKind::MALFORMED, "proxy stream ended before the request");
    }

    auto timeout = request.timeout_ms() > 0
                       ? std::min(std::chrono::milliseconds(request.timeout_ms()),
                                  policy_.request_timeout)
                       : policy_.request_timeout;

    proxy::ProxyResponse response;
    if (!isLocalInstance(request.target())) {
        LOG_WARN("TrafficRouter", "Rejecting request from '{}' for {}:{}: not an exported instance",
                 header.source_cluster(), request.target().address(), request.target().port());
        response = errorResponse(MeshError(ErrorKind::UNAUTHORIZED,
                                           "target is not an exported instance"));
    } else if (!forwarder_) {
        response = errorResponse(MeshError(ErrorKind::UNREACHABLE, "no local forwarder"));
    } else {
        try {
            response = forwarder_->forward(request, timeout);
        } catch (const MeshError& e) {
            LOG_WARN("TrafficRouter", "Delivery to {}:{} failed: {}", request.target().address(),
                     request.target().port(), e.what());
            response = errorResponse(MeshError(ErrorKind::UNREACHABLE,
                                               std::string("local delivery failed: ") + e.what()));
            response.set_status(502);
            response.set_reason("Bad Gateway");
        }
    }

    response.set_request_id(request.request_id());
    writeMessage(stream, response);
    stream.finish();
    inboundServed_.fetch_add(1);

    LOG_DEBUG("TrafficRouter", "Served {} {} from '{}' -> {}", request.method(), request.path(),
              header.source_cluster(), response.status());
}

void TrafficRouter::setLocalForwarder(std::shared_ptr<LocalForwarder> forwarder) {
    forwarder_ = std::move(forwarder);
}

// =============================================================================
// Interceptor pump
// =============================================================================

bool TrafficRouter::attach(std::shared_ptr<Interceptor> interceptor) {
    if (running_.load()) {
        LOG_WARN("TrafficRouter", "An interceptor is already attached");
        return false;
    }
    if (!interceptor->start()) {
        LOG_ERROR("TrafficRouter", "Interceptor failed to start");
        return false;
    }

    interceptor_ = std::move(interceptor);
    running_.store(true);
    pumpThread_ = std::thread(&TrafficRouter::pumpLoop, this);
    return true;
}

void TrafficRouter::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    interceptor_->stop();
    if (pumpThread_.joinable()) {
        pumpThread_.join();
    }
    tasks_.joinAll();
}

void TrafficRouter::pumpLoop() {
    LOG_DEBUG("TrafficRouter", "Interceptor pump started");

    while (running_.load()) {
        std::unique_ptr<InterceptedRequest> intercepted;
        try {
            intercepted = interceptor_->next(std::chrono::milliseconds(500));
        } catch (const MeshError& e) {
            if (running_.load()) {
                LOG_ERROR("TrafficRouter", "Interceptor stopped: {}", e.what());
            }
            break;
        }
        if (!intercepted) {
            continue;
        }

        std::shared_ptr<InterceptedRequest> shared(std::move(intercepted));
        auto spawned = tasks_.spawn([this, shared] {
            shared->respond(handleOrError(shared->request));
        });
        if (spawned == utils::SpawnStatus::CLOSED) {
            shared->respond(errorResponse(MeshError(ErrorKind::UNREACHABLE, "proxy shutting down")));
            break;
        }
        if (spawned == utils::SpawnStatus::AT_CAPACITY) {
            auto busy = errorResponse(MeshError(ErrorKind::UNREACHABLE, "proxy at capacity"));
            busy.set_status(503);
            busy.set_reason("Service Unavailable");
            shared->respond(busy);
        }
    }

    LOG_DEBUG("TrafficRouter", "Interceptor pump stopped");
}

}  // namespace core
}  // namespace crossmesh

/**
 * @file http_proxy_interceptor.cpp
 * @brief HttpProxyInterceptor implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/services/http_proxy_interceptor.hpp"
#include "crossmesh/services/http_convert.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/core/traffic_router.hpp"
#include "crossmesh/net/http_message.hpp"
#include "crossmesh/utils/logger.hpp"

#include <future>

namespace crossmesh {
namespace services {

using core::ErrorKind;
using core::MeshError;

namespace {

constexpr int ACCEPT_POLL_MS = 500;
constexpr int WRITE_TIMEOUT_MS = 10000;

net::HttpResponse plainResponse(int status, const std::string& kind, const std::string& message) {
    net::HttpResponse response;
    response.status = status;
    response.reason = net::reasonPhrase(status);
    net::setHeader(response.headers, core::MESH_ERROR_HEADER, kind);
    net::setHeader(response.headers, "Content-Type", "text/plain");
    response.body = message + "\n";
    return response;
}

bool wantsClose(const net::HttpRequest& request) {
    const std::string* connection = net::findHeader(request.headers, "Connection");
    if (request.version == "HTTP/1.0") {
        return !connection || *connection != "keep-alive";
    }
    return connection && *connection == "close";
}

// One answer per captured request, whichever of router and timeout comes first.
struct PendingAnswer {
    std::promise<proxy::ProxyResponse> promise;
    std::atomic<bool> answered{false};
};

}  // namespace

HttpProxyInterceptor::HttpProxyInterceptor(const HttpProxyConfig& config)
    : config_(config)
    , clients_("http-proxy", config.max_clients)
{
}

HttpProxyInterceptor::~HttpProxyInterceptor() {
    stop();
}

bool HttpProxyInterceptor::start() {
    if (running_.load()) {
        return true;
    }
    if (!listener_.isValid()) {
        LOG_ERROR("HttpProxy", "Listener socket could not be created");
        return false;
    }

    listener_.setReuseAddress(true);
    if (!listener_.bind(config_.port, config_.bind_address) || !listener_.listen()) {
        LOG_ERROR("HttpProxy", "Failed to listen on {}:{}", config_.bind_address, config_.port);
        return false;
    }

    boundPort_ = listener_.getLocalPort();
    stopped_.store(false);
    running_.store(true);
    acceptThread_ = std::thread(&HttpProxyInterceptor::acceptLoop, this);

    LOG_INFO("HttpProxy", "Intercepting HTTP on {}:{}", config_.bind_address, boundPort_);
    return true;
}

void HttpProxyInterceptor::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    listener_.close();

    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        for (const auto& client : openClients_) {
            client->shutdown();
        }
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopped_.store(true);
    }
    queueCv_.notify_all();

    clients_.joinAll();

    // Anything still queued never reached the router.
    std::deque<std::unique_ptr<core::InterceptedRequest>> leftover;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        leftover.swap(queue_);
    }
    for (auto& request : leftover) {
        request->respond(core::TrafficRouter::errorResponse(
            MeshError(ErrorKind::UNREACHABLE, "proxy shutting down")));
    }

    LOG_INFO("HttpProxy", "Stopped after {} requests", requestsCaptured_.load());
}

std::unique_ptr<core::InterceptedRequest> HttpProxyInterceptor::next(
    std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queueMutex_);
    queueCv_.wait_for(lock, timeout, [this] { return stopped_.load() || !queue_.empty(); });
    if (stopped_.load()) {
        throw MeshError(ErrorKind::CONNECTION_CLOSED, "interceptor stopped");
    }
    if (queue_.empty()) {
        return nullptr;
    }
    auto request = std::move(queue_.front());
    queue_.pop_front();
    return request;
}

bool HttpProxyInterceptor::enqueue(std::unique_ptr<core::InterceptedRequest> request) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopped_.load() || queue_.size() >= config_.max_pending) {
            return false;
        }
        queue_.push_back(std::move(request));
    }
    queueCv_.notify_one();
    return true;
}

void HttpProxyInterceptor::acceptLoop() {
    while (running_.load()) {
        auto client = std::make_shared<net::TcpSocket>(net::INVALID_SOCKET_HANDLE);
        net::SocketAddress peer;
        int result = listener_.accept(*client, peer, ACCEPT_POLL_MS);
        clients_.reap();
        if (result == 0) {
            continue;
        }
        if (result < 0) {
            if (running_.load()) {
                LOG_WARN("HttpProxy", "Accept failed: error {}", listener_.getLastError());
            }
            continue;
        }

        client->setNoDelay(true);
        {
            std::lock_guard<std::mutex> lock(clientsMutex_);
            openClients_.insert(client);
        }
        auto spawned = clients_.spawn([this, client, peer] { serveClient(client, peer); });
        if (spawned != utils::SpawnStatus::STARTED) {
            {
                std::lock_guard<std::mutex> lock(clientsMutex_);
                openClients_.erase(client);
            }
            if (spawned == utils::SpawnStatus::CLOSED) {
                break;
            }
            LOG_WARN("HttpProxy", "Refusing client {}: too many connections", peer.toString());
            client->close();
        }
    }
}

void HttpProxyInterceptor::serveClient(std::shared_ptr<net::TcpSocket> client,
                                       net::SocketAddress peer) {
    LOG_TRACE("HttpProxy", "Client connected from {}", peer.toString());
    net::HttpConnection connection(*client);

    while (running_.load()) {
        net::HttpRequest request;
        if (!connection.readRequest(request, static_cast<int>(config_.idle_timeout.count()))) {
            break;
        }

        if (request.method == "CONNECT") {
            if (!connection.writeResponse(plainResponse(405, "unsupported",
                                                        "CONNECT tunnels are not proxied"),
                                          WRITE_TIMEOUT_MS)) {
                LOG_DEBUG("HttpProxy", "Client {} went away", peer.toString());
            }
            break;
        }

        std::string requestId = "req-" + std::to_string(nextRequestId_.fetch_add(1));
        auto pending = std::make_shared<PendingAnswer>();
        auto answer = pending->promise.get_future();

        auto intercepted = std::make_unique<core::InterceptedRequest>();
        intercepted->request = toProxyRequest(request, requestId);
        intercepted->request.set_timeout_ms(config_.response_timeout.count());
        intercepted->respond = [pending](const proxy::ProxyResponse& response) {
            if (!pending->answered.exchange(true)) {
                pending->promise.set_value(response);
            }
        };

        net::HttpResponse response;
        if (!enqueue(std::move(intercepted))) {
            response = plainResponse(503, core::errorKindToString(ErrorKind::UNREACHABLE),
                                     "proxy is overloaded or shutting down");
        } else {
            requestsCaptured_.fetch_add(1);
            LOG_DEBUG("HttpProxy", "{} {} {} host={}", requestId, request.method,
                      request.path(), request.authority());
            if (answer.wait_for(config_.response_timeout) == std::future_status::ready) {
                response = toHttpResponse(answer.get());
            } else {
                pending->answered.store(true);
                response = plainResponse(504, core::errorKindToString(ErrorKind::TIMEOUT),
                                         "no answer from the mesh in time");
            }
        }

        bool close = wantsClose(request);
        if (close) {
            net::setHeader(response.headers, "Connection", "close");
        }
        if (!connection.writeResponse(response, WRITE_TIMEOUT_MS) || close) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        openClients_.erase(client);
    }
    client->close();
    LOG_TRACE("HttpProxy", "Client {} disconnected", peer.toString());
}

}  // namespace services
}  // namespace crossmesh

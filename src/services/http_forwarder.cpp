/**
 * @file http_forwarder.cpp
 * @brief HttpForwarder implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/services/http_forwarder.hpp"
#include "crossmesh/services/http_convert.hpp"
#include "crossmesh/core/errors.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/net/http_message.hpp"
#include "crossmesh/net/tcp_socket.hpp"
#include "crossmesh/utils/logger.hpp"

#include <algorithm>

namespace crossmesh {
namespace services {

using core::ErrorKind;
using core::MeshError;

HttpForwarder::HttpForwarder(const HttpForwarderConfig& config)
    : config_(config)
{
}

proxy::ProxyResponse HttpForwarder::forward(const proxy::ProxyRequest& request,
                                            std::chrono::milliseconds timeout) {
    const auto& target = request.target();
    net::SocketAddress dest{target.address(), static_cast<uint16_t>(target.port())};
    core::Deadline deadline = core::Deadline::after(timeout);

    net::TcpSocket socket;
    int connectMs = static_cast<int>(std::min(config_.connect_timeout, timeout).count());
    if (!socket.connect(dest, connectMs)) {
        throw MeshError(ErrorKind::UNREACHABLE, "local instance " + dest.toString() +
                        " did not accept the connection");
    }
    socket.setNoDelay(true);

    net::HttpRequest outgoing = toHttpRequest(request);
    net::setHeader(outgoing.headers, "Connection", "close");

    net::HttpConnection connection(socket);
    if (!connection.writeRequest(outgoing, static_cast<int>(deadline.remaining().count()))) {
        throw MeshError(ErrorKind::CONNECTION_CLOSED, "failed to send request to " +
                        dest.toString());
    }

    net::HttpResponse response;
    if (!connection.readResponse(response, outgoing.method,
                                 static_cast<int>(deadline.remaining().count()))) {
        if (deadline.expired()) {
            throw MeshError(ErrorKind::TIMEOUT, "local instance " + dest.toString() +
                            " did not answer in time");
        }
        throw MeshError(ErrorKind::CONNECTION_CLOSED, "no valid response from " +
                        dest.toString());
    }

    forwarded_.fetch_add(1);
    LOG_DEBUG("HttpForwarder", "{} {} {} -> {}", request.request_id(), request.method(),
              dest.toString(), response.status);
    return toProxyResponse(response, request.request_id());
}

}  // namespace services
}  // namespace crossmesh

/**
 * @file http_convert.hpp
 * @brief Conversions between HTTP/1.1 messages and proxy envelopes.
 *
 * Hop-by-hop headers (Connection, Keep-Alive, Proxy-*, TE, Trailer,
 * Transfer-Encoding, Upgrade) never cross the mesh. Content-Length is
 * dropped as well; serialization recomputes it.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/services/export.hpp"
#include "crossmesh/net/http_message.hpp"

#include "crossmesh/proto/proxy.pb.h"

#include <string>

namespace crossmesh {
namespace services {

/// True for headers stripped when a message crosses the mesh.
CROSSMESH_SERVICES_API bool isHopByHopHeader(const std::string& name);

/**
 * @brief Captured request to envelope. Host comes from the request's authority.
 */
CROSSMESH_SERVICES_API proxy::ProxyRequest toProxyRequest(const net::HttpRequest& request,
                                                          const std::string& requestId);

CROSSMESH_SERVICES_API net::HttpResponse toHttpResponse(const proxy::ProxyResponse& response);

/**
 * @brief Envelope to an origin-form request for a local instance.
 */
CROSSMESH_SERVICES_API net::HttpRequest toHttpRequest(const proxy::ProxyRequest& request);

CROSSMESH_SERVICES_API proxy::ProxyResponse toProxyResponse(const net::HttpResponse& response,
                                                            const std::string& requestId);

}  // namespace services
}  // namespace crossmesh

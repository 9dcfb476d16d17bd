/**
 * @file interceptor.hpp
 * @brief Sources of application traffic and sinks for delivered traffic.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"

#include "crossmesh/proto/proxy.pb.h"

#include <chrono>
#include <functional>
#include <memory>

namespace crossmesh {
namespace core {

/**
 * @struct InterceptedRequest
 * @brief One captured request and the way to answer it.
 */
struct CROSSMESH_CORE_API InterceptedRequest {
    proxy::ProxyRequest request;
    std::function<void(const proxy::ProxyResponse&)> respond;
};

/**
 * @class Interceptor
 * @brief Captures application requests bound for other clusters.
 */
class CROSSMESH_CORE_API Interceptor {
public:
    virtual ~Interceptor() = default;

    virtual bool start() = 0;

    virtual void stop() = 0;

    /**
     * @brief Next captured request, or nullptr on timeout.
     * @throws MeshError(CONNECTION_CLOSED) once stopped.
     */
    virtual std::unique_ptr<InterceptedRequest> next(std::chrono::milliseconds timeout) = 0;
};

/**
 * @class LocalForwarder
 * @brief Delivers a proxied request to an instance in this cluster.
 */
class CROSSMESH_CORE_API LocalForwarder {
public:
    virtual ~LocalForwarder() = default;

    /**
     * @throws MeshError when the instance cannot be reached or does not answer.
     */
    virtual proxy::ProxyResponse forward(const proxy::ProxyRequest& request,
                                         std::chrono::milliseconds timeout) = 0;
};

}  // namespace core
}  // namespace crossmesh

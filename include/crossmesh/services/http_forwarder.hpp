/**
 * @file http_forwarder.hpp
 * @brief Delivers proxied requests to local instances over HTTP/1.1.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/services/export.hpp"
#include "crossmesh/core/interceptor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace crossmesh {
namespace services {

struct CROSSMESH_SERVICES_API HttpForwarderConfig {
    std::chrono::milliseconds connect_timeout{2000};
};

/**
 * @class HttpForwarder
 * @brief core::LocalForwarder using one TCP connection per request.
 *
 * Failures raise MeshError: UNREACHABLE when the instance refuses the
 * connection, TIMEOUT when it does not answer in time, CONNECTION_CLOSED
 * when it hangs up mid-response.
 */
class CROSSMESH_SERVICES_API HttpForwarder : public core::LocalForwarder {
public:
    explicit HttpForwarder(const HttpForwarderConfig& config = HttpForwarderConfig());

    proxy::ProxyResponse forward(const proxy::ProxyRequest& request,
                                 std::chrono::milliseconds timeout) override;

    uint64_t forwarded() const { return forwarded_.load(); }

private:
    HttpForwarderConfig config_;
    std::atomic<uint64_t> forwarded_{0};
};

}  // namespace services
}  // namespace crossmesh

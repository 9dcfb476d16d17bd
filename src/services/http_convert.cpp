/**
 * @file http_convert.cpp
 * @brief HTTP <-> proxy envelope conversions.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/services/http_convert.hpp"

#include <algorithm>
#include <cctype>

namespace crossmesh {
namespace services {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

template<typename Headers>
void appendProtoHeaders(const net::HttpHeaders& from, Headers* to) {
    for (const auto& header : from) {
        if (isHopByHopHeader(header.first)) {
            continue;
        }
        auto* out = to->Add();
        out->set_name(header.first);
        out->set_value(header.second);
    }
}

template<typename Headers>
void appendHttpHeaders(const Headers& from, net::HttpHeaders& to) {
    for (const auto& header : from) {
        if (isHopByHopHeader(header.name())) {
            continue;
        }
        to.emplace_back(header.name(), header.value());
    }
}

}  // namespace

bool isHopByHopHeader(const std::string& name) {
    std::string lower = lowercase(name);
    return lower == "connection" || lower == "keep-alive" || lower == "proxy-connection" ||
           lower == "proxy-authenticate" || lower == "proxy-authorization" ||
           lower == "te" || lower == "trailer" || lower == "transfer-encoding" ||
           lower == "upgrade" || lower == "content-length";
}

proxy::ProxyRequest toProxyRequest(const net::HttpRequest& request, const std::string& requestId) {
    proxy::ProxyRequest out;
    out.set_request_id(requestId);
    out.set_method(request.method);
    out.set_path(request.path());
    out.set_host(request.authority());
    appendProtoHeaders(request.headers, out.mutable_headers());
    out.set_body(request.body);
    return out;
}

net::HttpResponse toHttpResponse(const proxy::ProxyResponse& response) {
    net::HttpResponse out;
    out.status = response.status();
    out.reason = response.reason().empty() ? net::reasonPhrase(response.status())
                                           : response.reason();
    appendHttpHeaders(response.headers(), out.headers);
    out.body = response.body();
    return out;
}

net::HttpRequest toHttpRequest(const proxy::ProxyRequest& request) {
    net::HttpRequest out;
    out.method = request.method();
    out.target = request.path().empty() ? "/" : request.path();
    appendHttpHeaders(request.headers(), out.headers);
    if (!request.host().empty()) {
        net::setHeader(out.headers, "Host", request.host());
    }
    out.body = request.body();
    return out;
}

proxy::ProxyResponse toProxyResponse(const net::HttpResponse& response,
                                     const std::string& requestId) {
    proxy::ProxyResponse out;
    out.set_request_id(requestId);
    out.set_status(response.status);
    out.set_reason(response.reason);
    appendProtoHeaders(response.headers, out.mutable_headers());
    out.set_body(response.body);
    return out;
}

}  // namespace services
}  // namespace crossmesh

/**
 * @file test_http_convert.cpp
 * @brief Unit tests for HTTP message <-> mesh envelope conversion
 */

#include <gtest/gtest.h>
#include <crossmesh/services/http_convert.hpp>

using namespace crossmesh;
using namespace crossmesh::services;

namespace {

const std::string* protoHeader(const proxy::ProxyRequest& request, const std::string& name) {
    for (const auto& header : request.headers()) {
        if (header.name() == name) {
            return &header.value();
        }
    }
    return nullptr;
}

}  // namespace

TEST(HttpConvertTest, HopByHopHeaders) {
    EXPECT_TRUE(isHopByHopHeader("Connection"));
    EXPECT_TRUE(isHopByHopHeader("transfer-encoding"));
    EXPECT_TRUE(isHopByHopHeader("Proxy-Authorization"));
    EXPECT_TRUE(isHopByHopHeader("Content-Length"));
    EXPECT_FALSE(isHopByHopHeader("Content-Type"));
    EXPECT_FALSE(isHopByHopHeader("Authorization"));
    EXPECT_FALSE(isHopByHopHeader("X-Request-Id"));
}

TEST(HttpConvertTest, AbsoluteFormRequestToEnvelope) {
    net::HttpRequest request;
    request.method = "POST";
    request.target = "http://payment-service.production.cluster-b.mesh:8080/charge?id=7";
    request.headers = {{"Host", "payment-service.production.cluster-b.mesh:8080"},
                       {"Content-Type", "application/json"},
                       {"Proxy-Connection", "keep-alive"},
                       {"Content-Length", "9"}};
    request.body = "{\"a\":42}";

    auto envelope = toProxyRequest(request, "req-9");

    EXPECT_EQ(envelope.request_id(), "req-9");
    EXPECT_EQ(envelope.method(), "POST");
    EXPECT_EQ(envelope.host(), "payment-service.production.cluster-b.mesh:8080");
    EXPECT_EQ(envelope.path(), "/charge?id=7");
    EXPECT_EQ(envelope.body(), "{\"a\":42}");

    ASSERT_NE(protoHeader(envelope, "Content-Type"), nullptr);
    EXPECT_EQ(*protoHeader(envelope, "Content-Type"), "application/json");
    EXPECT_EQ(protoHeader(envelope, "Proxy-Connection"), nullptr);
    EXPECT_EQ(protoHeader(envelope, "Content-Length"), nullptr);
}

TEST(HttpConvertTest, OriginFormRequestUsesHostHeader) {
    net::HttpRequest request;
    request.method = "GET";
    request.target = "/status";
    request.headers = {{"host", "orders.shop.cluster-a.mesh"}};

    auto envelope = toProxyRequest(request, "req-1");

    EXPECT_EQ(envelope.host(), "orders.shop.cluster-a.mesh");
    EXPECT_EQ(envelope.path(), "/status");
}

TEST(HttpConvertTest, EnvelopeToOriginFormRequest) {
    proxy::ProxyRequest envelope;
    envelope.set_method("PUT");
    envelope.set_path("/items/3");
    envelope.set_host("orders.shop.cluster-a.mesh");
    envelope.set_body("x");
    auto* accept = envelope.add_headers();
    accept->set_name("Accept");
    accept->set_value("*/*");
    auto* upgrade = envelope.add_headers();
    upgrade->set_name("Upgrade");
    upgrade->set_value("websocket");

    auto request = toHttpRequest(envelope);

    EXPECT_EQ(request.method, "PUT");
    EXPECT_EQ(request.target, "/items/3");
    EXPECT_EQ(request.body, "x");
    ASSERT_NE(net::findHeader(request.headers, "host"), nullptr);
    EXPECT_EQ(*net::findHeader(request.headers, "host"), "orders.shop.cluster-a.mesh");
    ASSERT_NE(net::findHeader(request.headers, "accept"), nullptr);
    EXPECT_EQ(net::findHeader(request.headers, "upgrade"), nullptr);
}

TEST(HttpConvertTest, EmptyPathBecomesRoot) {
    proxy::ProxyRequest envelope;
    envelope.set_method("GET");
    EXPECT_EQ(toHttpRequest(envelope).target, "/");
}

TEST(HttpConvertTest, ResponseConversions) {
    net::HttpResponse response;
    response.status = 201;
    response.reason = "Created";
    response.headers = {{"Location", "/items/4"}, {"Transfer-Encoding", "chunked"}};
    response.body = "ok";

    auto envelope = toProxyResponse(response, "req-4");
    EXPECT_EQ(envelope.request_id(), "req-4");
    EXPECT_EQ(envelope.status(), 201);
    EXPECT_EQ(envelope.reason(), "Created");
    ASSERT_EQ(envelope.headers_size(), 1);
    EXPECT_EQ(envelope.headers(0).name(), "Location");
    EXPECT_EQ(envelope.body(), "ok");

    auto back = toHttpResponse(envelope);
    EXPECT_EQ(back.status, 201);
    EXPECT_EQ(back.reason, "Created");
    EXPECT_EQ(back.body, "ok");
    EXPECT_EQ(net::findHeader(back.headers, "Transfer-Encoding"), nullptr);
}

TEST(HttpConvertTest, MissingReasonIsFilledIn) {
    proxy::ProxyResponse envelope;
    envelope.set_status(404);

    auto response = toHttpResponse(envelope);
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.reason, "Not Found");
}

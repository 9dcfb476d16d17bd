/**
 * @file test_http_message.cpp
 * @brief Unit tests for HTTP/1.1 parsing and serialization
 */

#include <gtest/gtest.h>
#include <crossmesh/net/http_message.hpp>
#include <crossmesh/net/tcp_socket.hpp>

#include <string>
#include <thread>

using namespace crossmesh::net;

class HttpMessageTest : public ::testing::Test {};

// =============================================================================
// Headers
// =============================================================================

TEST_F(HttpMessageTest, HeaderLookupIsCaseInsensitive) {
    HttpHeaders headers = {{"Content-Type", "text/plain"}, {"X-Trace", "abc"}};
    ASSERT_NE(findHeader(headers, "content-type"), nullptr);
    EXPECT_EQ(*findHeader(headers, "CONTENT-TYPE"), "text/plain");
    EXPECT_EQ(findHeader(headers, "Accept"), nullptr);

    setHeader(headers, "x-trace", "def");
    EXPECT_EQ(headers.size(), 2u);
    EXPECT_EQ(*findHeader(headers, "X-Trace"), "def");

    removeHeader(headers, "X-TRACE");
    EXPECT_EQ(findHeader(headers, "X-Trace"), nullptr);
}

// =============================================================================
// Request parsing
// =============================================================================

TEST_F(HttpMessageTest, ParsesOriginFormRequest) {
    HttpRequest request;
    ASSERT_TRUE(parseRequestHead(
        "GET /pay?id=7 HTTP/1.1\r\nHost: payment-service.production.cluster-b\r\nAccept: */*",
        request));
    EXPECT_EQ(request.method, "GET");
    EXPECT_EQ(request.path(), "/pay?id=7");
    EXPECT_EQ(request.authority(), "payment-service.production.cluster-b");
    EXPECT_EQ(request.version, "HTTP/1.1");
    EXPECT_EQ(request.headers.size(), 2u);
}

TEST_F(HttpMessageTest, ParsesAbsoluteFormRequest) {
    HttpRequest request;
    ASSERT_TRUE(parseRequestHead(
        "POST http://orders.shop.cluster-c:8080/checkout HTTP/1.1\r\nHost: ignored", request));
    EXPECT_EQ(request.authority(), "orders.shop.cluster-c:8080");
    EXPECT_EQ(request.path(), "/checkout");

    HttpRequest bare;
    ASSERT_TRUE(parseRequestHead("GET http://orders.shop.cluster-c HTTP/1.1", bare));
    EXPECT_EQ(bare.path(), "/");
}

TEST_F(HttpMessageTest, RejectsMalformedRequests) {
    HttpRequest request;
    EXPECT_FALSE(parseRequestHead("", request));
    EXPECT_FALSE(parseRequestHead("GET /", request));
    EXPECT_FALSE(parseRequestHead("GET / FTP/1.0", request));
    EXPECT_FALSE(parseRequestHead("GET / HTTP/1.1\r\nno-colon-here", request));
}

TEST_F(HttpMessageTest, ParsesResponseHead) {
    HttpResponse response;
    ASSERT_TRUE(parseResponseHead("HTTP/1.1 503 Service Unavailable\r\nRetry-After: 1",
                                  response));
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.reason, "Service Unavailable");
    EXPECT_EQ(*findHeader(response.headers, "retry-after"), "1");

    HttpResponse no_reason;
    ASSERT_TRUE(parseResponseHead("HTTP/1.1 204", no_reason));
    EXPECT_EQ(no_reason.status, 204);
    EXPECT_TRUE(no_reason.reason.empty());

    HttpResponse bad;
    EXPECT_FALSE(parseResponseHead("HTTP/1.1 2x0 OK", bad));
}

TEST_F(HttpMessageTest, RejectsHighBitStatusBytes) {
    HttpResponse response;
    EXPECT_FALSE(parseResponseHead("HTTP/1.1 2\xb2\xb3 OK", response));
    EXPECT_FALSE(parseResponseHead("HTTP/1.1 \xff\xfe\xfd OK", response));
}

// =============================================================================
// Serialization
// =============================================================================

TEST_F(HttpMessageTest, SerializeReframesBody) {
    HttpResponse response;
    response.status = 200;
    response.reason = "OK";
    response.headers = {{"Transfer-Encoding", "chunked"}, {"Content-Type", "text/plain"}};
    response.body = "hello";

    std::string wire = response.serialize();
    EXPECT_EQ(wire, "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\n\r\nhello");
}

TEST_F(HttpMessageTest, SerializeRewritesStaleContentLength) {
    HttpRequest request;
    request.method = "POST";
    request.target = "/submit";
    request.headers = {{"Host", "svc"}, {"Content-Length", "999"}};
    request.body = "abc";

    EXPECT_EQ(request.serialize(),
              "POST /submit HTTP/1.1\r\nHost: svc\r\nContent-Length: 3\r\n\r\nabc");
}

TEST_F(HttpMessageTest, ReasonPhrases) {
    EXPECT_STREQ(reasonPhrase(200), "OK");
    EXPECT_STREQ(reasonPhrase(502), "Bad Gateway");
    EXPECT_STREQ(reasonPhrase(504), "Gateway Timeout");
    EXPECT_STREQ(reasonPhrase(299), "Unknown");
}

// =============================================================================
// Chunked bodies
// =============================================================================

TEST_F(HttpMessageTest, DecodesChunkedBody) {
    std::string input = "5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\nTrailer: x\r\n\r\nNEXT";
    std::string body;
    size_t consumed = 0;
    ASSERT_EQ(decodeChunked(input, body, consumed), 1);
    EXPECT_EQ(body, "hello world");
    EXPECT_EQ(input.substr(consumed), "NEXT");
}

TEST_F(HttpMessageTest, ChunkedNeedsMoreInput) {
    std::string body;
    size_t consumed = 0;
    EXPECT_EQ(decodeChunked("5\r\nhel", body, consumed), 0);
    EXPECT_EQ(decodeChunked("5\r\nhello\r\n0\r\n", body, consumed), 0);
}

TEST_F(HttpMessageTest, ChunkedRejectsGarbage) {
    std::string body;
    size_t consumed = 0;
    EXPECT_EQ(decodeChunked("zz\r\nhello\r\n", body, consumed), -1);
    EXPECT_EQ(decodeChunked("5\r\nhelloXX0\r\n\r\n", body, consumed), -1);
}

TEST_F(HttpMessageTest, ChunkedRejectsHighBitSize) {
    std::string body;
    size_t consumed = 0;
    EXPECT_EQ(decodeChunked("\xe5\r\nhello\r\n0\r\n\r\n", body, consumed), -1);
}

// =============================================================================
// HttpConnection over a socket pair
// =============================================================================

class HttpConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(listener_.setReuseAddress(true));
        ASSERT_TRUE(listener_.bind(0, "127.0.0.1"));
        ASSERT_TRUE(listener_.listen());

        std::thread acceptor([this]() {
            SocketAddress peer;
            listener_.accept(server_, peer, 2000);
        });
        bool connected = client_.connect(SocketAddress("127.0.0.1", listener_.getLocalPort()), 2000);
        acceptor.join();
        ASSERT_TRUE(connected);
        ASSERT_TRUE(server_.isValid());
    }

    TcpSocket listener_;
    TcpSocket client_;
    TcpSocket server_;
};

TEST_F(HttpConnectionTest, ReadsPipelinedRequests) {
    ASSERT_TRUE(client_.sendAll(std::string(
        "POST /a HTTP/1.1\r\nHost: x\r\nContent-Length: 3\r\n\r\nabc"
        "GET /b HTTP/1.1\r\nHost: x\r\n\r\n"), 1000));

    HttpConnection conn(server_);
    HttpRequest first;
    ASSERT_TRUE(conn.readRequest(first, 1000));
    EXPECT_EQ(first.method, "POST");
    EXPECT_EQ(first.body, "abc");

    HttpRequest second;
    ASSERT_TRUE(conn.readRequest(second, 1000));
    EXPECT_EQ(second.path(), "/b");
    EXPECT_TRUE(second.body.empty());
}

TEST_F(HttpConnectionTest, ReadsChunkedResponse) {
    ASSERT_TRUE(server_.sendAll(std::string(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n"), 1000));

    HttpConnection conn(client_);
    HttpResponse response;
    ASSERT_TRUE(conn.readResponse(response, "GET", 1000));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "abcde");
}

TEST_F(HttpConnectionTest, ReadsBodyUntilClose) {
    ASSERT_TRUE(server_.sendAll(std::string("HTTP/1.0 200 OK\r\n\r\nstreamed"), 1000));
    server_.close();

    HttpConnection conn(client_);
    HttpResponse response;
    ASSERT_TRUE(conn.readResponse(response, "GET", 1000));
    EXPECT_EQ(response.body, "streamed");
}

TEST_F(HttpConnectionTest, HeadResponseHasNoBody) {
    ASSERT_TRUE(server_.sendAll(std::string("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n"), 1000));

    HttpConnection conn(client_);
    HttpResponse response;
    ASSERT_TRUE(conn.readResponse(response, "HEAD", 1000));
    EXPECT_TRUE(response.body.empty());
}

TEST_F(HttpConnectionTest, ReadTimesOutOnSilence) {
    HttpConnection conn(server_);
    HttpRequest request;
    EXPECT_FALSE(conn.readRequest(request, 50));
}

TEST_F(HttpConnectionTest, WriteThenReadRoundTrip) {
    HttpResponse response;
    response.status = 404;
    response.reason = "Not Found";
    response.headers = {{"X-Crossmesh-Error", "not-found"}};
    response.body = "missing";

    HttpConnection writer(server_);
    ASSERT_TRUE(writer.writeResponse(response, 1000));

    HttpConnection reader(client_);
    HttpResponse got;
    ASSERT_TRUE(reader.readResponse(got, "GET", 1000));
    EXPECT_EQ(got.status, 404);
    EXPECT_EQ(got.body, "missing");
    EXPECT_EQ(*findHeader(got.headers, "x-crossmesh-error"), "not-found");
}

/**
 * @file http_message.hpp
 * @brief Minimal HTTP/1.1 request/response model, parser and writer.
 *
 * Enough of HTTP/1.1 for a forward proxy: start line, headers,
 * Content-Length and chunked bodies, read-until-close responses.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/net/export.hpp"
#include "crossmesh/net/tcp_socket.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace crossmesh {
namespace net {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/// Largest accepted header block.
constexpr size_t MAX_HTTP_HEADER_BYTES = 64 * 1024;

/// Largest accepted body; matches the mesh frame limit.
constexpr size_t MAX_HTTP_BODY_BYTES = 16 * 1024 * 1024;

/**
 * @brief Case-insensitive header lookup. Returns nullptr when absent.
 */
CROSSMESH_NET_API const std::string* findHeader(const HttpHeaders& headers,
                                                const std::string& name);

/**
 * @brief Replace (or add) a header, case-insensitively.
 */
CROSSMESH_NET_API void setHeader(HttpHeaders& headers, const std::string& name,
                                 const std::string& value);

CROSSMESH_NET_API void removeHeader(HttpHeaders& headers, const std::string& name);

struct CROSSMESH_NET_API HttpRequest {
    std::string method;
    std::string target;      // origin-form "/x" or absolute-form "http://h/x"
    std::string version = "HTTP/1.1";
    HttpHeaders headers;
    std::string body;

    /**
     * @brief Authority the request is addressed to: the absolute-form host
     * when present, else the Host header.
     */
    std::string authority() const;

    /**
     * @brief Path and query, with any absolute-form prefix stripped.
     */
    std::string path() const;

    std::string serialize() const;
};

struct CROSSMESH_NET_API HttpResponse {
    std::string version = "HTTP/1.1";
    int status = 200;
    std::string reason = "OK";
    HttpHeaders headers;
    std::string body;

    std::string serialize() const;
};

CROSSMESH_NET_API const char* reasonPhrase(int status);

/**
 * @brief Parse a header block (start line + headers, without the final CRLFCRLF).
 */
CROSSMESH_NET_API bool parseRequestHead(const std::string& head, HttpRequest& out);
CROSSMESH_NET_API bool parseResponseHead(const std::string& head, HttpResponse& out);

/**
 * @brief Decode a complete chunked body.
 * @param consumed Output: bytes of input used, including the trailer.
 * @return 1 when complete, 0 when more input is needed, -1 when malformed.
 */
CROSSMESH_NET_API int decodeChunked(const std::string& input, std::string& out,
                                    size_t& consumed);

/**
 * @class HttpConnection
 * @brief Buffered HTTP/1.1 reader/writer over a TcpSocket.
 */
class CROSSMESH_NET_API HttpConnection {
public:
    explicit HttpConnection(TcpSocket& socket) : socket_(socket) {}

    /**
     * @brief Read one request. Returns false on timeout, close or malformed input.
     */
    bool readRequest(HttpRequest& request, int timeoutMs);

    /**
     * @brief Read one response to a request with the given method.
     */
    bool readResponse(HttpResponse& response, const std::string& requestMethod,
                      int timeoutMs);

    bool writeRequest(const HttpRequest& request, int timeoutMs);
    bool writeResponse(const HttpResponse& response, int timeoutMs);

private:
    TcpSocket& socket_;
    std::string buffer_;

    bool readHead(std::string& head, int timeoutMs);
    bool readBody(const HttpHeaders& headers, bool untilClose, std::string& body,
                  int timeoutMs);

    // Reads more bytes into buffer_. False on timeout or error; sets eof.
    bool fill(int timeoutMs, bool& eof);
};

}  // namespace net
}  // namespace crossmesh

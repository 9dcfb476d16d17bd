/**
 * @file tcp_socket.cpp
 * @brief Cross-platform TCP socket implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/net/tcp_socket.hpp"
#include "crossmesh/utils/logger.hpp"

#include <chrono>
#include <cstring>

namespace crossmesh {
namespace net {

namespace {

bool resolveIPv4(const std::string& host, struct in_addr& out) {
    if (host.empty() || host == "0.0.0.0") {
        out.s_addr = INADDR_ANY;
        return true;
    }
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return true;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return false;
    }
    out = reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

bool setBlocking(SocketHandle s, bool blocking) {
#ifdef _WIN32
    u_long mode = blocking ? 0 : 1;
    return ioctlsocket(s, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(s, F_SETFL, flags) == 0;
#endif
}

bool connectInProgress(int error) {
#ifdef _WIN32
    return error == WSAEWOULDBLOCK;
#else
    return error == EINPROGRESS;
#endif
}

}  // namespace

bool SocketAddress::parse(const std::string& text, SocketAddress& out) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return false;
    }
    std::string portText = text.substr(colon + 1);
    for (char c : portText) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    unsigned long port = std::stoul(portText);
    if (port == 0 || port > 65535) {
        return false;
    }
    out.host = text.substr(0, colon);
    out.port = static_cast<uint16_t>(port);
    return true;
}

TcpSocket::TcpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
    , peerClosed_(false)
{
    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("TcpSocket", "Failed to create socket: error {}", lastError_);
    }
}

TcpSocket::TcpSocket(SocketHandle handle)
    : socket_(handle)
    , lastError_(0)
    , peerClosed_(false)
{}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
    , peerClosed_(other.peerClosed_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        peerClosed_ = other.peerClosed_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool TcpSocket::setReuseAddress(bool enable) {
    if (!isValid()) {
        return false;
    }

    int optval = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&optval), sizeof(optval)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool TcpSocket::setNoDelay(bool enable) {
    if (!isValid()) {
        return false;
    }

    int optval = enable ? 1 : 0;
    if (setsockopt(socket_, IPPROTO_TCP, TCP_NODELAY,
                   reinterpret_cast<const char*>(&optval), sizeof(optval)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool TcpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!resolveIPv4(address, addr.sin_addr)) {
        LOG_ERROR("TcpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("TcpSocket", "Failed to bind to {}:{} - error {}",
                  address, port, lastError_);
        return false;
    }

    LOG_DEBUG("TcpSocket", "Bound to {}:{}", address, port);
    return true;
}

bool TcpSocket::listen(int backlog) {
    if (!isValid()) {
        return false;
    }
    if (::listen(socket_, backlog) != 0) {
        setLastError();
        LOG_ERROR("TcpSocket", "listen() failed: error {}", lastError_);
        return false;
    }
    return true;
}

uint16_t TcpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

int TcpSocket::accept(TcpSocket& client, SocketAddress& peer, int timeoutMs) {
    if (!isValid()) {
        return -1;
    }

    int ready = waitReady(false, timeoutMs);
    if (ready <= 0) {
        return ready;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    SocketHandle handle = ::accept(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
    if (handle == INVALID_SOCKET_HANDLE) {
        setLastError();
        return -1;
    }

    char ipStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
    peer.host = ipStr;
    peer.port = ntohs(addr.sin_port);

    client = TcpSocket(handle);
    return 1;
}

bool TcpSocket::connect(const SocketAddress& dest, int timeoutMs) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);
    if (!resolveIPv4(dest.host, addr.sin_addr)) {
        LOG_WARN("TcpSocket", "Cannot resolve {}", dest.host);
        return false;
    }

    if (!setBlocking(socket_, false)) {
        setLastError();
        return false;
    }

    int rc = ::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc != 0) {
        setLastError();
        if (!connectInProgress(lastError_)) {
            LOG_DEBUG("TcpSocket", "connect {} failed: error {}", dest.toString(), lastError_);
            return false;
        }
        if (waitReady(true, timeoutMs) <= 0) {
            LOG_DEBUG("TcpSocket", "connect {} timed out", dest.toString());
            return false;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(socket_, SOL_SOCKET, SO_ERROR,
                       reinterpret_cast<char*>(&soError), &len) != 0 || soError != 0) {
            lastError_ = soError;
            LOG_DEBUG("TcpSocket", "connect {} failed: error {}", dest.toString(), soError);
            return false;
        }
    }

    return setBlocking(socket_, true);
}

bool TcpSocket::sendAll(const void* data, size_t length, int timeoutMs) {
    if (!isValid()) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    const char* cursor = static_cast<const char*>(data);
    size_t remaining = length;

    while (remaining > 0) {
        int waitMs = -1;
        if (timeoutMs >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                return false;
            }
            waitMs = static_cast<int>(left);
        }
        if (waitReady(true, waitMs) <= 0) {
            return false;
        }

#ifdef _WIN32
        int sent = ::send(socket_, cursor, static_cast<int>(remaining), SEND_FLAGS);
#else
        ssize_t sent = ::send(socket_, cursor, remaining, SEND_FLAGS);
#endif
        if (sent < 0) {
            setLastError();
            return false;
        }
        cursor += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return true;
}

int TcpSocket::receive(void* buffer, size_t bufferSize, int timeoutMs) {
    if (!isValid()) {
        return -1;
    }

    int ready = waitReady(false, timeoutMs);
    if (ready <= 0) {
        return ready;
    }

#ifdef _WIN32
    int result = ::recv(socket_, static_cast<char*>(buffer), static_cast<int>(bufferSize), 0);
#else
    ssize_t result = ::recv(socket_, buffer, bufferSize, 0);
#endif

    if (result == 0) {
        peerClosed_ = true;
        return -1;
    }
    if (result < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(result);
}

void TcpSocket::shutdown() {
    if (isValid()) {
        shutdownSocket(socket_);
    }
}

void TcpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void TcpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

int TcpSocket::waitReady(bool forWrite, int timeoutMs) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(socket_, &set);

    struct timeval tv;
    struct timeval* tvp = nullptr;
    if (timeoutMs >= 0) {
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        tvp = &tv;
    }

#ifdef _WIN32
    int result = ::select(0, forWrite ? nullptr : &set, forWrite ? &set : nullptr, nullptr, tvp);
#else
    int result = ::select(socket_ + 1, forWrite ? nullptr : &set, forWrite ? &set : nullptr,
                          nullptr, tvp);
#endif
    if (result < 0) {
        setLastError();
        return -1;
    }
    return result;
}

}  // namespace net
}  // namespace crossmesh

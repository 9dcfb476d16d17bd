/**
 * @file platform.hpp
 * @brief Cross-platform socket type definitions and includes.
 *
 * Abstracts Windows Winsock2 and POSIX socket APIs into a common interface.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace crossmesh {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;
        constexpr int SEND_FLAGS = 0;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }
        inline void shutdownSocket(SocketHandle s) { ::shutdown(s, SD_BOTH); }

        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }

        inline void cleanupSockets() {
            WSACleanup();
        }
    }  // namespace net
    }  // namespace crossmesh

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace crossmesh {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;
    #ifdef MSG_NOSIGNAL
        // A peer that hung up must not kill the daemon with SIGPIPE.
        constexpr int SEND_FLAGS = MSG_NOSIGNAL;
    #else
        constexpr int SEND_FLAGS = 0;
    #endif

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }
        inline void shutdownSocket(SocketHandle s) { ::shutdown(s, SHUT_RDWR); }

        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}
    }  // namespace net
    }  // namespace crossmesh

#endif

namespace crossmesh {
namespace net {

/**
 * @brief RAII helper for socket initialization.
 *
 * Create one instance at program startup to ensure
 * proper Winsock initialization on Windows.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace crossmesh

/**
 * @file framing.hpp
 * @brief Length-prefixed protobuf messages over a transport Stream.
 *
 * Frame layout: 4-byte big-endian payload length, then the payload
 * (a serialized protobuf message). Frames larger than MAX_FRAME_BYTES
 * are malformed.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/core/transport.hpp"

#include "crossmesh/proto/proxy.pb.h"

#include <google/protobuf/message_lite.h>

#include <cstdint>
#include <string>

namespace crossmesh {
namespace core {

constexpr size_t FRAME_HEADER_BYTES = 4;
constexpr size_t MAX_FRAME_BYTES = 16 * 1024 * 1024;

/// Version written into every StreamHeader.
constexpr uint32_t STREAM_PROTOCOL_VERSION = 1;

/**
 * @brief Prefix payload with its length.
 * @throws MeshError(MALFORMED) when payload exceeds MAX_FRAME_BYTES.
 */
CROSSMESH_CORE_API std::string encodeFrame(const std::string& payload);

/**
 * @brief Read the big-endian length from the first four bytes of data.
 */
CROSSMESH_CORE_API uint32_t decodeFrameLength(const char* data);

/**
 * @brief Serialize message and write it as one frame.
 */
CROSSMESH_CORE_API void writeMessage(Stream& stream, const google::protobuf::MessageLite& message);

/**
 * @brief Write the StreamHeader that opens every stream.
 */
CROSSMESH_CORE_API void writeStreamHeader(Stream& stream, proxy::StreamKind kind,
                                          const ClusterId& sourceCluster);

/**
 * @class FrameReader
 * @brief Reassembles frames from the chunks a Stream delivers.
 *
 * Usage:
 * @code
 * FrameReader reader(*stream);
 * discovery::DiscoveryQuery query;
 * if (!reader.readMessage(query, Deadline::after(timeout))) {
 *     // peer finished the stream before sending anything
 * }
 * @endcode
 */
class CROSSMESH_CORE_API FrameReader {
public:
    explicit FrameReader(Stream& stream) : stream_(stream), eof_(false) {}

    /**
     * @brief Read one frame's payload.
     * @return False when the stream ended cleanly on a frame boundary.
     * @throws MeshError MALFORMED (oversized or truncated frame),
     *         TIMEOUT, CONNECTION_CLOSED.
     */
    bool next(std::string& payload, const Deadline& deadline);

    /**
     * @brief Read one frame and parse it into message.
     * @throws MeshError(MALFORMED) when the payload does not parse.
     */
    bool readMessage(google::protobuf::MessageLite& message, const Deadline& deadline);

private:
    Stream& stream_;
    std::string buffer_;
    bool eof_;

    // Pull one more chunk; false at end of stream.
    bool fill(const Deadline& deadline);
};

}  // namespace core
}  // namespace crossmesh

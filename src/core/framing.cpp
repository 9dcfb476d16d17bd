/**
 * @file framing.cpp
 * @brief Frame encoding and reassembly.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/framing.hpp"
#include "crossmesh/core/errors.hpp"

namespace crossmesh {
namespace core {

std::string encodeFrame(const std::string& payload) {
    if (payload.size() > MAX_FRAME_BYTES) {
        throw MeshError(ErrorKind::MALFORMED,
                        "frame of " + std::to_string(payload.size()) + " bytes exceeds limit");
    }

    uint32_t length = static_cast<uint32_t>(payload.size());
    std::string frame;
    frame.reserve(FRAME_HEADER_BYTES + payload.size());
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame.append(payload);
    return frame;
}

uint32_t decodeFrameLength(const char* data) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
           static_cast<uint32_t>(bytes[3]);
}

void writeMessage(Stream& stream, const google::protobuf::MessageLite& message) {
    std::string payload;
    if (!message.SerializeToString(&payload)) {
        throw MeshError(ErrorKind::MALFORMED, "failed to serialize " + message.GetTypeName());
    }
    stream.write(encodeFrame(payload));
}

void writeStreamHeader(Stream& stream, proxy::StreamKind kind, const ClusterId& sourceCluster) {
    proxy::StreamHeader header;
    header.set_kind(kind);
    header.set_source_cluster(sourceCluster);
    header.set_version(STREAM_PROTOCOL_VERSION);
    writeMessage(stream, header);
}

bool FrameReader::fill(const Deadline& deadline) {
    if (eof_) {
        return false;
    }
    if (deadline.expired()) {
        throw MeshError(ErrorKind::TIMEOUT, "frame read deadline expired");
    }

    std::string chunk;
    if (!stream_.read(chunk, deadline.remaining())) {
        eof_ = true;
        return false;
    }
    buffer_.append(chunk);
    return true;
}

bool FrameReader::next(std::string& payload, const Deadline& deadline) {
    while (buffer_.size() < FRAME_HEADER_BYTES) {
        if (!fill(deadline)) {
            if (buffer_.empty()) {
                return false;
            }
            throw MeshError(ErrorKind::MALFORMED, "stream ended inside a frame header");
        }
    }

    uint32_t length = decodeFrameLength(buffer_.data());
    if (length > MAX_FRAME_BYTES) {
        throw MeshError(ErrorKind::MALFORMED,
                        "frame length " + std::to_string(length) + " exceeds limit");
    }

    while (buffer_.size() < FRAME_HEADER_BYTES + length) {
        if (!fill(deadline)) {
            throw MeshError(ErrorKind::MALFORMED, "stream ended inside a frame");
        }
    }

    payload.assign(buffer_, FRAME_HEADER_BYTES, length);
    buffer_.erase(0, FRAME_HEADER_BYTES + length);
    return true;
}

bool FrameReader::readMessage(google::protobuf::MessageLite& message, const Deadline& deadline) {
    std::string payload;
    if (!next(payload, deadline)) {
        return false;
    }
    if (!message.ParseFromString(payload)) {
        throw MeshError(ErrorKind::MALFORMED, "undecodable " + message.GetTypeName());
    }
    return true;
}

}  // namespace core
}  // namespace crossmesh

/**
 * @file errors.hpp
 * @brief Error kinds raised by the mesh core.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/core/export.hpp"

#include <stdexcept>
#include <string>

namespace crossmesh {
namespace core {

/**
 * @enum ErrorKind
 * @brief Distinguishable failure categories.
 */
enum class ErrorKind {
    UNREACHABLE,        ///< Neither path to the cluster worked
    TIMEOUT,            ///< A deadline expired
    IDENTITY_MISMATCH,  ///< Peer presented a NodeId other than the pinned one
    NOT_FOUND,          ///< Service or cluster unknown
    CIRCUIT_OPEN,       ///< Breaker rejected the call
    NO_ENDPOINTS,       ///< Service resolved to an empty instance set
    CONNECTION_CLOSED,  ///< Transport connection or stream went away
    REFUSED,            ///< Peer actively refused
    MALFORMED,          ///< Undecodable frame or message
    UNAUTHORIZED        ///< Authorization hook denied the request
};

CROSSMESH_CORE_API const char* errorKindToString(ErrorKind kind);

/**
 * @brief Failures worth a retry on another attempt: transport-level only.
 */
CROSSMESH_CORE_API bool isTransportFailure(ErrorKind kind);

/**
 * @brief HTTP status used when the kind surfaces at the interception edge.
 */
CROSSMESH_CORE_API int httpStatusForError(ErrorKind kind);

/**
 * @class MeshError
 * @brief Exception carrying an ErrorKind.
 */
class CROSSMESH_CORE_API MeshError : public std::runtime_error {
public:
    MeshError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace core
}  // namespace crossmesh

/**
 * @file errors.cpp
 * @brief ErrorKind helpers.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/errors.hpp"

namespace crossmesh {
namespace core {

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNREACHABLE: return "unreachable";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::IDENTITY_MISMATCH: return "identity-mismatch";
        case ErrorKind::NOT_FOUND: return "not-found";
        case ErrorKind::CIRCUIT_OPEN: return "circuit-open";
        case ErrorKind::NO_ENDPOINTS: return "no-endpoints";
        case ErrorKind::CONNECTION_CLOSED: return "connection-closed";
        case ErrorKind::REFUSED: return "refused";
        case ErrorKind::MALFORMED: return "malformed";
        case ErrorKind::UNAUTHORIZED: return "unauthorized";
        default: return "unknown";
    }
}

bool isTransportFailure(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNREACHABLE:
        case ErrorKind::TIMEOUT:
        case ErrorKind::CONNECTION_CLOSED:
        case ErrorKind::REFUSED:
            return true;
        default:
            return false;
    }
}

int httpStatusForError(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return 404;
        case ErrorKind::CIRCUIT_OPEN: return 503;
        case ErrorKind::NO_ENDPOINTS: return 503;
        case ErrorKind::TIMEOUT: return 504;
        case ErrorKind::UNAUTHORIZED: return 403;
        case ErrorKind::MALFORMED: return 400;
        case ErrorKind::UNREACHABLE:
        case ErrorKind::IDENTITY_MISMATCH:
        case ErrorKind::CONNECTION_CLOSED:
        case ErrorKind::REFUSED:
        default:
            return 502;
    }
}

}  // namespace core
}  // namespace crossmesh

/**
 * @file logger.cpp
 * @brief Logger helpers that are not header-only.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/utils/logger.hpp"

#include <cctype>

namespace crossmesh {
namespace utils {

LogLevel logLevelFromString(const std::string& name, LogLevel fallback) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO")  return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    if (upper == "OFF")   return LogLevel::OFF;
    return fallback;
}

}  // namespace utils
}  // namespace crossmesh

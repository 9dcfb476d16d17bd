/**
 * @file node_identity.cpp
 * @brief Node identity implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/utils/node_identity.hpp"
#include "crossmesh/utils/logger.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace crossmesh {
namespace utils {

std::string generateNodeId() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(
        (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()));
    thread_local std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < NODE_ID_BYTES / sizeof(uint64_t); ++i) {
        oss << std::setw(16) << dist(gen);
    }
    return oss.str();
}

bool isValidNodeId(const std::string& nodeId) {
    if (nodeId.size() != NODE_ID_HEX_LENGTH) {
        return false;
    }
    for (char c : nodeId) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string shortNodeId(const std::string& nodeId) {
    return nodeId.size() <= 10 ? nodeId : nodeId.substr(0, 10);
}

std::string loadOrCreateNodeId(const std::string& path) {
    {
        std::ifstream in(path);
        if (in) {
            std::string stored;
            std::getline(in, stored);
            while (!stored.empty() && std::isspace(static_cast<unsigned char>(stored.back()))) {
                stored.pop_back();
            }
            if (!isValidNodeId(stored)) {
                throw std::runtime_error("Invalid node identity in " + path);
            }
            LOG_INFO("NodeIdentity", "Loaded identity {} from {}", shortNodeId(stored), path);
            return stored;
        }
    }

    std::string nodeId = generateNodeId();
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write node identity to " + path);
    }
    out << nodeId << "\n";
    if (!out.flush()) {
        throw std::runtime_error("Cannot write node identity to " + path);
    }

    LOG_INFO("NodeIdentity", "Generated identity {} and stored it in {}",
             shortNodeId(nodeId), path);
    return nodeId;
}

}  // namespace utils
}  // namespace crossmesh

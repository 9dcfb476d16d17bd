/**
 * @file crc64.cpp
 * @brief CRC64 helpers.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/utils/crc64.hpp"

#include <iomanip>
#include <sstream>

namespace crossmesh {
namespace utils {

uint64_t crc64Fields(const std::vector<std::string>& fields) {
    Crc64 crc;
    for (const auto& field : fields) {
        crc.updateField(field);
    }
    return crc.value();
}

std::string crc64Hex(uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << value;
    return oss.str();
}

}  // namespace utils
}  // namespace crossmesh

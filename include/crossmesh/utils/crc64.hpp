/**
 * @file crc64.hpp
 * @brief CRC64 (ECMA-182) used to fingerprint service catalogues.
 *
 * Two peers that publish the same set of services compute the same
 * fingerprint, which lets discovery detect identical re-publication
 * without comparing whole catalogues.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/utils/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crossmesh {
namespace utils {

/**
 * @class Crc64
 * @brief Incremental CRC64 accumulator.
 *
 * @code
 * Crc64 crc;
 * crc.update("payments/default:8080/TCP");
 * crc.updateField("orders");      // length-delimited
 * uint64_t value = crc.value();
 * @endcode
 */
class CROSSMESH_UTILS_API Crc64 {
public:
    static constexpr uint64_t POLYNOMIAL = 0x42F0E1EBA9EA3693ULL;

    Crc64() : crc_(~0ULL) {}

    void update(const void* data, size_t length) {
        const auto* bytes = static_cast<const uint8_t*>(data);
        const auto& t = table();
        for (size_t i = 0; i < length; ++i) {
            uint8_t index = static_cast<uint8_t>(crc_ >> 56) ^ bytes[i];
            crc_ = t[index] ^ (crc_ << 8);
        }
    }

    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    /**
     * @brief Feed a field preceded by its length so that ("ab","c") and
     * ("a","bc") produce different values.
     */
    void updateField(const std::string& field) {
        uint8_t len[4] = {
            static_cast<uint8_t>(field.size() >> 24),
            static_cast<uint8_t>(field.size() >> 16),
            static_cast<uint8_t>(field.size() >> 8),
            static_cast<uint8_t>(field.size())
        };
        update(len, sizeof(len));
        update(field);
    }

    uint64_t value() const { return crc_ ^ ~0ULL; }

    void reset() { crc_ = ~0ULL; }

private:
    uint64_t crc_;

    static const std::array<uint64_t, 256>& table() {
        static const std::array<uint64_t, 256> t = [] {
            std::array<uint64_t, 256> result{};
            for (uint64_t i = 0; i < 256; ++i) {
                uint64_t crc = i << 56;
                for (int bit = 0; bit < 8; ++bit) {
                    crc = (crc & 0x8000000000000000ULL) ? (crc << 1) ^ POLYNOMIAL : crc << 1;
                }
                result[i] = crc;
            }
            return result;
        }();
        return t;
    }
};

/**
 * @brief Fingerprint an ordered list of fields.
 */
CROSSMESH_UTILS_API uint64_t crc64Fields(const std::vector<std::string>& fields);

/**
 * @brief Render a CRC value as 16 lowercase hex digits.
 */
CROSSMESH_UTILS_API std::string crc64Hex(uint64_t value);

}  // namespace utils
}  // namespace crossmesh

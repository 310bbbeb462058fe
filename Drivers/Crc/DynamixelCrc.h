#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * @brief  Dynamixel Protocol 2.0 checksum, software forms
 *
 * CRC-16 with polynomial 0x8005, initial value 0, no reflection and no
 * final xor. The packet carries the result little-endian: [low, high].
 * These are the references the hardware unit is checked against.
 */

namespace Drivers {
namespace Crc {

    static constexpr uint16_t kDynamixelPolynomial = 0x8005;
    static constexpr uint16_t kDynamixelInit = 0x0000;

    using CrcBytes = std::array<uint8_t, 2>;

    // One bit at a time, MSB first
    uint16_t crc16Bitwise(const uint8_t* data, size_t len);

    // 256-entry table, one byte per step
    uint16_t crc16Table(const uint8_t* data, size_t len);

    inline CrcBytes toLittleEndian(uint16_t crc) {
        return { (uint8_t)(crc & 0xFF), (uint8_t)(crc >> 8) };
    }

    inline uint16_t fromLittleEndian(const CrcBytes& bytes) {
        return (uint16_t)(bytes[0] | (bytes[1] << 8));
    }

} // namespace Crc
} // namespace Drivers

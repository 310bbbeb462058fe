#include "Drivers/Crc/DynamixelCrc.h"

namespace Drivers {
namespace Crc {

static constexpr uint16_t tableEntry(uint8_t index) {
    uint16_t crc = (uint16_t)(index << 8);
    for (int bit = 0; bit < 8; ++bit) {
        crc = (crc & 0x8000) ? (uint16_t)((crc << 1) ^ kDynamixelPolynomial)
                             : (uint16_t)(crc << 1);
    }
    return crc;
}

static constexpr std::array<uint16_t, 256> makeTable() {
    std::array<uint16_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = tableEntry((uint8_t)i);
    }
    return table;
}

static constexpr std::array<uint16_t, 256> kTable = makeTable();

static_assert(kTable[1] == kDynamixelPolynomial, "table seeded with the generator polynomial");

uint16_t crc16Bitwise(const uint8_t* data, size_t len) {
    uint16_t crc = kDynamixelInit;
    for (size_t i = 0; i < len; ++i) {
        for (int bit = 7; bit >= 0; --bit) {
            const bool feedback = ((crc >> 15) ^ (data[i] >> bit)) & 1u;
            crc = (uint16_t)(crc << 1);
            if (feedback) crc ^= kDynamixelPolynomial;
        }
    }
    return crc;
}

uint16_t crc16Table(const uint8_t* data, size_t len) {
    uint16_t crc = kDynamixelInit;
    for (size_t i = 0; i < len; ++i) {
        const uint8_t index = (uint8_t)((crc >> 8) ^ data[i]);
        crc = (uint16_t)((crc << 8) ^ kTable[index]);
    }
    return crc;
}

} // namespace Crc
} // namespace Drivers


#include "Application/Apps/crc_demo.hpp"
#include "Drivers/Crc/DynamixelCrc.h"
#include "Drivers/Runtime/Log.hpp"

#include <cstring>
#include <utility>

using namespace nusense;
using Drivers::Crc::CrcBytes;
using Drivers::Crc::CrcProcessor;

/* Dynamixel 2.0 packets without their checksum */
static const uint8_t PING_PACKET[] = {
    0xFF, 0xFF, 0xFD, 0x00,  // header + reserved
    0x01,                    // ID
    0x03, 0x00,              // length
    0x01                     // ping
};
static const uint8_t READ_PACKET_SHORT[] = {
    0xFF, 0xFF, 0xFD, 0x00, 0x01, 0x07, 0x00,
    0x02,                    // read
    0x00, 0x00,              // address 0
    0x02, 0x00               // 2 bytes
};
static const uint8_t WRITE_GOAL_PACKET[] = {
    0xFF, 0xFF, 0xFD, 0x00, 0x01, 0x09, 0x00,
    0x03,                    // write
    0x74, 0x00,              // address 116, goal position
    0x00, 0x02, 0x00, 0x00   // 512
};
static const uint8_t READ_POSITION_PACKET[] = {
    0xFF, 0xFF, 0xFD, 0x00, 0x01, 0x07, 0x00,
    0x02,                    // read
    0x84, 0x00,              // address 132, present position
    0x04, 0x00               // 4 bytes
};

/* Split point of the contention packet, fed across two polls */
static constexpr size_t ROUND_SPLIT = 4;

CrcDemo::CrcDemo (CrcProcessor &crc) : crc(crc) {}

bool CrcDemo::appendCrc (CrcProcessor &crc, uint8_t* packet, size_t len) {
    const std::optional<CrcBytes> value = crc.calculate(packet, len);
    if (!value) return false;

    packet[len]     = (*value)[0]; // CRC_L
    packet[len + 1] = (*value)[1]; // CRC_H
    return true;
}

std::optional<bool> CrcDemo::verifyCrc (CrcProcessor &crc, const uint8_t* packet, size_t len) {
    if (len < 2) return false;

    const std::optional<CrcBytes> value = crc.calculate(packet, len - 2);
    if (!value) return std::nullopt;
    return (*value)[0] == packet[len - 2] && (*value)[1] == packet[len - 1];
}

void CrcDemo::check (bool ok, const char* what) {
    if (ok) {
        passCount ++;
        NUSENSE_LOG_INFO("CRC demo: %s: PASS", what);
    } else {
        failCount ++;
        NUSENSE_LOG_WARN("CRC demo: %s: FAIL", what);
    }
}

void CrcDemo::checkVerified (std::optional<bool> verified, bool expected, const char* what) {
    if (!verified) {
        NUSENSE_LOG_WARN("CRC demo: %s: unit busy", what);
        check(false, what);
        return;
    }
    check(*verified == expected, what);
}

void CrcDemo::testKnownVectors () {
    NUSENSE_LOG_INFO("Testing hardware CRC calculation against known vectors...");

    struct Vector {
        const uint8_t* data;
        size_t len;
        CrcBytes expected;
        const char* name;
    };
    const Vector vectors[] = {
        { READ_PACKET_SHORT,    sizeof(READ_PACKET_SHORT),    { 0x21, 0x51 }, "read packet vector" },
        { PING_PACKET,          sizeof(PING_PACKET),          { 0x19, 0x4E }, "ping packet vector" },
        { WRITE_GOAL_PACKET,    sizeof(WRITE_GOAL_PACKET),    { 0xCA, 0x89 }, "write packet vector" },
        { READ_POSITION_PACKET, sizeof(READ_POSITION_PACKET), { 0x1D, 0x15 }, "present position vector" },
    };

    for (const Vector &vector : vectors) {
        const std::optional<CrcBytes> value = crc.calculate(vector.data, vector.len);
        if (!value) {
            NUSENSE_LOG_WARN("CRC demo: %s: unit busy", vector.name);
            check(false, vector.name);
            continue;
        }
        NUSENSE_LOG_DEBUG("%s: hardware [%02X, %02X], expected [%02X, %02X]", vector.name,
            (*value)[0], (*value)[1], vector.expected[0], vector.expected[1]);
        check(*value == vector.expected, vector.name);
    }
}

void CrcDemo::testPacketOperations () {
    NUSENSE_LOG_INFO("Testing packet CRC calculation...");

    uint8_t packet[sizeof(WRITE_GOAL_PACKET) + 2];
    std::memcpy(packet, WRITE_GOAL_PACKET, sizeof(WRITE_GOAL_PACKET));
    if (!appendCrc(crc, packet, sizeof(WRITE_GOAL_PACKET))) {
        check(false, "write packet CRC");
        return;
    }

    NUSENSE_LOG_INFO("Write packet CRC: [%02X, %02X]",
        packet[sizeof(packet) - 2], packet[sizeof(packet) - 1]);
    checkVerified(verifyCrc(crc, packet, sizeof(packet)), true, "write packet verification");

    // Corrupt the address field, keep the old checksum
    packet[8] = 0xAA;
    checkVerified(verifyCrc(crc, packet, sizeof(packet)), false, "corrupted packet detection");
}

void CrcDemo::contentionHold () {
    std::optional<CrcProcessor::Session> session = crc.tryBegin();
    if (!session) {
        // Someone else owns the unit, try again next poll
        waits ++;
        return;
    }
    held.emplace(std::move(*session));

    const uint8_t data[] = { 0xFF, 0xFF, 0xFD, 0x00, round, 0x03, 0x00, 0x01 };
    std::memcpy(roundPacket, data, sizeof(roundPacket));

    held->feed(roundPacket, ROUND_SPLIT);
    timer.start(config::CRC_DEMO_HOLD_MS);
    current = Phase::CONTENTION_RELEASE;
}

void CrcDemo::contentionRelease () {
    if (!timer.expired()) {
        // A second user arriving now must be turned away
        if (crc.tryBegin()) {
            check(false, "session exclusion");
        } else {
            waits ++;
        }
        return;
    }

    held->feed(roundPacket + ROUND_SPLIT, sizeof(roundPacket) - ROUND_SPLIT);
    const CrcBytes value = held->finish();
    held.reset();

    NUSENSE_LOG_INFO("Contention round %u: data[4] = %u, CRC = [%02X, %02X]",
        (unsigned) round, (unsigned) roundPacket[4], value[0], value[1]);

    const CrcBytes reference = Drivers::Crc::toLittleEndian(
        Drivers::Crc::crc16Table(roundPacket, sizeof(roundPacket)));
    check(value == reference, "session matches software CRC");

    round ++;
    if (round < config::CRC_DEMO_CONTENTION_ROUNDS) {
        current = Phase::CONTENTION_HOLD;
        return;
    }

    NUSENSE_LOG_INFO("Concurrent access test completed");
    timer.start(config::CRC_DEMO_PERIOD_MS);
    current = Phase::PERIODIC;
}

void CrcDemo::periodic () {
    if (!timer.expired()) return;
    if (crc.busy()) {
        // Held by another user, the cycle runs at a later poll
        waits ++;
        return;
    }
    timer.start(config::CRC_DEMO_PERIOD_MS);

    cycleCount ++;
    NUSENSE_LOG_INFO("CRC Demo cycle %lu", (unsigned long) cycleCount);

    uint8_t packet[sizeof(READ_POSITION_PACKET) + 2];
    std::memcpy(packet, READ_POSITION_PACKET, sizeof(READ_POSITION_PACKET));
    if (!appendCrc(crc, packet, sizeof(READ_POSITION_PACKET))) {
        check(false, "packet CRC generation");
        return;
    }

    NUSENSE_LOG_INFO("Generated packet: [%02X %02X %02X %02X %02X %02X %02X %02X %02X %02X %02X %02X %02X %02X]",
        packet[0], packet[1], packet[2],  packet[3],  packet[4],  packet[5],  packet[6],
        packet[7], packet[8], packet[9], packet[10], packet[11], packet[12], packet[13]);

    checkVerified(verifyCrc(crc, packet, sizeof(packet)), true, "packet CRC verification");
}

void CrcDemo::poll () {
    switch (current) {
        case Phase::SELF_TEST:
            if (crc.busy()) {
                waits ++;
                return;
            }
            NUSENSE_LOG_INFO("Starting CRC Demo Application");
            testKnownVectors();
            testPacketOperations();
            NUSENSE_LOG_INFO("Testing concurrent CRC access...");
            current = Phase::CONTENTION_HOLD;
            return;
        case Phase::CONTENTION_HOLD:
            contentionHold();
            return;
        case Phase::CONTENTION_RELEASE:
            contentionRelease();
            return;
        case Phase::PERIODIC:
            periodic();
            return;
    }
}


#ifndef APP_CRC_DEMO_H
#define APP_CRC_DEMO_H

#include <cstddef>
#include <cstdint>
#include <optional>

#include "Application/Config/config.hpp"
#include "Drivers/Crc/CrcProcessor.hpp"
#include "Drivers/Runtime/Deadline.hpp"
#include "Drivers/Runtime/Task.hpp"

namespace nusense {
    /**
     * Exercises the hardware CRC unit with Dynamixel 2.0 packets.
     *
     * First poll: known vectors, then a Write packet built, checked and
     * corrupted. Then a few contention rounds where one session is held
     * across polls while a second user has to wait. Afterwards a Read
     * packet is built and verified every CRC_DEMO_PERIOD_MS.
     */
    class CrcDemo : public Drivers::Runtime::Task {
    public:
        enum class Phase {
            SELF_TEST,
            CONTENTION_HOLD,
            CONTENTION_RELEASE,
            PERIODIC
        };

        explicit CrcDemo (Drivers::Crc::CrcProcessor &crc);

        const char* name () const override { return "crc_demo"; }
        void poll () override;

        Phase phase () const { return current; }
        uint32_t passes () const { return passCount; }
        uint32_t failures () const { return failCount; }
        uint32_t cycles () const { return cycleCount; }
        uint32_t contentionWaits () const { return waits; }

        /**
         * Append the checksum of the first `len` bytes at packet[len], packet[len + 1].
         * Returns false, packet untouched, while another user holds the unit.
         */
        static bool appendCrc (Drivers::Crc::CrcProcessor &crc, uint8_t* packet, size_t len);
        /** Check the two trailing checksum bytes of a `len` byte packet; empty while the unit is held */
        static std::optional<bool> verifyCrc (Drivers::Crc::CrcProcessor &crc, const uint8_t* packet, size_t len);

    private:
        void check (bool ok, const char* what);
        void checkVerified (std::optional<bool> verified, bool expected, const char* what);

        void testKnownVectors ();
        void testPacketOperations ();
        void contentionHold ();
        void contentionRelease ();
        void periodic ();

        Drivers::Crc::CrcProcessor &crc;
        Phase current = Phase::SELF_TEST;
        Drivers::Runtime::Deadline timer;

        std::optional<Drivers::Crc::CrcProcessor::Session> held;
        uint8_t round = 0;
        uint8_t roundPacket[8];

        uint32_t passCount = 0;
        uint32_t failCount = 0;
        uint32_t cycleCount = 0;
        uint32_t waits = 0;
    };
};

#endif /* APP_CRC_DEMO_H */

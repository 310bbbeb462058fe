#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "Drivers/Crc/DynamixelCrc.h"
#include "Drivers/Runtime/Mutex.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

namespace Drivers {
namespace Crc {

    struct CrcClaims {
        CRC_HandleTypeDef* hcrc;   // Instance must point at the CRC unit
    };

    /**
     * @brief Dynamixel CRC-16 on the hardware CRC unit.
     *
     * The unit holds one accumulator, so two users interleaving their feeds
     * would corrupt each other. calculate() runs reset, feed and read with
     * no await point in between. Computations that span several polls take
     * a Session instead. Both turn the caller away while the unit is held;
     * it retries at its next poll.
     */
    class CrcProcessor {
    public:
        explicit CrcProcessor(const CrcClaims& claims);

        CrcProcessor(const CrcProcessor&) = delete;
        CrcProcessor& operator=(const CrcProcessor&) = delete;

        // Empty while a session holds the unit.
        std::optional<CrcBytes> calculate(const uint8_t* data, size_t len);

        class Session {
        public:
            Session(Session&& other) noexcept;
            Session& operator=(Session&&) = delete;
            Session(const Session&) = delete;
            Session& operator=(const Session&) = delete;
            ~Session();

            void feed(const uint8_t* data, size_t len);
            CrcBytes finish();

            bool active() const { return _owner != nullptr; }

        private:
            friend class CrcProcessor;
            explicit Session(CrcProcessor* owner) : _owner(owner) {}

            CrcProcessor* _owner;
            uint16_t _crc = kDynamixelInit;   // value after the last feed
        };

        // Empty while another user holds the unit; retry at the next poll.
        std::optional<Session> tryBegin();

        bool busy() const { return _lock.locked(); }

    private:
        void reset();
        uint16_t accumulate(const uint8_t* data, size_t len);

        CRC_HandleTypeDef* _hcrc;
        Runtime::Mutex _lock;
        volatile bool _in_call = false;   // reset/feed/read on the unit in progress
    };

} // namespace Crc
} // namespace Drivers

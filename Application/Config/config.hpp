
#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include <cstddef>
#include <cstdint>

#include "Drivers/Icm20689/Icm20689.h"
#include "Drivers/Usb/UsbSystem.hpp"

namespace nusense {
namespace config {
    /* ================== IMU ================== */

    // Delay before a faulted IMU driver is rebuilt from scratch
    static constexpr uint32_t IMU_RESTART_DELAY_MS = 5000;
    static constexpr uint32_t IMU_STATS_PERIOD_MS  = 1000;

    static constexpr Drivers::Icm20689::ImuConfig IMU_CONFIG = {
        Drivers::Icm20689::AccelRange::_4G,
        Drivers::Icm20689::GyroRange::_500DPS
    };

    /* ================== USB ================== */

    static constexpr size_t   USB_MAX_PACKET_SIZE    = Drivers::Usb::kMaxPacketSize;
    static constexpr uint32_t ECHO_RECONNECT_DELAY_MS = 100;

    /* ================ CRC demo ================ */

    static constexpr uint32_t CRC_DEMO_PERIOD_MS        = 5000;
    static constexpr uint32_t CRC_DEMO_HOLD_MS          = 10;
    static constexpr uint32_t CRC_DEMO_CONTENTION_ROUNDS = 5;
};
};

#endif /* APP_CONFIG_H */

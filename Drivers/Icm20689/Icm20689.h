#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * @brief  Driver types for the TDK InvenSense ICM-20689 6-axis IMU
 * @target STM32H7 (NUSense), SPI + data-ready interrupt + FIFO
 */

namespace Drivers {
namespace Icm20689 {

    // ======================================================================
    // CONFIGURATION ENUMS
    // ======================================================================

    // Values are the FS_SEL field already shifted into place (bits [4:3])
    enum class AccelRange : uint8_t {
        _2G  = 0b00 << 3,
        _4G  = 0b01 << 3,
        _8G  = 0b10 << 3,
        _16G = 0b11 << 3
    };

    enum class GyroRange : uint8_t {
        _250DPS  = 0b00 << 3,
        _500DPS  = 0b01 << 3,
        _1000DPS = 0b10 << 3,
        _2000DPS = 0b11 << 3
    };

    struct ImuConfig {
        AccelRange accel_range = AccelRange::_4G;
        GyroRange  gyro_range  = GyroRange::_500DPS;
    };

    // ======================================================================
    // DATA STRUCTURES
    // ======================================================================

    struct ImuData {
        std::array<float, 3> accel;   // m/s^2
        std::array<float, 3> gyro;    // rad/s
        float temperature;            // degC
    };

    enum class ImuStatus {
        OK = 0,
        ERROR_SPI,
        ERROR_DEVICE_NOT_FOUND,
    };

    const char* statusName(ImuStatus status);

    // ======================================================================
    // REGISTER MAP
    // ======================================================================

    namespace Register {
        static constexpr uint8_t SMPLRT_DIV    = 0x19;
        static constexpr uint8_t CONFIG        = 0x1A;
        static constexpr uint8_t GYRO_CONFIG   = 0x1B;
        static constexpr uint8_t ACCEL_CONFIG  = 0x1C;
        static constexpr uint8_t ACCEL_CONFIG2 = 0x1D;
        static constexpr uint8_t FIFO_EN       = 0x23;
        static constexpr uint8_t INT_PIN_CFG   = 0x37;
        static constexpr uint8_t INT_ENABLE    = 0x38;
        static constexpr uint8_t USER_CTRL     = 0x6A;
        static constexpr uint8_t PWR_MGMT_1    = 0x6B;
        static constexpr uint8_t PWR_MGMT_2    = 0x6C;
        static constexpr uint8_t FIFO_COUNTH   = 0x72;
        static constexpr uint8_t FIFO_COUNTL   = 0x73;
        static constexpr uint8_t FIFO_R_W      = 0x74;
        static constexpr uint8_t WHO_AM_I      = 0x75;
    }

    namespace Bits {
        static constexpr uint8_t PWR_MGMT_1_DEVICE_RESET  = 0b1000'0000;
        static constexpr uint8_t PWR_MGMT_1_SLEEP         = 0b0100'0000;
        static constexpr uint8_t PWR_MGMT_1_CLK_SEL_PLL   = 0b0000'0001;
        static constexpr uint8_t USER_CTRL_FIFO_EN        = 0b0100'0000;
        static constexpr uint8_t USER_CTRL_I2C_IF_DIS     = 0b0001'0000;
        static constexpr uint8_t USER_CTRL_FIFO_RST       = 0b0000'0100;
        static constexpr uint8_t CONFIG_DLPF_CFG          = 0b0000'0001;
        static constexpr uint8_t ACCEL_CONFIG2_DLPF_CFG   = 0b0000'0001;
        static constexpr uint8_t FIFO_EN_TEMP_GYRO_ACCEL  = 0b1111'1000;
        // Active low, push-pull, latched, cleared on any read
        static constexpr uint8_t INT_PIN_CFG_LATCH_ANYRD  = 0b1001'1000;
        static constexpr uint8_t INT_ENABLE_DATA_RDY      = 0b0000'0001;
    }

    static constexpr uint8_t WHO_AM_I_VALUE = 0x98;

    // 3 x accel, temperature, 3 x gyro; int16 big-endian each
    static constexpr size_t kPacketSize = 14;
    static constexpr size_t kMaxPackets = 20;
    static constexpr size_t kFifoBufferSize = kPacketSize * kMaxPackets;

    // ======================================================================
    // SCALING
    // ======================================================================

    float accelLsbPerG(AccelRange range);
    float gyroLsbPerDps(GyroRange range);

    // m/s^2 per LSB and rad/s per LSB
    float accelScale(AccelRange range);
    float gyroScale(GyroRange range);

    float temperatureCelsius(int16_t raw);

    struct Scales {
        float accel;
        float gyro;

        static Scales of(const ImuConfig& config) {
            return { accelScale(config.accel_range), gyroScale(config.gyro_range) };
        }
    };

    // ======================================================================
    // FIFO PARSING
    // ======================================================================

    ImuData parseFifoPacket(const uint8_t* packet, const Scales& scales);

    struct BatchResult {
        size_t packets;
        size_t discarded_bytes;   // trailing partial packet, dropped
    };

    /**
     * @brief Parse the whole packets of a FIFO read.
     *
     * `latest` receives the last complete packet and is left untouched when
     * there is none. Trailing bytes that don't make a full packet are not
     * interpreted.
     */
    BatchResult parseFifoBatch(const uint8_t* data, size_t len, const Scales& scales, ImuData& latest);

} // namespace Icm20689
} // namespace Drivers

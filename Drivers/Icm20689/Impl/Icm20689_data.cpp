#include "Drivers/Icm20689/Icm20689.h"

namespace Drivers {
namespace Icm20689 {

static constexpr float kStandardGravity = 9.80665f;
static constexpr float kPi = 3.14159265358979f;

const char* statusName(ImuStatus status) {
    switch (status) {
        case ImuStatus::OK:                     return "OK";
        case ImuStatus::ERROR_SPI:              return "SPI error";
        case ImuStatus::ERROR_DEVICE_NOT_FOUND: return "device not found";
    }
    return "?";
}

float accelLsbPerG(AccelRange range) {
    switch (range) {
        case AccelRange::_2G:  return 16384.0f;
        case AccelRange::_4G:  return 8192.0f;
        case AccelRange::_8G:  return 4096.0f;
        case AccelRange::_16G: return 2048.0f;
    }
    return 8192.0f;
}

float gyroLsbPerDps(GyroRange range) {
    switch (range) {
        case GyroRange::_250DPS:  return 131.0f;
        case GyroRange::_500DPS:  return 65.5f;
        case GyroRange::_1000DPS: return 32.8f;
        case GyroRange::_2000DPS: return 16.4f;
    }
    return 65.5f;
}

float accelScale(AccelRange range) {
    return kStandardGravity / accelLsbPerG(range);
}

float gyroScale(GyroRange range) {
    return (kPi / 180.0f) / gyroLsbPerDps(range);
}

float temperatureCelsius(int16_t raw) {
    return (float)raw / 333.87f + 21.0f;
}

static inline int16_t be16(const uint8_t* p) {
    return (int16_t)(((uint16_t)p[0] << 8) | p[1]);
}

ImuData parseFifoPacket(const uint8_t* p, const Scales& scales) {
    ImuData d{};
    d.accel[0] = (float)be16(&p[0])  * scales.accel;
    d.accel[1] = (float)be16(&p[2])  * scales.accel;
    d.accel[2] = (float)be16(&p[4])  * scales.accel;
    d.temperature = temperatureCelsius(be16(&p[6]));
    d.gyro[0]  = (float)be16(&p[8])  * scales.gyro;
    d.gyro[1]  = (float)be16(&p[10]) * scales.gyro;
    d.gyro[2]  = (float)be16(&p[12]) * scales.gyro;
    return d;
}

BatchResult parseFifoBatch(const uint8_t* data, size_t len, const Scales& scales, ImuData& latest) {
    const size_t packets = len / kPacketSize;
    for (size_t i = 0; i < packets; ++i) {
        latest = parseFifoPacket(&data[i * kPacketSize], scales);
    }
    return { packets, len - packets * kPacketSize };
}

} // namespace Icm20689
} // namespace Drivers

#include "Drivers/Icm20689/Icm20689.hpp"
#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"

namespace Drivers {
namespace Icm20689 {

static constexpr uint32_t kResetDelayMs     = 100;
static constexpr uint32_t kClockDelayMs     = 10;
static constexpr uint32_t kFifoResetDelayMs = 1;

const char* stateName(DriverState state) {
    switch (state) {
        case DriverState::UNINITIALIZED: return "UNINITIALIZED";
        case DriverState::INITIALIZING:  return "INITIALIZING";
        case DriverState::STREAMING:     return "STREAMING";
        case DriverState::FAULTED:       return "FAULTED";
    }
    return "?";
}

Icm20689_STM32::Icm20689_STM32(const ImuSpi::SpiClaims& spi,
                               const Exti::ExtiClaims& interrupt,
                               const ImuConfig& config,
                               uint32_t stats_period_ms)
    : _spi(spi),
      _interrupt(interrupt),
      _config(config),
      _scales(Scales::of(config)),
      _stats_period_ms(stats_period_ms) {}

bool Icm20689_STM32::getLatest(ImuData& out) const {
    if (!_has_sample) return false;
    out = _latest;
    return true;
}

// ======================================================================
// 1. INITIALIZATION
// ======================================================================

bool Icm20689_STM32::writeSequence(const RegisterWrite* writes, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (_spi.writeRegister(writes[i].reg, writes[i].value) != ImuSpi::SpiStatus::OK) {
            NUSENSE_LOG_ERROR("IMU: write 0x%02X to register 0x%02X failed",
                              writes[i].value, writes[i].reg);
            fault(ImuStatus::ERROR_SPI);
            return false;
        }
    }
    return true;
}

void Icm20689_STM32::fault(ImuStatus status) {
    _last_error = status;
    _state = DriverState::FAULTED;
    NUSENSE_LOG_ERROR("IMU: failed to initialize (%s)", statusName(status));
}

void Icm20689_STM32::stepInit() {
    switch (_init_step) {
        case InitStep::RESET: {
            const RegisterWrite reset[] = {
                { Register::PWR_MGMT_1, Bits::PWR_MGMT_1_DEVICE_RESET },
            };
            if (!writeSequence(reset, 1)) return;

            _wait.start(kResetDelayMs);
            _init_step = InitStep::WAIT_RESET;
            return;
        }

        case InitStep::WAIT_RESET: {
            if (!_wait.expired()) return;

            uint8_t who_am_i = 0;
            if (_spi.readRegister(Register::WHO_AM_I, who_am_i) != ImuSpi::SpiStatus::OK) {
                fault(ImuStatus::ERROR_SPI);
                return;
            }
            if (who_am_i != WHO_AM_I_VALUE) {
                NUSENSE_LOG_ERROR("IMU: wrong chip ID: expected 0x%02X, got 0x%02X",
                                  WHO_AM_I_VALUE, who_am_i);
                fault(ImuStatus::ERROR_DEVICE_NOT_FOUND);
                return;
            }

            const RegisterWrite wake[] = {
                { Register::USER_CTRL,  Bits::USER_CTRL_I2C_IF_DIS },
                { Register::PWR_MGMT_1, Bits::PWR_MGMT_1_CLK_SEL_PLL },
            };
            if (!writeSequence(wake, 2)) return;

            _wait.start(kClockDelayMs);
            _init_step = InitStep::WAIT_CLOCK;
            return;
        }

        case InitStep::WAIT_CLOCK: {
            if (!_wait.expired()) return;

            // 1 kHz output: DLPF on, internal rate 1 kHz, SMPLRT_DIV 0
            const RegisterWrite sensors[] = {
                { Register::PWR_MGMT_2,    0x00 },
                { Register::CONFIG,        Bits::CONFIG_DLPF_CFG },
                { Register::SMPLRT_DIV,    0x00 },
                { Register::ACCEL_CONFIG,  (uint8_t)_config.accel_range },
                { Register::ACCEL_CONFIG2, Bits::ACCEL_CONFIG2_DLPF_CFG },
                { Register::GYRO_CONFIG,   (uint8_t)_config.gyro_range },
                { Register::USER_CTRL,     Bits::USER_CTRL_FIFO_RST | Bits::USER_CTRL_I2C_IF_DIS },
            };
            if (!writeSequence(sensors, sizeof(sensors) / sizeof(sensors[0]))) return;

            _wait.start(kFifoResetDelayMs);
            _init_step = InitStep::WAIT_FIFO_RESET;
            return;
        }

        case InitStep::WAIT_FIFO_RESET: {
            if (!_wait.expired()) return;

            const RegisterWrite fifo[] = {
                { Register::FIFO_EN,     Bits::FIFO_EN_TEMP_GYRO_ACCEL },
                { Register::USER_CTRL,   Bits::USER_CTRL_FIFO_EN | Bits::USER_CTRL_I2C_IF_DIS },
                { Register::INT_PIN_CFG, Bits::INT_PIN_CFG_LATCH_ANYRD },
                { Register::INT_ENABLE,  Bits::INT_ENABLE_DATA_RDY },
            };
            if (!writeSequence(fifo, sizeof(fifo) / sizeof(fifo[0]))) return;

            startStreaming();
            return;
        }
    }
}

// ======================================================================
// 2. STREAMING
// ======================================================================

void Icm20689_STM32::startStreaming() {
    _state = DriverState::STREAMING;
    _stream_step = StreamStep::WAIT_INTERRUPT;
    _interval_samples = 0;
    _last_log_ms = HAL_GetTick();
    _interrupt.clear();

    NUSENSE_LOG_INFO("IMU: ICM-20689 initialized, streaming at 1000 Hz");
}

void Icm20689_STM32::stepStream() {
    switch (_stream_step) {
        case StreamStep::WAIT_INTERRUPT: {
            if (!_interrupt.triggered()) return;

            uint8_t counts[2];
            if (_spi.readRegisterBurst(Register::FIFO_COUNTH, counts, 2) != ImuSpi::SpiStatus::OK) {
                onStreamSpiError("FIFO count read");
                finishCycle();
                return;
            }

            const uint16_t fifo_count = (uint16_t)((counts[0] << 8) | counts[1]);
            _transfer_len = (fifo_count < kFifoBufferSize) ? fifo_count : (uint16_t)kFifoBufferSize;
            if (_transfer_len == 0) {
                _stats.empty_cycles++;
                finishCycle();
                return;
            }

            if (_spi.startReadRegisterBurstDma(Register::FIFO_R_W, _fifo_buffer, _transfer_len)
                    != ImuSpi::SpiStatus::OK) {
                onStreamSpiError("FIFO burst start");
                finishCycle();
                return;
            }
            _stream_step = StreamStep::WAIT_DMA;
            return;
        }

        case StreamStep::WAIT_DMA: {
            switch (_spi.dmaState()) {
                case ImuSpi::DmaState::IN_FLIGHT:
                    return;
                case ImuSpi::DmaState::DONE:
                    _spi.acknowledgeDma();
                    processBatch();
                    break;
                case ImuSpi::DmaState::FAILED:
                    _spi.acknowledgeDma();
                    onStreamSpiError("FIFO burst");
                    break;
                case ImuSpi::DmaState::IDLE:
                    break;
            }
            _stream_step = StreamStep::WAIT_INTERRUPT;
            finishCycle();
            return;
        }
    }
}

void Icm20689_STM32::processBatch() {
    const BatchResult batch = parseFifoBatch(_fifo_buffer, _transfer_len, _scales, _latest);
    if (batch.packets > 0) _has_sample = true;

    _stats.packets += (uint32_t)batch.packets;
    _stats.discarded_bytes += (uint32_t)batch.discarded_bytes;
    _interval_samples += (uint32_t)batch.packets;
}

void Icm20689_STM32::onStreamSpiError(const char* what) {
    _stats.spi_errors++;
    NUSENSE_LOG_WARN("IMU: %s failed, skipping cycle", what);
}

void Icm20689_STM32::finishCycle() {
    const uint32_t now = HAL_GetTick();
    if ((uint32_t)(now - _last_log_ms) < _stats_period_ms) return;

    NUSENSE_LOG_INFO("IMU Stats: %lu samples/sec | Accel (m/s2): [%.3f, %.3f, %.3f]"
                     " | Gyro (rad/s): [%.3f, %.3f, %.3f] | Temp: %.2f C",
                     (unsigned long)_interval_samples,
                     (double)_latest.accel[0], (double)_latest.accel[1], (double)_latest.accel[2],
                     (double)_latest.gyro[0],  (double)_latest.gyro[1],  (double)_latest.gyro[2],
                     (double)_latest.temperature);
    if (_stats.discarded_bytes > 0) {
        NUSENSE_LOG_DEBUG("IMU: %lu partial FIFO bytes dropped so far",
                          (unsigned long)_stats.discarded_bytes);
    }

    _stats.last_rate = _interval_samples;
    _interval_samples = 0;
    _last_log_ms = now;
}

// ======================================================================
// 3. TASK ENTRY POINTS
// ======================================================================

void Icm20689_STM32::tick() {
    switch (_state) {
        case DriverState::UNINITIALIZED:
            NUSENSE_LOG_INFO("IMU: initializing ICM-20689...");
            _state = DriverState::INITIALIZING;
            _init_step = InitStep::RESET;
            stepInit();
            return;
        case DriverState::INITIALIZING:
            stepInit();
            return;
        case DriverState::STREAMING:
            stepStream();
            return;
        case DriverState::FAULTED:
            return;
    }
}

void Icm20689_STM32::restart() {
    if (_spi.dmaState() == ImuSpi::DmaState::IN_FLIGHT) {
        Runtime::fatal("IMU: restart with a FIFO transfer in flight");
    }
    _spi.acknowledgeDma();

    _state = DriverState::UNINITIALIZED;
    _stream_step = StreamStep::WAIT_INTERRUPT;
    _last_error = ImuStatus::OK;
    _wait.cancel();
    _interrupt.clear();
    _stats.restarts++;
}

} // namespace Icm20689
} // namespace Drivers

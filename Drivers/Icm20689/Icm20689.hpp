#pragma once

#include "Drivers/Icm20689/Icm20689.h"
#include "Drivers/Exti/ExtiLine.hpp"
#include "Drivers/ImuSpi/ImuSpi.hpp"
#include "Drivers/Runtime/Deadline.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

namespace Drivers {
namespace Icm20689 {

    // ======================================================================
    // Compile-time tuning knobs
    // ======================================================================
    // The DMA engine can't reach DTCM. The driver object holds the FIFO
    // buffer, so the startup code places the whole object in D2 SRAM.
    // Override with -DICM20689_DMA_SECTION='".foo"' or define
    // ICM20689_DISABLE_SECTION_ATTR to omit the attribute.
    #ifndef ICM20689_DMA_SECTION
    #define ICM20689_DMA_SECTION ".ram_d2"
    #endif

    enum class DriverState : uint8_t {
        UNINITIALIZED = 0,
        INITIALIZING,
        STREAMING,
        FAULTED,
    };

    const char* stateName(DriverState state);

    struct ImuStats {
        uint32_t packets = 0;           // parsed since construction
        uint32_t discarded_bytes = 0;   // trailing partial packets dropped
        uint32_t spi_errors = 0;
        uint32_t restarts = 0;
        uint32_t empty_cycles = 0;      // interrupt with an empty FIFO
        uint32_t last_rate = 0;         // samples in the last stats interval
    };

    // ======================================================================
    // Virtual INTERFACE
    // ======================================================================

    class Icm20689_Interface {
    public:
        virtual ~Icm20689_Interface() = default;

        virtual void tick() = 0;      // Called by the IMU task at each poll
        virtual void restart() = 0;   // Back to UNINITIALIZED

        virtual DriverState state() const = 0;
        virtual ImuStatus lastError() const = 0;

        virtual bool getLatest(ImuData& out) const = 0;
        virtual const ImuStats& stats() const = 0;
    };

    /**
     * @brief ICM-20689 over SPI with data-ready interrupt and FIFO batches.
     *
     * tick() advances one of two state machines:
     *  - initialization: register sequence with timer waits between steps,
     *  - streaming: interrupt -> FIFO count -> DMA burst -> parse -> stats.
     * Initialization failures leave the driver FAULTED; an SPI failure while
     * streaming only skips the current cycle.
     */
    class Icm20689_STM32 : public Icm20689_Interface {
    public:
        Icm20689_STM32(const ImuSpi::SpiClaims& spi,
                       const Exti::ExtiClaims& interrupt,
                       const ImuConfig& config = ImuConfig(),
                       uint32_t stats_period_ms = 1000);
        virtual ~Icm20689_STM32() = default;

        void tick() override;
        void restart() override;

        DriverState state() const override { return _state; }
        ImuStatus lastError() const override { return _last_error; }

        bool getLatest(ImuData& out) const override;
        const ImuStats& stats() const override { return _stats; }

        const ImuConfig& config() const { return _config; }

    private:
        enum class InitStep : uint8_t {
            RESET,
            WAIT_RESET,
            WAIT_CLOCK,
            WAIT_FIFO_RESET,
        };
        enum class StreamStep : uint8_t {
            WAIT_INTERRUPT,
            WAIT_DMA,
        };

        struct RegisterWrite {
            uint8_t reg;
            uint8_t value;
        };

        void stepInit();
        void stepStream();

        bool writeSequence(const RegisterWrite* writes, size_t count);
        void fault(ImuStatus status);

        void startStreaming();
        void processBatch();
        void onStreamSpiError(const char* what);
        void finishCycle();

        ImuSpi::ImuSpi _spi;
        Exti::ExtiLine _interrupt;
        const ImuConfig _config;
        const Scales _scales;
        const uint32_t _stats_period_ms;

        DriverState _state = DriverState::UNINITIALIZED;
        InitStep _init_step = InitStep::RESET;
        StreamStep _stream_step = StreamStep::WAIT_INTERRUPT;
        Runtime::Deadline _wait;
        ImuStatus _last_error = ImuStatus::OK;

        // Latest-sample slot, overwritten every packet
        ImuData _latest{};
        bool _has_sample = false;

        ImuStats _stats;
        uint32_t _interval_samples = 0;
        uint32_t _last_log_ms = 0;

        uint16_t _transfer_len = 0;

        // Padded to whole cache lines for the post-DMA invalidate
        static constexpr size_t kDmaBufferSize = (kFifoBufferSize + 31u) & ~(size_t)31u;
        alignas(32) uint8_t _fifo_buffer[kDmaBufferSize];
    };

} // namespace Icm20689
} // namespace Drivers

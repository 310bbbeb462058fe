
#ifndef APP_IMU_TASK_H
#define APP_IMU_TASK_H

#include "Application/Config/config.hpp"
#include "Drivers/Icm20689/Icm20689.hpp"
#include "Drivers/Runtime/Deadline.hpp"
#include "Drivers/Runtime/Task.hpp"

namespace nusense {
    /**
     * Keeps the IMU driver alive: ticks it on every poll and, once it has
     * faulted, restarts it after a fixed delay. Never gives up.
     */
    class ImuTask : public Drivers::Runtime::Task {
    private:
        Drivers::Icm20689::Icm20689_Interface &imu;
        const uint32_t restartDelayMs;

        Drivers::Runtime::Deadline restartTimer;
        bool waitingRestart = false;
        uint32_t faults = 0;

    public:
        ImuTask (
            Drivers::Icm20689::Icm20689_Interface &imu,
            uint32_t restartDelayMs = config::IMU_RESTART_DELAY_MS);

        const char* name () const override { return "imu"; }
        void poll () override;

        uint32_t faultCount () const { return faults; }
        bool restartPending () const { return waitingRestart; }
    };
};

#endif /* APP_IMU_TASK_H */


#include "Application/Apps/imu_task.hpp"
#include "Drivers/Runtime/Log.hpp"

using namespace nusense;
using Drivers::Icm20689::DriverState;

ImuTask::ImuTask (Drivers::Icm20689::Icm20689_Interface &imu, uint32_t restartDelayMs)
    : imu(imu), restartDelayMs(restartDelayMs) {}

void ImuTask::poll () {
    if (waitingRestart) {
        if (!restartTimer.expired()) return;

        waitingRestart = false;
        imu.restart();
        return;
    }

    imu.tick();

    if (imu.state() == DriverState::FAULTED) {
        faults ++;
        NUSENSE_LOG_ERROR("IMU error: %s, restarting in %lu seconds...",
            Drivers::Icm20689::statusName(imu.lastError()),
            (unsigned long) (restartDelayMs / 1000));

        restartTimer.start(restartDelayMs);
        waitingRestart = true;
    }
}


#include "Application/Main/nusense_main.h"

#include "Application/Apps/crc_demo.hpp"
#include "Application/Apps/echo_app.hpp"
#include "Application/Apps/imu_task.hpp"
#include "Application/Config/config.hpp"
#include "Drivers/Crc/CrcProcessor.hpp"
#include "Drivers/Icm20689/Icm20689.hpp"
#include "Drivers/Runtime/Log.hpp"
#include "Drivers/Runtime/Scheduler.hpp"
#include "Drivers/STM32HAL/stm32hal.h"
#include "Drivers/STM32HAL/stm32usbd.h"
#include "Drivers/Usb/AcmConnection.hpp"
#include "Drivers/Usb/UsbSystem.hpp"

/* Handles generated by CubeMX (main.c, usb_device.c, usbd_desc.c) */
extern SPI_HandleTypeDef hspi4;
extern CRC_HandleTypeDef hcrc;
extern USBD_HandleTypeDef hUsbDeviceHS;
extern USBD_DescriptorsTypeDef HS_Desc;

#ifndef ICM20689_DISABLE_SECTION_ATTR
#define IMU_STORAGE __attribute__((section(ICM20689_DMA_SECTION)))
#else
#define IMU_STORAGE
#endif

using namespace nusense;
using namespace Drivers;

void nusense_main (void) {
    NUSENSE_LOG_INFO("Starting NUSense!");

    /* ============ Hardware ownership ============ */

    // SPI4 on PE11 (CS, PE12-14 SCK/MISO/MOSI), data ready on PE10
    const ImuSpi::SpiClaims imuSpi = { &hspi4, GPIOE, GPIO_PIN_11 };
    const Exti::ExtiClaims imuInterrupt = { GPIOE, GPIO_PIN_10, GPIO_PIN_RESET };
    const Crc::CrcClaims crcUnit = { &hcrc };
    const Usb::UsbClaims usbDevice = { &hUsbDeviceHS, &HS_Desc, DEVICE_HS };

    /* ============ Components, dependency order ============ */

    static Usb::UsbSystem usb(usbDevice);
    static Usb::AcmConnection acm(usb.builder());

    static Crc::CrcProcessor crc(crcUnit);

    // The FIFO buffer inside the driver is a DMA target
    static Icm20689::Icm20689_STM32 imu IMU_STORAGE = Icm20689::Icm20689_STM32(
        imuSpi, imuInterrupt, config::IMU_CONFIG, config::IMU_STATS_PERIOD_MS);

    /* ============ Fixed task set ============ */

    static Usb::UsbTask usbTask(usb);
    static ImuTask imuTask(imu);
    static EchoApp echoApp(acm);
    static CrcDemo crcDemo(crc);

    static Runtime::Scheduler<4> scheduler({ &usbTask, &imuTask, &echoApp, &crcDemo });
    scheduler.run();
}

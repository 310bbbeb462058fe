
#ifndef APP_NUSENSE_MAIN_H
#define APP_NUSENSE_MAIN_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Firmware entry point, called from the CubeMX main() once HAL_Init,
 * SystemClock_Config and the MX_*_Init peripheral calls have run.
 * MX_USB_DEVICE_Init must not be called: the USB system owns the device.
 * Never returns.
 */
void nusense_main (void);

#ifdef __cplusplus
}
#endif

#endif /* APP_NUSENSE_MAIN_H */

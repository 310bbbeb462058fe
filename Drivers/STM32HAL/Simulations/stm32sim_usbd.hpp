
#ifndef STM32_SIM_USBD_H
#define STM32_SIM_USBD_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "Drivers/STM32HAL/Simulations/stm32sim_def.hpp"

/** Subset of the STM32 USB Device middleware (core + CDC class) */

typedef enum {
    USBD_OK = 0U,
    USBD_BUSY,
    USBD_EMEM,
    USBD_FAIL
} USBD_StatusTypeDef;

#define DEVICE_FS                    0U
#define DEVICE_HS                    1U

#define USBD_STATE_DEFAULT           0x01U
#define USBD_STATE_ADDRESSED         0x02U
#define USBD_STATE_CONFIGURED        0x03U
#define USBD_STATE_SUSPENDED         0x04U

#define CDC_SET_LINE_CODING          0x20U
#define CDC_GET_LINE_CODING          0x21U
#define CDC_SET_CONTROL_LINE_STATE   0x22U

#define CDC_DATA_HS_MAX_PACKET_SIZE  512U
#define CDC_DATA_FS_MAX_PACKET_SIZE  64U

typedef struct {
    uint8_t  bmRequest;
    uint8_t  bRequest;
    uint16_t wValue;
    uint16_t wIndex;
    uint16_t wLength;
} USBD_SetupReqTypedef;

typedef struct {
    const char *product;
} USBD_DescriptorsTypeDef;

typedef struct {
    const char *name;
} USBD_ClassTypeDef;

extern USBD_ClassTypeDef USBD_CDC;

typedef struct _USBD_CDC_Itf {
    int8_t (*Init)(void);
    int8_t (*DeInit)(void);
    int8_t (*Control)(uint8_t cmd, uint8_t *pbuf, uint16_t length);
    int8_t (*Receive)(uint8_t *Buf, uint32_t *Len);
    int8_t (*TransmitCplt)(uint8_t *Buf, uint32_t *Len, uint8_t epnum);
} USBD_CDC_ItfTypeDef;

typedef struct _USBD_HandleTypeDef {
    uint8_t id;
    volatile uint8_t dev_state;
    USBD_DescriptorsTypeDef *pDesc;
    USBD_ClassTypeDef *pClass;
    void *pUserData;
} USBD_HandleTypeDef;

USBD_StatusTypeDef USBD_Init(USBD_HandleTypeDef *pdev, USBD_DescriptorsTypeDef *pdesc, uint8_t id);
USBD_StatusTypeDef USBD_RegisterClass(USBD_HandleTypeDef *pdev, USBD_ClassTypeDef *pclass);
USBD_StatusTypeDef USBD_Start(USBD_HandleTypeDef *pdev);

uint8_t USBD_CDC_RegisterInterface(USBD_HandleTypeDef *pdev, USBD_CDC_ItfTypeDef *fops);
uint8_t USBD_CDC_SetTxBuffer(USBD_HandleTypeDef *pdev, uint8_t *pbuff, uint32_t length);
uint8_t USBD_CDC_SetRxBuffer(USBD_HandleTypeDef *pdev, uint8_t *pbuff);
uint8_t USBD_CDC_ReceivePacket(USBD_HandleTypeDef *pdev);
uint8_t USBD_CDC_TransmitPacket(USBD_HandleTypeDef *pdev);

/** Internal Interface playing the USB host */
namespace SIMULATOR_NAMESPACE::usbd {
    bool SIM_IsStarted (USBD_HandleTypeDef *pdev);

    /** Enumerate the device and run the class Init callback */
    void SIM_HostConfigure (USBD_HandleTypeDef *pdev);
    /** Send SET_CONTROL_LINE_STATE with the given DTR level */
    void SIM_HostSetDTR (USBD_HandleTypeDef *pdev, bool dtr);
    /** Cable pulled: back to the default state, class DeInit */
    void SIM_HostDisconnect (USBD_HandleTypeDef *pdev);

    /**
     * Deliver one OUT packet.
     *
     * @return false if the device had no OUT transfer armed
     */
    bool SIM_HostSend (USBD_HandleTypeDef *pdev, const std::vector<uint8_t> &packet);
    /**
     * Collect the IN packet waiting on the endpoint and complete it.
     *
     * @return false if the device had nothing queued
     */
    bool SIM_HostReceive (USBD_HandleTypeDef *pdev, std::vector<uint8_t> &packet);

    void SIM_Reset ();
};

#endif /* STM32_SIM_USBD_H */

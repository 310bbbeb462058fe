#include "Drivers/STM32HAL/Simulations/stm32sim_usbd.hpp"

#include <map>
#include <stdexcept>
#include <string>

USING_SIMULATOR_NAMESPACE;

USBD_ClassTypeDef USBD_CDC = { "CDC" };

namespace SIMULATOR_NAMESPACE::usbd::extdata {
    struct DeviceState {
        bool started = false;
        USBD_CDC_ItfTypeDef *fops = nullptr;

        uint8_t *rxBuffer = nullptr;
        bool rxArmed = false;

        uint8_t *txBuffer = nullptr;
        uint32_t txLength = 0;
        bool txBusy = false;
    };

    std::map<USBD_HandleTypeDef*, DeviceState> devices;
};
using namespace SIMULATOR_NAMESPACE::usbd::extdata;

static DeviceState &stateOf (USBD_HandleTypeDef *pdev) {
    auto it = devices.find(pdev);
    if (it == devices.end()) {
        throw std::runtime_error("USB device used before USBD_Init");
    }
    return (*it).second;
}

USBD_StatusTypeDef USBD_Init(USBD_HandleTypeDef *pdev, USBD_DescriptorsTypeDef *pdesc, uint8_t id) {
    if (pdev == nullptr) return USBD_FAIL;

    pdev->id = id;
    pdev->dev_state = USBD_STATE_DEFAULT;
    pdev->pDesc = pdesc;
    pdev->pClass = nullptr;
    pdev->pUserData = nullptr;

    devices[pdev] = DeviceState();
    return USBD_OK;
}

USBD_StatusTypeDef USBD_RegisterClass(USBD_HandleTypeDef *pdev, USBD_ClassTypeDef *pclass) {
    if (pclass == nullptr) return USBD_FAIL;

    stateOf(pdev);
    pdev->pClass = pclass;
    return USBD_OK;
}

USBD_StatusTypeDef USBD_Start(USBD_HandleTypeDef *pdev) {
    DeviceState &state = stateOf(pdev);
    if (pdev->pClass == nullptr) return USBD_FAIL;

    state.started = true;
    return USBD_OK;
}

uint8_t USBD_CDC_RegisterInterface(USBD_HandleTypeDef *pdev, USBD_CDC_ItfTypeDef *fops) {
    if (fops == nullptr) return USBD_FAIL;

    stateOf(pdev).fops = fops;
    pdev->pUserData = fops;
    return USBD_OK;
}

uint8_t USBD_CDC_SetTxBuffer(USBD_HandleTypeDef *pdev, uint8_t *pbuff, uint32_t length) {
    DeviceState &state = stateOf(pdev);
    state.txBuffer = pbuff;
    state.txLength = length;
    return USBD_OK;
}

uint8_t USBD_CDC_SetRxBuffer(USBD_HandleTypeDef *pdev, uint8_t *pbuff) {
    stateOf(pdev).rxBuffer = pbuff;
    return USBD_OK;
}

uint8_t USBD_CDC_ReceivePacket(USBD_HandleTypeDef *pdev) {
    DeviceState &state = stateOf(pdev);
    if (pdev->dev_state != USBD_STATE_CONFIGURED || state.rxBuffer == nullptr) return USBD_FAIL;

    state.rxArmed = true;
    return USBD_OK;
}

uint8_t USBD_CDC_TransmitPacket(USBD_HandleTypeDef *pdev) {
    DeviceState &state = stateOf(pdev);
    if (pdev->dev_state != USBD_STATE_CONFIGURED) return USBD_FAIL;
    if (state.txBusy) return USBD_BUSY;

    state.txBusy = true;
    return USBD_OK;
}

bool usbd::SIM_IsStarted (USBD_HandleTypeDef *pdev) {
    auto it = devices.find(pdev);
    return it != devices.end() && (*it).second.started;
}

void usbd::SIM_HostConfigure (USBD_HandleTypeDef *pdev) {
    DeviceState &state = stateOf(pdev);
    if (!state.started) {
        throw std::runtime_error("USB host can't configure a device that is not started");
    }

    pdev->dev_state = USBD_STATE_CONFIGURED;
    if (state.fops == nullptr) return ;

    // Same order as the CDC class: interface Init, then the OUT endpoint
    // is prepared with the buffer Init handed over
    if (state.fops->Init() != (int8_t) USBD_OK) return ;
    state.rxArmed = state.rxBuffer != nullptr;
}

void usbd::SIM_HostSetDTR (USBD_HandleTypeDef *pdev, bool dtr) {
    DeviceState &state = stateOf(pdev);
    if (state.fops == nullptr) return ;

    USBD_SetupReqTypedef req = { 0x21, CDC_SET_CONTROL_LINE_STATE, (uint16_t) (dtr ? 0x0001 : 0x0000), 0, 0 };
    state.fops->Control(CDC_SET_CONTROL_LINE_STATE, reinterpret_cast<uint8_t*>(&req), 0);
}

void usbd::SIM_HostDisconnect (USBD_HandleTypeDef *pdev) {
    DeviceState &state = stateOf(pdev);

    pdev->dev_state = USBD_STATE_DEFAULT;
    state.rxArmed = false;
    state.txBusy = false;
    if (state.fops != nullptr) state.fops->DeInit();
}

bool usbd::SIM_HostSend (USBD_HandleTypeDef *pdev, const std::vector<uint8_t> &packet) {
    DeviceState &state = stateOf(pdev);
    if (!state.rxArmed || state.fops == nullptr) return false;
    if (packet.size() > CDC_DATA_HS_MAX_PACKET_SIZE) {
        throw std::runtime_error(
            std::string("USB host packet larger than the endpoint (size=")
          + std::to_string(packet.size())
          + std::string(")"));
    }

    for (size_t i = 0; i < packet.size(); i ++) state.rxBuffer[i] = packet[i];
    state.rxArmed = false;

    uint32_t length = (uint32_t) packet.size();
    state.fops->Receive(state.rxBuffer, &length);
    return true;
}

bool usbd::SIM_HostReceive (USBD_HandleTypeDef *pdev, std::vector<uint8_t> &packet) {
    DeviceState &state = stateOf(pdev);
    if (!state.txBusy) return false;

    packet.assign(state.txBuffer, state.txBuffer + state.txLength);
    state.txBusy = false;

    uint32_t length = state.txLength;
    if (state.fops != nullptr) state.fops->TransmitCplt(state.txBuffer, &length, 0x81);
    return true;
}

void usbd::SIM_Reset () {
    devices.clear();
}

#include "Drivers/STM32HAL/Simulations/stm32sim_crc.hpp"

USING_SIMULATOR_NAMESPACE;

CRC_TypeDef SIM_CRC_Instance = { 0xFFFFFFFFU, 0U, 0U, 0xFFFFFFFFU, 0x04C11DB7U };

namespace SIMULATOR_NAMESPACE::crc::extdata {
    size_t bytesFed = 0;
};
using namespace SIMULATOR_NAMESPACE::crc::extdata;

static uint32_t polynomialWidth (uint32_t cr) {
    switch (cr & CRC_POLYLENGTH_7B) {
        case CRC_POLYLENGTH_16B: return 16;
        case CRC_POLYLENGTH_8B:  return 8;
        case CRC_POLYLENGTH_7B:  return 7;
        default:                 return 32;
    }
}

static uint32_t reflect (uint32_t value, uint32_t width) {
    uint32_t out = 0;
    for (uint32_t i = 0; i < width; i ++) {
        if (value & (1U << i)) out |= 1U << (width - 1 - i);
    }
    return out;
}

/* Shift one byte into the register, most significant bit first */
static void feedByte (CRC_TypeDef *instance, uint8_t byte) {
    const uint32_t width = polynomialWidth(instance->CR);
    const uint32_t mask  = (width == 32) ? 0xFFFFFFFFU : ((1U << width) - 1U);
    const uint32_t top   = 1U << (width - 1);

    if (instance->CR & CRC_INPUTDATA_INVERSION_BYTE) {
        byte = (uint8_t) reflect(byte, 8);
    }

    uint32_t crc = instance->DR & mask;
    for (int bit = 7; bit >= 0; bit --) {
        const bool feedback = ((crc & top) != 0) != (((byte >> bit) & 1U) != 0);
        crc = (crc << 1) & mask;
        if (feedback) crc ^= (instance->POL & mask);
    }

    instance->DR = crc;
    bytesFed ++;
}

static uint32_t readResult (CRC_TypeDef *instance) {
    const uint32_t width = polynomialWidth(instance->CR);
    if (instance->CR & CRC_OUTPUTDATA_INVERSION_ENABLE) {
        return reflect(instance->DR, width);
    }
    return instance->DR;
}

HAL_StatusTypeDef HAL_CRC_Init(CRC_HandleTypeDef *hcrc) {
    if (hcrc == nullptr || hcrc->Instance == nullptr) return HAL_ERROR;

    CRC_TypeDef *instance = hcrc->Instance;
    if (hcrc->Init.DefaultPolynomialUse == DEFAULT_POLYNOMIAL_ENABLE) {
        instance->POL = 0x04C11DB7U;
        instance->CR  = CRC_POLYLENGTH_32B;
    } else {
        instance->POL = hcrc->Init.GeneratingPolynomial;
        instance->CR  = hcrc->Init.CRCLength;
    }
    instance->CR |= hcrc->Init.InputDataInversionMode;
    instance->CR |= hcrc->Init.OutputDataInversionMode;

    if (hcrc->Init.DefaultInitValueUse == DEFAULT_INIT_VALUE_ENABLE) {
        instance->INIT = 0xFFFFFFFFU;
    } else {
        instance->INIT = hcrc->Init.InitValue;
    }
    instance->DR = instance->INIT;

    hcrc->State = HAL_CRC_STATE_READY;
    return HAL_OK;
}

uint32_t HAL_CRC_Accumulate(CRC_HandleTypeDef *hcrc, uint32_t pBuffer[], uint32_t BufferLength) {
    CRC_TypeDef *instance = hcrc->Instance;
    hcrc->State = HAL_CRC_STATE_BUSY;

    switch (hcrc->InputDataFormat) {
        case CRC_INPUTDATA_FORMAT_WORDS:
            for (uint32_t i = 0; i < BufferLength; i ++) {
                for (int shift = 24; shift >= 0; shift -= 8) {
                    feedByte(instance, (uint8_t) (pBuffer[i] >> shift));
                }
            }
            break;
        case CRC_INPUTDATA_FORMAT_HALFWORDS: {
            const uint16_t *halfwords = reinterpret_cast<const uint16_t*>(pBuffer);
            for (uint32_t i = 0; i < BufferLength; i ++) {
                feedByte(instance, (uint8_t) (halfwords[i] >> 8));
                feedByte(instance, (uint8_t) halfwords[i]);
            }
            break;
        }
        default: {
            const uint8_t *bytes = reinterpret_cast<const uint8_t*>(pBuffer);
            for (uint32_t i = 0; i < BufferLength; i ++) {
                feedByte(instance, bytes[i]);
            }
            break;
        }
    }

    hcrc->State = HAL_CRC_STATE_READY;
    return readResult(instance);
}

uint32_t HAL_CRC_Calculate(CRC_HandleTypeDef *hcrc, uint32_t pBuffer[], uint32_t BufferLength) {
    __HAL_CRC_DR_RESET(hcrc);
    return HAL_CRC_Accumulate(hcrc, pBuffer, BufferLength);
}

size_t crc::SIM_BytesFed () {
    return bytesFed;
}

void crc::SIM_Reset () {
    SIM_CRC_Instance = { 0xFFFFFFFFU, 0U, 0U, 0xFFFFFFFFU, 0x04C11DB7U };
    bytesFed = 0;
}


#ifndef STM32_SIM_CRC_H
#define STM32_SIM_CRC_H

#include <cstddef>
#include <cstdint>

#include "Drivers/STM32HAL/Simulations/stm32sim_def.hpp"

/** Register block of the CRC calculation unit */
typedef struct {
    uint32_t DR;
    uint32_t IDR;
    uint32_t CR;
    uint32_t INIT;
    uint32_t POL;
} CRC_TypeDef;

extern CRC_TypeDef SIM_CRC_Instance;
#define CRC (&SIM_CRC_Instance)

#define DEFAULT_POLYNOMIAL_ENABLE        ((uint8_t)0x00U)
#define DEFAULT_POLYNOMIAL_DISABLE       ((uint8_t)0x01U)
#define DEFAULT_INIT_VALUE_ENABLE        ((uint8_t)0x00U)
#define DEFAULT_INIT_VALUE_DISABLE       ((uint8_t)0x01U)

#define CRC_POLYLENGTH_32B               0x00000000U
#define CRC_POLYLENGTH_16B               0x00000008U
#define CRC_POLYLENGTH_8B                0x00000010U
#define CRC_POLYLENGTH_7B                0x00000018U

#define CRC_INPUTDATA_INVERSION_NONE     0x00000000U
#define CRC_INPUTDATA_INVERSION_BYTE     0x00000020U

#define CRC_OUTPUTDATA_INVERSION_DISABLE 0x00000000U
#define CRC_OUTPUTDATA_INVERSION_ENABLE  0x00000080U

#define CRC_INPUTDATA_FORMAT_BYTES       0x00000001U
#define CRC_INPUTDATA_FORMAT_HALFWORDS   0x00000002U
#define CRC_INPUTDATA_FORMAT_WORDS       0x00000003U

typedef struct {
    uint8_t  DefaultPolynomialUse;
    uint8_t  DefaultInitValueUse;
    uint32_t GeneratingPolynomial;
    uint32_t CRCLength;
    uint32_t InitValue;
    uint32_t InputDataInversionMode;
    uint32_t OutputDataInversionMode;
} CRC_InitTypeDef;

typedef enum {
    HAL_CRC_STATE_RESET = 0x00U,
    HAL_CRC_STATE_READY = 0x01U,
    HAL_CRC_STATE_BUSY  = 0x02U,
    HAL_CRC_STATE_ERROR = 0x04U
} HAL_CRC_StateTypeDef;

typedef struct {
    CRC_TypeDef *Instance;
    CRC_InitTypeDef Init;
    HAL_CRC_StateTypeDef State;
    uint32_t InputDataFormat;
} CRC_HandleTypeDef;

/** HAL Functions that are in the simulation */

HAL_StatusTypeDef HAL_CRC_Init(CRC_HandleTypeDef *hcrc);
uint32_t HAL_CRC_Accumulate(CRC_HandleTypeDef *hcrc, uint32_t pBuffer[], uint32_t BufferLength);
uint32_t HAL_CRC_Calculate(CRC_HandleTypeDef *hcrc, uint32_t pBuffer[], uint32_t BufferLength);

#define __HAL_CRC_DR_RESET(__HANDLE__) ((__HANDLE__)->Instance->DR = (__HANDLE__)->Instance->INIT)

/** Internal Interface to setup the CRC simulator */
namespace SIMULATOR_NAMESPACE::crc {
    /** Number of bytes fed to the unit since the last reset of the simulator */
    size_t SIM_BytesFed ();

    void SIM_Reset ();
};

#endif /* STM32_SIM_CRC_H */

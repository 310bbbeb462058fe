#include "Drivers/Crc/CrcProcessor.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"

namespace Drivers {
namespace Crc {

CrcProcessor::CrcProcessor(const CrcClaims& claims) : _hcrc(claims.hcrc) {
    if (_hcrc == nullptr || _hcrc->Instance == nullptr) Runtime::fatal("CRC: no unit in claim");
    Runtime::claimResource(_hcrc->Instance, 0, "CRC unit");

    _hcrc->Init.DefaultPolynomialUse    = DEFAULT_POLYNOMIAL_DISABLE;
    _hcrc->Init.DefaultInitValueUse     = DEFAULT_INIT_VALUE_DISABLE;
    _hcrc->Init.GeneratingPolynomial    = kDynamixelPolynomial;
    _hcrc->Init.CRCLength               = CRC_POLYLENGTH_16B;
    _hcrc->Init.InitValue               = kDynamixelInit;
    _hcrc->Init.InputDataInversionMode  = CRC_INPUTDATA_INVERSION_NONE;
    _hcrc->Init.OutputDataInversionMode = CRC_OUTPUTDATA_INVERSION_DISABLE;
    _hcrc->InputDataFormat              = CRC_INPUTDATA_FORMAT_BYTES;

    if (HAL_CRC_Init(_hcrc) != HAL_OK) {
        NUSENSE_LOG_ERROR("CRC: HAL_CRC_Init failed");
        Runtime::fatal("CRC unit init failed");
    }
}

void CrcProcessor::reset() {
    __HAL_CRC_DR_RESET(_hcrc);
}

uint16_t CrcProcessor::accumulate(const uint8_t* data, size_t len) {
    // Only an interrupt handler can land here while another call is running
    if (_in_call) Runtime::fatal("CRC: unit re-entered from an interrupt");
    _in_call = true;

    // Byte input format: the HAL reads the buffer byte by byte
    uint32_t* words = reinterpret_cast<uint32_t*>(const_cast<uint8_t*>(data));
    const uint16_t crc = (uint16_t)HAL_CRC_Accumulate(_hcrc, words, (uint32_t)len);

    _in_call = false;
    return crc;
}

std::optional<CrcBytes> CrcProcessor::calculate(const uint8_t* data, size_t len) {
    if (_in_call) Runtime::fatal("CRC: unit re-entered from an interrupt");
    if (!_lock.tryLock()) return std::nullopt;

    reset();
    const uint16_t crc = accumulate(data, len);

    _lock.unlock();
    return toLittleEndian(crc);
}

std::optional<CrcProcessor::Session> CrcProcessor::tryBegin() {
    if (!_lock.tryLock()) return std::nullopt;

    reset();
    return Session(this);
}

// ----------------------------------------------------------------------

CrcProcessor::Session::Session(Session&& other) noexcept
    : _owner(other._owner), _crc(other._crc) {
    other._owner = nullptr;
}

CrcProcessor::Session::~Session() {
    if (_owner != nullptr) _owner->_lock.unlock();
}

void CrcProcessor::Session::feed(const uint8_t* data, size_t len) {
    if (_owner == nullptr) Runtime::fatal("CRC: feed on a finished session");
    _crc = _owner->accumulate(data, len);
}

CrcBytes CrcProcessor::Session::finish() {
    if (_owner == nullptr) Runtime::fatal("CRC: session finished twice");

    _owner->_lock.unlock();
    _owner = nullptr;
    return toLittleEndian(_crc);
}

} // namespace Crc
} // namespace Drivers

#include "Drivers/Exti/ExtiLine.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/Runtime/CriticalSection.hpp"
#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"

namespace Drivers {
namespace Exti {

ExtiLine* ExtiLine::s_owners[kLineCount] = {};

int ExtiLine::lineOf(uint16_t GPIO_Pin) {
    if (GPIO_Pin == 0u || (GPIO_Pin & (GPIO_Pin - 1u)) != 0u) return -1;

    int line = 0;
    while ((GPIO_Pin >> line) != 1u) line++;
    return line;
}

ExtiLine::ExtiLine(const ExtiClaims& claims) : _hw(claims), _line(0) {
    const int line = lineOf(claims.pin);
    if (line < 0) Runtime::fatal("EXTI: pin mask must select exactly one pin");
    _line = (uint8_t)line;

    if (s_owners[_line] != nullptr) {
        NUSENSE_LOG_ERROR("EXTI: line %u already has an owner", (unsigned)_line);
        Runtime::fatal("EXTI line claimed twice");
    }
    Runtime::claimResource(claims.port, claims.pin, "EXTI pin");

    s_owners[_line] = this;
}

ExtiLine::~ExtiLine() {
    if (s_owners[_line] == this) s_owners[_line] = nullptr;
}

void ExtiLine::onInterrupt() {
    _pending = true;
    _interrupt_count++;
}

bool ExtiLine::levelAsserted() const {
    return HAL_GPIO_ReadPin(_hw.port, _hw.pin) == _hw.active_state;
}

bool ExtiLine::triggered() {
    bool latched;
    {
        Runtime::CriticalSection cs;
        latched = _pending;
        _pending = false;
    }
    return latched || levelAsserted();
}

void ExtiLine::clear() {
    Runtime::CriticalSection cs;
    _pending = false;
}

void ExtiLine::dispatch(uint16_t GPIO_Pin) {
    const int line = lineOf(GPIO_Pin);
    if (line < 0) return;

    ExtiLine* owner = s_owners[line];
    if (owner != nullptr) owner->onInterrupt();
}

} // namespace Exti
} // namespace Drivers

void HAL_GPIO_EXTI_Callback(uint16_t GPIO_Pin) {
    Drivers::Exti::ExtiLine::dispatch(GPIO_Pin);
}

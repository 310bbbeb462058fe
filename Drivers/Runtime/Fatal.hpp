#pragma once

namespace Drivers {
namespace Runtime {

    /**
     * @brief Stop the system on a structural fault (double claim, buffer
     * overflow, builder reuse, lock re-entry).
     *
     * On the board: logs the message and enters Error_Handler() with
     * interrupts disabled. On the host: throws std::runtime_error carrying
     * the message, so tests can observe the fault.
     */
    [[noreturn]] void fatal(const char* message);

} // namespace Runtime
} // namespace Drivers

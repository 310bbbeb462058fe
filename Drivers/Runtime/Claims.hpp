#pragma once

#include <cstddef>
#include <cstdint>

namespace Drivers {
namespace Runtime {

    static constexpr size_t kMaxClaims = 16;

    /**
     * @brief Record exclusive ownership of a physical resource.
     *
     * A resource is identified by its peripheral address plus a detail word
     * (pin mask, line number, 0 when the peripheral is the whole resource).
     * Claiming it a second time, or overflowing the table, is fatal.
     */
    void claimResource(const void* peripheral, uint32_t detail, const char* what);

    bool isClaimed(const void* peripheral, uint32_t detail);
    size_t claimCount();

#ifdef UNIT_TEST_ENV
    // Ownership lasts for the program lifetime on the board; tests start clean.
    void resetClaims();
#endif

} // namespace Runtime
} // namespace Drivers

#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"

namespace Drivers {
namespace Runtime {

struct ClaimEntry {
    const void* peripheral;
    uint32_t detail;
};

static ClaimEntry s_claims[kMaxClaims];
static size_t s_count = 0;

bool isClaimed(const void* peripheral, uint32_t detail) {
    for (size_t i = 0; i < s_count; ++i) {
        if (s_claims[i].peripheral == peripheral && s_claims[i].detail == detail) return true;
    }
    return false;
}

void claimResource(const void* peripheral, uint32_t detail, const char* what) {
    if (isClaimed(peripheral, detail)) {
        NUSENSE_LOG_ERROR("claim: %s is already owned", what);
        fatal("resource claimed twice");
    }
    if (s_count == kMaxClaims) {
        fatal("claim table full");
    }

    s_claims[s_count++] = { peripheral, detail };
    NUSENSE_LOG_DEBUG("claim: %s", what);
}

size_t claimCount() { return s_count; }

#ifdef UNIT_TEST_ENV
void resetClaims() { s_count = 0; }
#endif

} // namespace Runtime
} // namespace Drivers

#pragma once

#include "Drivers/Runtime/CriticalSection.hpp"

namespace Drivers {
namespace Runtime {

    /**
     * @brief Cooperative lock.
     *
     * Never blocks: a task that fails tryLock() returns from poll() and
     * retries later. Safe against interrupt re-entry on a single core.
     */
    class Mutex {
    public:
        Mutex() = default;
        Mutex(const Mutex&) = delete;
        Mutex& operator=(const Mutex&) = delete;

        bool tryLock() {
            CriticalSection cs;
            if (_locked) return false;
            _locked = true;
            return true;
        }

        void unlock() { _locked = false; }

        bool locked() const { return _locked; }

    private:
        volatile bool _locked = false;
    };

} // namespace Runtime
} // namespace Drivers

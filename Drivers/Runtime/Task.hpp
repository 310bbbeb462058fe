#pragma once

namespace Drivers {
namespace Runtime {

    /**
     * @brief A run-forever cooperative task.
     *
     * poll() runs until the task's next await point (interrupt, timer,
     * transfer completion, lock) and returns with its state recorded.
     * Code inside one poll() is atomic with respect to the other tasks.
     */
    class Task {
    public:
        virtual ~Task() = default;

        virtual const char* name() const = 0;
        virtual void poll() = 0;
    };

} // namespace Runtime
} // namespace Drivers

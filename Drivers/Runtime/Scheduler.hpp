#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"
#include "Drivers/Runtime/Task.hpp"

namespace Drivers {
namespace Runtime {

    /**
     * @brief Cooperative executor for a task set fixed at compile time.
     *
     * Every cycle polls each task once, in registration order. Tasks must
     * not rely on that order.
     */
    template <size_t N>
    class Scheduler {
        static_assert(N > 0, "Scheduler needs at least one task");

    public:
        explicit Scheduler(const std::array<Task*, N>& tasks) : _tasks(tasks) {
            for (size_t i = 0; i < N; ++i) {
                if (_tasks[i] == nullptr) fatal("scheduler: null task");
                for (size_t j = 0; j < i; ++j) {
                    if (_tasks[j] == _tasks[i]) fatal("scheduler: task registered twice");
                }
            }
        }

        Scheduler(const Scheduler&) = delete;
        Scheduler& operator=(const Scheduler&) = delete;

        void runOnce() {
            // A task polling the scheduler would re-enter every other task.
            if (_in_cycle) fatal("scheduler: runOnce re-entered from a task");

            _in_cycle = true;
            for (Task* task : _tasks) {
                task->poll();
            }
            _in_cycle = false;
            _cycles++;
        }

        [[noreturn]] void run() {
            NUSENSE_LOG_INFO("scheduler: running %u tasks", (unsigned)N);
            for (Task* task : _tasks) {
                NUSENSE_LOG_INFO("scheduler:  - %s", task->name());
            }
            while (true) {
                runOnce();
            }
        }

        uint32_t cycles() const { return _cycles; }
        static constexpr size_t size() { return N; }

    private:
        std::array<Task*, N> _tasks;
        uint32_t _cycles = 0;
        bool _in_cycle = false;
    };

} // namespace Runtime
} // namespace Drivers

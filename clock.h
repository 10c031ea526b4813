#ifndef CHIP8VM_CLOCK_H
#define CHIP8VM_CLOCK_H

#include <chrono>
#include <cstdint>

#include "chip8.h"

// Event number k of a schedule running at hz is due at exactly k/hz
// seconds, so no rounding error accumulates however long it runs.
struct PeriodicSchedule
{
    uint32_t hz;
    uint64_t count = 0;

    explicit PeriodicSchedule(uint32_t hz) :
        hz(hz)
    {
    }

    std::chrono::nanoseconds dueAt(uint64_t k) const
    {
        if(hz == 0) {
            return std::chrono::nanoseconds::max();
        }
        return std::chrono::seconds(k / hz) + std::chrono::nanoseconds((k % hz) * 1000000000ull / hz);
    }

    std::chrono::nanoseconds nextDue() const
    {
        return dueAt(count + 1);
    }
};

// Runs instruction steps and 60Hz timer ticks as two independent schedules
// against one virtual time, fed by the host from its own clock.
struct ClockDriver
{
    std::chrono::nanoseconds now{0};
    PeriodicSchedule cpu;
    PeriodicSchedule timer;

    explicit ClockDriver(uint32_t instructionsPerSecond) :
        cpu(instructionsPerSecond),
        timer(TIMER_HZ)
    {
    }

    // Runs every step and tick due within the next `elapsed`, in time order,
    // ticks first on a tie.  Stops early once the interpreter halts.
    template <class INTERPRETER, class MEMORY, class INTERFACE>
    typename INTERPRETER::StepResult advance(std::chrono::nanoseconds elapsed, INTERPRETER& chip8, MEMORY& memory, INTERFACE& interface)
    {
        typename INTERPRETER::StepResult result = INTERPRETER::CONTINUE;

        if(chip8.halted()) {
            return chip8.step(memory, interface);
        }

        now += elapsed;

        while(true) {
            std::chrono::nanoseconds nextStep = cpu.nextDue();
            std::chrono::nanoseconds nextTick = timer.nextDue();

            if((nextTick <= now) && (nextTick <= nextStep)) {
                chip8.tick();
                timer.count++;
            } else if(nextStep <= now) {
                result = chip8.step(memory, interface);
                cpu.count++;
                if(chip8.halted()) {
                    break;
                }
            } else {
                break;
            }
        }

        return result;
    }
};

#endif // CHIP8VM_CLOCK_H

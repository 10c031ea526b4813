#ifndef CHIP8VM_TIMERS_H
#define CHIP8VM_TIMERS_H

#include <cstdint>

// Delay (DT) and sound (ST) timers.  tick() is called at TIMER_HZ; both
// count down to zero and stay there.  ST makes no sound.
struct TimerUnit
{
    uint8_t DT = 0;
    uint8_t ST = 0;

    void tick()
    {
        if(DT > 0) {
            DT--;
        }
        if(ST > 0) {
            ST--;
        }
    }
};

#endif // CHIP8VM_TIMERS_H

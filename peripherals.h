#ifndef CHIP8VM_PERIPHERALS_H
#define CHIP8VM_PERIPHERALS_H

#include <cstdint>

#include "display.h"
#include "keypad.h"

// The display and keypad as seen by Chip8Interpreter.  Hosts derive from
// this to add a window or a terminal; the interpreter only needs pressed(),
// draw() and clear().
struct Peripherals
{
    DisplayBuffer screen;
    Keypad keypad;

    bool pressed(uint8_t key) const
    {
        return keypad.pressed(key);
    }

    bool draw(uint8_t x, uint8_t y)
    {
        return screen.draw(x, y);
    }

    void clear()
    {
        screen.clear();
    }
};

#endif // CHIP8VM_PERIPHERALS_H

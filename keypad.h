#ifndef CHIP8VM_KEYPAD_H
#define CHIP8VM_KEYPAD_H

#include <array>
#include <cstdint>

#include "chip8.h"

// Hex keypad latch.  Written by the host between steps, read by the
// interpreter.
struct Keypad
{
    std::array<bool, KEY_COUNT> keyPressed;

    Keypad()
    {
        keyPressed.fill(false);
    }

    bool pressed(uint8_t key) const
    {
        return keyPressed[key & 0xF];
    }

    void set(uint8_t key, bool isPressed)
    {
        keyPressed[key & 0xF] = isPressed;
    }
};

#endif // CHIP8VM_KEYPAD_H

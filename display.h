#ifndef CHIP8VM_DISPLAY_H
#define CHIP8VM_DISPLAY_H

#include <array>
#include <cstdint>

#include "chip8.h"

struct DisplayBuffer
{
    std::array<std::array<bool, SCREEN_WIDTH>, SCREEN_HEIGHT> display;
    bool displayChanged = true;

    DisplayBuffer()
    {
        clear();
    }

    bool at(int x, int y) const
    {
        return display.at(y).at(x);
    }

    // XOR one pixel, returns true if a lit pixel was erased.
    bool draw(uint8_t x, uint8_t y);

    void clear();

    int litPixelCount() const;
};

#endif // CHIP8VM_DISPLAY_H

#ifndef CHIP8VM_MEMORY_H
#define CHIP8VM_MEMORY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "chip8.h"

// 4K address space.  The hex digit font sits at FONT_BASE, the rest of the
// interpreter area up to PROGRAM_BASE is filled with FFFF (HALT) words.
struct Memory
{
    std::array<uint8_t, MEMORY_SIZE> memory;

    std::array<uint16_t, 16> digitAddresses = {0};

    Memory();

    static bool valid(uint32_t addr)
    {
        return addr < MEMORY_SIZE;
    }

    // True if every byte of [addr, addr + count) is addressable.
    static bool validRange(uint32_t addr, uint32_t count)
    {
        return (count == 0) || valid(addr + count - 1);
    }

    uint8_t read(uint16_t addr) const
    {
        return memory.at(addr);
    }

    void write(uint16_t addr, uint8_t v)
    {
        memory.at(addr) = v;
    }

    uint16_t getDigitLocation(uint8_t digit) const
    {
        return digitAddresses[digit & 0xF];
    }

    Fault loadImage(const uint8_t *image, size_t size);
    Fault loadImage(const std::vector<uint8_t>& image);
};

extern const std::vector<uint8_t> digitSprites;

#endif // CHIP8VM_MEMORY_H

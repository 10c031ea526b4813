#include <cstdio>
#include <cstring>

#include "memory.h"

const std::vector<uint8_t> digitSprites = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

Memory::Memory()
{
    memory.fill(0);
    for(uint16_t i = 0; i < digitSprites.size(); i++) {
        uint16_t address = FONT_BASE + i;
        write(address, digitSprites[i]);
        if(i % FONT_GLYPH_BYTES == 0) {
            digitAddresses[i / FONT_GLYPH_BYTES] = address;
        }
    }
    // Anything that wanders into the interpreter area executes FFFF and halts.
    for(uint16_t address = FONT_BASE + (uint16_t)digitSprites.size(); address < PROGRAM_BASE; address++) {
        write(address, 0xFF);
    }
}

Fault Memory::loadImage(const uint8_t *image, size_t size)
{
    if(size > MAX_IMAGE_SIZE) {
        fprintf(stderr, "program image is %zu bytes, at most %u fit above %03X\n", size, MAX_IMAGE_SIZE, PROGRAM_BASE);
        return FAULT_IMAGE_TOO_LARGE;
    }
    if(size > 0) {
        std::memcpy(memory.data() + PROGRAM_BASE, image, size);
    }
    return FAULT_NONE;
}

Fault Memory::loadImage(const std::vector<uint8_t>& image)
{
    return loadImage(image.data(), image.size());
}

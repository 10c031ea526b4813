#ifndef CHIP8VM_CHIP8_H
#define CHIP8VM_CHIP8_H

#include <cstdint>

constexpr uint32_t MEMORY_SIZE = 4096;
constexpr uint16_t ADDRESS_MASK = 0x0FFF;
constexpr uint16_t FONT_BASE = 0x000;
constexpr uint16_t FONT_GLYPH_BYTES = 5;
constexpr uint16_t PROGRAM_BASE = 0x200;
constexpr uint32_t MAX_IMAGE_SIZE = MEMORY_SIZE - PROGRAM_BASE;

constexpr int REGISTER_COUNT = 16;
constexpr int STACK_DEPTH = 16;
constexpr int KEY_COUNT = 16;

constexpr int SCREEN_WIDTH = 64;
constexpr int SCREEN_HEIGHT = 32;

constexpr uint32_t TIMER_HZ = 60;
constexpr uint32_t DEFAULT_INSTRUCTIONS_PER_SECOND = 7 * TIMER_HZ;

constexpr uint32_t QUIRKS_NONE = 0x00;
constexpr uint32_t QUIRKS_SHIFT = 0x01;           /* shift VX instead of VY */
constexpr uint32_t QUIRKS_LOAD_STORE = 0x02;      /* don't add X + 1 to I */
constexpr uint32_t QUIRKS_JUMP = 0x04;            /* VX is used as offset *and* X used as address high nybble */
constexpr uint32_t QUIRKS_CLIP = 0x08;            /* no draw or collide wrapped */
constexpr uint32_t QUIRKS_VFORDER = 0x10;         /* VF is set first in ADD, SUB, SH ALU operations */
constexpr uint32_t QUIRKS_LOGIC = 0x20;           /* VF is cleared after logic ALU operations */

enum Fault
{
    FAULT_NONE,
    FAULT_INVALID_OPCODE,
    FAULT_STACK_OVERFLOW,
    FAULT_STACK_UNDERFLOW,
    FAULT_ADDRESS_OUT_OF_RANGE,
    FAULT_IMAGE_TOO_LARGE,
};

const char *faultName(Fault fault);

#endif // CHIP8VM_CHIP8_H

#ifndef CHIP8VM_INSTRUCTION_H
#define CHIP8VM_INSTRUCTION_H

#include <cstdint>
#include <string>

enum Operation
{
    OP_INVALID,
    OP_SYS,         // 0nnn
    OP_CLS,         // 00E0
    OP_RET,         // 00EE
    OP_JP,          // 1nnn
    OP_CALL,        // 2nnn
    OP_SE_IMM,      // 3xkk
    OP_SNE_IMM,     // 4xkk
    OP_SE_REG,      // 5xy0
    OP_LD_IMM,      // 6xkk
    OP_ADD_IMM,     // 7xkk
    OP_LD_REG,      // 8xy0
    OP_OR,          // 8xy1
    OP_AND,         // 8xy2
    OP_XOR,         // 8xy3
    OP_ADD_REG,     // 8xy4
    OP_SUB,         // 8xy5
    OP_SHR,         // 8xy6
    OP_SUBN,        // 8xy7
    OP_SHL,         // 8xyE
    OP_SNE_REG,     // 9xy0
    OP_LD_I,        // Annn
    OP_JP_V0,       // Bnnn
    OP_RND,         // Cxkk
    OP_DRW,         // Dxyn
    OP_SKP,         // Ex9E
    OP_SKNP,        // ExA1
    OP_GET_DELAY,   // Fx07
    OP_KEYWAIT,     // Fx0A
    OP_SET_DELAY,   // Fx15
    OP_SET_SOUND,   // Fx18
    OP_ADD_INDEX,   // Fx1E
    OP_LD_DIGIT,    // Fx29
    OP_LD_BCD,      // Fx33
    OP_LD_IVX,      // Fx55
    OP_LD_VXI,      // Fx65
    OP_HALT,        // FxFF
};

// One decoded instruction word.  Operand fields are always extracted; which
// of them mean anything depends on op.
struct Instruction
{
    Operation op = OP_INVALID;
    uint16_t word = 0;
    uint8_t x = 0;
    uint8_t y = 0;
    uint8_t n = 0;
    uint8_t kk = 0;
    uint16_t nnn = 0;
};

Instruction decode(uint16_t instructionWord);

std::string disassemble(const Instruction& insn);

#endif // CHIP8VM_INSTRUCTION_H

#ifndef CHIP8VM_DEBUG_H
#define CHIP8VM_DEBUG_H

#include <string>
#include <unordered_map>

constexpr int DEBUG_STATE = 0x01;
constexpr int DEBUG_ASM = 0x02;
constexpr int DEBUG_DRAW = 0x04;
constexpr int DEBUG_FAIL_UNSUPPORTED_INSN = 0x08;
constexpr int DEBUG_KEYS = 0x10;

extern std::unordered_map<std::string, int> keywordsToDebugFlags;
extern int debug;

#endif // CHIP8VM_DEBUG_H

#include "chip8.h"
#include "debug.h"

std::unordered_map<std::string, int> keywordsToDebugFlags = {
    {"state", DEBUG_STATE},
    {"asm", DEBUG_ASM},
    {"draw", DEBUG_DRAW},
    {"insn", DEBUG_FAIL_UNSUPPORTED_INSN},
    {"keys", DEBUG_KEYS},
};
int debug = 0;

const char *faultName(Fault fault)
{
    switch(fault) {
        case FAULT_NONE: return "none";
        case FAULT_INVALID_OPCODE: return "invalid opcode";
        case FAULT_STACK_OVERFLOW: return "stack overflow";
        case FAULT_STACK_UNDERFLOW: return "stack underflow";
        case FAULT_ADDRESS_OUT_OF_RANGE: return "address out of range";
        case FAULT_IMAGE_TOO_LARGE: return "image too large";
    }
    return "unknown fault";
}

#include "instruction.h"

namespace {

enum InstructionHighNybble
{
    INSN_SYS = 0x0,
    INSN_JP = 0x1,
    INSN_CALL = 0x2,
    INSN_SE_IMM = 0x3,
    INSN_SNE_IMM = 0x4,
    INSN_SE_REG = 0x5,
    INSN_LD_IMM = 0x6,
    INSN_ADD_IMM = 0x7,
    INSN_ALU = 0x8,
    INSN_SNE_REG = 0x9,
    INSN_LD_I = 0xA,
    INSN_JP_V0 = 0xB,
    INSN_RND = 0xC,
    INSN_DRW = 0xD,
    INSN_SKP = 0xE,
    INSN_LD_SPECIAL = 0xF,
};

enum SYSOpcode
{
    SYS_CLS = 0x0E0,
    SYS_RET = 0x0EE,
};

enum ALUOpcode
{
    ALU_LD = 0x0,
    ALU_OR = 0x1,
    ALU_AND = 0x2,
    ALU_XOR = 0x3,
    ALU_ADD = 0x4,
    ALU_SUB = 0x5,
    ALU_SHR = 0x6,
    ALU_SUBN = 0x7,
    ALU_SHL = 0xE,
};

enum SKPOpcode
{
    SKP_KEY = 0x9E,
    SKNP_KEY = 0xA1,
};

enum SPECIALOpcode
{
    SPECIAL_GET_DELAY = 0x07,
    SPECIAL_KEYWAIT = 0x0A,
    SPECIAL_SET_DELAY = 0x15,
    SPECIAL_SET_SOUND = 0x18,
    SPECIAL_ADD_INDEX = 0x1E,
    SPECIAL_LD_DIGIT = 0x29,
    SPECIAL_LD_BCD = 0x33,
    SPECIAL_LD_IVX = 0x55,
    SPECIAL_LD_VXI = 0x65,
    SPECIAL_HALT = 0xFF,
};

Operation decodeSys(uint16_t sysOpcode)
{
    switch(sysOpcode) {
        case SYS_CLS: return OP_CLS;
        case SYS_RET: return OP_RET;
        default: return OP_SYS;
    }
}

Operation decodeALU(uint8_t opcode)
{
    switch(opcode) {
        case ALU_LD: return OP_LD_REG;
        case ALU_OR: return OP_OR;
        case ALU_AND: return OP_AND;
        case ALU_XOR: return OP_XOR;
        case ALU_ADD: return OP_ADD_REG;
        case ALU_SUB: return OP_SUB;
        case ALU_SHR: return OP_SHR;
        case ALU_SUBN: return OP_SUBN;
        case ALU_SHL: return OP_SHL;
        default: return OP_INVALID;
    }
}

Operation decodeSkip(uint8_t opcode)
{
    switch(opcode) {
        case SKP_KEY: return OP_SKP;
        case SKNP_KEY: return OP_SKNP;
        default: return OP_INVALID;
    }
}

Operation decodeSpecial(uint8_t opcode)
{
    switch(opcode) {
        case SPECIAL_GET_DELAY: return OP_GET_DELAY;
        case SPECIAL_KEYWAIT: return OP_KEYWAIT;
        case SPECIAL_SET_DELAY: return OP_SET_DELAY;
        case SPECIAL_SET_SOUND: return OP_SET_SOUND;
        case SPECIAL_ADD_INDEX: return OP_ADD_INDEX;
        case SPECIAL_LD_DIGIT: return OP_LD_DIGIT;
        case SPECIAL_LD_BCD: return OP_LD_BCD;
        case SPECIAL_LD_IVX: return OP_LD_IVX;
        case SPECIAL_LD_VXI: return OP_LD_VXI;
        case SPECIAL_HALT: return OP_HALT;
        default: return OP_INVALID;
    }
}

}

Instruction decode(uint16_t instructionWord)
{
    Instruction insn;
    insn.word = instructionWord;
    insn.x = (instructionWord & 0x0F00) >> 8;
    insn.y = (instructionWord & 0x00F0) >> 4;
    insn.n = instructionWord & 0x000F;
    insn.kk = instructionWord & 0x00FF;
    insn.nnn = instructionWord & 0x0FFF;

    switch(instructionWord >> 12) {
        case INSN_SYS: insn.op = decodeSys(insn.nnn); break;
        case INSN_JP: insn.op = OP_JP; break;
        case INSN_CALL: insn.op = OP_CALL; break;
        case INSN_SE_IMM: insn.op = OP_SE_IMM; break;
        case INSN_SNE_IMM: insn.op = OP_SNE_IMM; break;
        case INSN_SE_REG: insn.op = (insn.n == 0) ? OP_SE_REG : OP_INVALID; break;
        case INSN_LD_IMM: insn.op = OP_LD_IMM; break;
        case INSN_ADD_IMM: insn.op = OP_ADD_IMM; break;
        case INSN_ALU: insn.op = decodeALU(insn.n); break;
        case INSN_SNE_REG: insn.op = (insn.n == 0) ? OP_SNE_REG : OP_INVALID; break;
        case INSN_LD_I: insn.op = OP_LD_I; break;
        case INSN_JP_V0: insn.op = OP_JP_V0; break;
        case INSN_RND: insn.op = OP_RND; break;
        case INSN_DRW: insn.op = OP_DRW; break;
        case INSN_SKP: insn.op = decodeSkip(insn.kk); break;
        case INSN_LD_SPECIAL: insn.op = decodeSpecial(insn.kk); break;
    }

    return insn;
}

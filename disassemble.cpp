#include <cstdio>

#include "instruction.h"

std::string disassemble(const Instruction& insn)
{
    char text[32] = "???";

    switch(insn.op) {
        case OP_SYS: snprintf(text, sizeof(text), "SYS %X", insn.nnn); break;
        case OP_CLS: snprintf(text, sizeof(text), "CLS"); break;
        case OP_RET: snprintf(text, sizeof(text), "RET"); break;
        case OP_JP: snprintf(text, sizeof(text), "JP %X", insn.nnn); break;
        case OP_CALL: snprintf(text, sizeof(text), "CALL %X", insn.nnn); break;
        case OP_SE_IMM: snprintf(text, sizeof(text), "SE V%X, %X", insn.x, insn.kk); break;
        case OP_SNE_IMM: snprintf(text, sizeof(text), "SNE V%X, %X", insn.x, insn.kk); break;
        case OP_SE_REG: snprintf(text, sizeof(text), "SE V%X, V%X", insn.x, insn.y); break;
        case OP_LD_IMM: snprintf(text, sizeof(text), "LD V%X, %X", insn.x, insn.kk); break;
        case OP_ADD_IMM: snprintf(text, sizeof(text), "ADD V%X, %X", insn.x, insn.kk); break;
        case OP_LD_REG: snprintf(text, sizeof(text), "LD V%X, V%X", insn.x, insn.y); break;
        case OP_OR: snprintf(text, sizeof(text), "OR V%X, V%X", insn.x, insn.y); break;
        case OP_AND: snprintf(text, sizeof(text), "AND V%X, V%X", insn.x, insn.y); break;
        case OP_XOR: snprintf(text, sizeof(text), "XOR V%X, V%X", insn.x, insn.y); break;
        case OP_ADD_REG: snprintf(text, sizeof(text), "ADD V%X, V%X", insn.x, insn.y); break;
        case OP_SUB: snprintf(text, sizeof(text), "SUB V%X, V%X", insn.x, insn.y); break;
        case OP_SHR: snprintf(text, sizeof(text), "SHR V%X, V%X", insn.x, insn.y); break;
        case OP_SUBN: snprintf(text, sizeof(text), "SUBN V%X, V%X", insn.x, insn.y); break;
        case OP_SHL: snprintf(text, sizeof(text), "SHL V%X, V%X", insn.x, insn.y); break;
        case OP_SNE_REG: snprintf(text, sizeof(text), "SNE V%X, V%X", insn.x, insn.y); break;
        case OP_LD_I: snprintf(text, sizeof(text), "LD I, %X", insn.nnn); break;
        case OP_JP_V0: snprintf(text, sizeof(text), "JP V0, %X", insn.nnn); break;
        case OP_RND: snprintf(text, sizeof(text), "RND V%X, %X", insn.x, insn.kk); break;
        case OP_DRW: snprintf(text, sizeof(text), "DRW V%X, V%X, %X", insn.x, insn.y, insn.n); break;
        case OP_SKP: snprintf(text, sizeof(text), "SKP V%X", insn.x); break;
        case OP_SKNP: snprintf(text, sizeof(text), "SKNP V%X", insn.x); break;
        case OP_GET_DELAY: snprintf(text, sizeof(text), "LD V%X, DT", insn.x); break;
        case OP_KEYWAIT: snprintf(text, sizeof(text), "LD V%X, K", insn.x); break;
        case OP_SET_DELAY: snprintf(text, sizeof(text), "LD DT, V%X", insn.x); break;
        case OP_SET_SOUND: snprintf(text, sizeof(text), "LD ST, V%X", insn.x); break;
        case OP_ADD_INDEX: snprintf(text, sizeof(text), "ADD I, V%X", insn.x); break;
        case OP_LD_DIGIT: snprintf(text, sizeof(text), "LD F, V%X", insn.x); break;
        case OP_LD_BCD: snprintf(text, sizeof(text), "LD B, V%X", insn.x); break;
        case OP_LD_IVX: snprintf(text, sizeof(text), "LD [I], V%X", insn.x); break;
        case OP_LD_VXI: snprintf(text, sizeof(text), "LD V%X, [I]", insn.x); break;
        case OP_HALT: snprintf(text, sizeof(text), "HALT %X", insn.x); break;
        case OP_INVALID: snprintf(text, sizeof(text), "???"); break;
    }

    return text;
}

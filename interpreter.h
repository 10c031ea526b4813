#ifndef CHIP8VM_INTERPRETER_H
#define CHIP8VM_INTERPRETER_H

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>

#include "chip8.h"
#include "debug.h"
#include "instruction.h"
#include "timers.h"

// MEMORY provides read(), write(), validRange() and getDigitLocation().
// INTERFACE provides pressed(key), draw(x, y) returning true on erase, and
// clear().
template <class MEMORY, class INTERFACE>
struct Chip8Interpreter
{
    enum MachineState {
        RUNNING,
        AWAITING_KEY,
        EXITED,
        FAULTED,
    };

    enum StepResult {
        CONTINUE,
        WAITING_FOR_KEY,
        EXIT_INTERPRETER,
        FAULT,
    };

    uint32_t quirks;

    uint64_t clock = 0;

    std::array<uint8_t, REGISTER_COUNT> registers = {0};
    std::array<uint16_t, STACK_DEPTH> stack = {0};
    uint8_t sp = 0;
    uint16_t I = 0;
    uint16_t pc = 0;
    TimerUnit timers;

    MachineState state = RUNNING;
    Fault fault = FAULT_NONE;
    uint16_t faultPC = 0;
    uint16_t faultWord = 0;
    uint8_t exitCode = 0;

    uint8_t keyDestinationRegister = 0;
    std::array<bool, KEY_COUNT> keysAtLastPoll = {false};

    std::default_random_engine e1;
    std::uniform_int_distribution<int> uniform_dist;

    Chip8Interpreter(uint16_t initialPC, uint32_t quirks) :
        quirks(quirks),
        pc(initialPC),
        e1(std::random_device()()),
        uniform_dist(0, 255)
    {
    }

    void seed(uint32_t value)
    {
        e1.seed(value);
    }

    bool halted() const
    {
        return (state == EXITED) || (state == FAULTED);
    }

    // Called at TIMER_HZ, independent of step().
    void tick()
    {
        timers.tick();
    }

    uint16_t readU16(MEMORY& memory, uint16_t addr)
    {
        uint8_t hiByte = memory.read(addr);
        uint8_t loByte = memory.read(addr + 1);
        return hiByte * 256 + loByte;
    }

    void storeALUResult(int destination, uint8_t result, bool f)
    {
        if(quirks & QUIRKS_VFORDER) {
            registers[0xF] = f ? 1 : 0;
            registers[destination] = result;
        } else {
            registers[destination] = result;
            registers[0xF] = f ? 1 : 0;
        }
    }

    // Enter the faulted state.  Nothing else about the machine changes, so
    // the registers, stack and memory are those from before the failing step.
    StepResult signalFault(Fault kind, uint16_t instructionWord)
    {
        fprintf(stderr, "%04X: %s at instruction %04X\n", pc, faultName(kind), instructionWord);
        state = FAULTED;
        fault = kind;
        faultPC = pc;
        faultWord = instructionWord;
        return FAULT;
    }

    StepResult pollForKey(INTERFACE& interface)
    {
        int newlyPressed = -1;

        for(uint8_t i = 0; i < KEY_COUNT; i++) {
            bool isPressed = interface.pressed(i);
            if(isPressed && !keysAtLastPoll[i] && (newlyPressed < 0)) {
                newlyPressed = i;
            }
            keysAtLastPoll[i] = isPressed;
        }

        if(newlyPressed < 0) {
            return WAITING_FOR_KEY;
        }

        if(debug & DEBUG_KEYS) {
            printf("pressed %d, key wait over\n", newlyPressed);
        }
        registers[keyDestinationRegister] = newlyPressed;
        pc = pc + 2;
        state = RUNNING;
        clock++;
        return CONTINUE;
    }

    StepResult step(MEMORY& memory, INTERFACE& interface)
    {
        switch(state) {
            case EXITED: return EXIT_INTERPRETER;
            case FAULTED: return FAULT;
            case AWAITING_KEY: return pollForKey(interface);
            case RUNNING: break;
        }

        if(!memory.validRange(pc, 2)) {
            return signalFault(FAULT_ADDRESS_OUT_OF_RANGE, 0);
        }

        uint16_t instructionWord = readU16(memory, pc);
        Instruction insn = decode(instructionWord);

        if(debug & DEBUG_STATE) {
            printf("CHIP8: clk:%llu pc:%04X I:%04X ", (unsigned long long)clock, pc, I);
            for(int i = 0; i < REGISTER_COUNT; i++) {
                printf("%02X ", registers[i]);
            }
            puts("");
        }

        if(debug & DEBUG_ASM) {
            printf("%04X: (%04X) %s\n", pc, instructionWord, disassemble(insn).c_str());
        }

        StepResult stepResult = execute(insn, memory, interface);
        if(stepResult != FAULT) {
            clock++;
        }
        return stepResult;
    }

    // Runs one decoded instruction.  Each case checks everything that can
    // fault before it changes any state.
    StepResult execute(const Instruction& insn, MEMORY& memory, INTERFACE& interface)
    {
        StepResult stepResult = CONTINUE;
        uint16_t nextPC = pc + 2;

        switch(insn.op) {
            case OP_SYS: { // 0nnn - SYS addr - Jump to a machine code routine at nnn.  Ignored.
                break;
            }
            case OP_CLS: { // 00E0 - CLS - Clear the display.
                interface.clear();
                break;
            }
            case OP_RET: { // 00EE - RET - Return from a subroutine.  The interpreter sets the program counter to the address at the top of the stack, then subtracts 1 from the stack pointer.
                if(sp == 0) {
                    return signalFault(FAULT_STACK_UNDERFLOW, insn.word);
                }
                nextPC = stack[--sp];
                break;
            }
            case OP_JP: { // 1nnn - JP addr - Jump to location nnn.
                nextPC = insn.nnn;
                break;
            }
            case OP_CALL: { // 2nnn - CALL addr - Call subroutine at nnn.  The interpreter puts the address of the next instruction on the top of the stack. The PC is then set to nnn.
                if(sp == STACK_DEPTH) {
                    return signalFault(FAULT_STACK_OVERFLOW, insn.word);
                }
                stack[sp++] = nextPC;
                nextPC = insn.nnn;
                break;
            }
            case OP_SE_IMM: { // 3xkk - SE Vx, byte - Skip next instruction if Vx = kk.
                if(registers[insn.x] == insn.kk) {
                    nextPC = nextPC + 2;
                }
                break;
            }
            case OP_SNE_IMM: { // 4xkk - SNE Vx, byte - Skip next instruction if Vx != kk.
                if(registers[insn.x] != insn.kk) {
                    nextPC = nextPC + 2;
                }
                break;
            }
            case OP_SE_REG: { // 5xy0 - SE Vx, Vy - Skip next instruction if Vx = Vy.
                if(registers[insn.x] == registers[insn.y]) {
                    nextPC = nextPC + 2;
                }
                break;
            }
            case OP_LD_IMM: { // 6xkk - LD Vx, byte - Set Vx = kk.
                registers[insn.x] = insn.kk;
                break;
            }
            case OP_ADD_IMM: { // 7xkk - ADD Vx, byte - Set Vx = Vx + kk.  VF is not affected.
                registers[insn.x] = registers[insn.x] + insn.kk;
                break;
            }
            case OP_LD_REG: { // 8xy0 - LD Vx, Vy - Set Vx = Vy.
                registers[insn.x] = registers[insn.y];
                break;
            }
            case OP_OR: { // 8xy1 - OR Vx, Vy - Set Vx = Vx OR Vy.
                registers[insn.x] |= registers[insn.y];
                if(quirks & QUIRKS_LOGIC) {
                    registers[0xF] = 0;
                }
                break;
            }
            case OP_AND: { // 8xy2 - AND Vx, Vy - Set Vx = Vx AND Vy.
                registers[insn.x] &= registers[insn.y];
                if(quirks & QUIRKS_LOGIC) {
                    registers[0xF] = 0;
                }
                break;
            }
            case OP_XOR: { // 8xy3 - XOR Vx, Vy - Set Vx = Vx XOR Vy.
                registers[insn.x] ^= registers[insn.y];
                if(quirks & QUIRKS_LOGIC) {
                    registers[0xF] = 0;
                }
                break;
            }
            case OP_ADD_REG: { // 8xy4 - ADD Vx, Vy - Set Vx = Vx + Vy, set VF = carry.  Only the lowest 8 bits of the result are kept.
                int sum = registers[insn.x] + registers[insn.y];
                storeALUResult(insn.x, sum & 0xFF, sum > 0xFF);
                break;
            }
            case OP_SUB: { // 8xy5 - SUB Vx, Vy - Set Vx = Vx - Vy, set VF = NOT borrow.
                uint8_t vx = registers[insn.x];
                uint8_t vy = registers[insn.y];
                storeALUResult(insn.x, vx - vy, vx >= vy);
                break;
            }
            case OP_SUBN: { // 8xy7 - SUBN Vx, Vy - Set Vx = Vy - Vx, set VF = NOT borrow.
                uint8_t vx = registers[insn.x];
                uint8_t vy = registers[insn.y];
                storeALUResult(insn.x, vy - vx, vy >= vx);
                break;
            }
            case OP_SHR: { // 8xy6 - SHR Vx {, Vy} - Set Vx = Vy SHR 1, VF = bit shifted out.  (if shift quirk, Vx = Vx SHR 1)
                uint8_t source = registers[(quirks & QUIRKS_SHIFT) ? insn.x : insn.y];
                storeALUResult(insn.x, source >> 1, source & 0x01);
                break;
            }
            case OP_SHL: { // 8xyE - SHL Vx {, Vy} - Set Vx = Vy SHL 1, VF = bit shifted out.  (if shift quirk, Vx = Vx SHL 1)
                uint8_t source = registers[(quirks & QUIRKS_SHIFT) ? insn.x : insn.y];
                storeALUResult(insn.x, source << 1, source & 0x80);
                break;
            }
            case OP_SNE_REG: { // 9xy0 - SNE Vx, Vy - Skip next instruction if Vx != Vy.
                if(registers[insn.x] != registers[insn.y]) {
                    nextPC = nextPC + 2;
                }
                break;
            }
            case OP_LD_I: { // Annn - LD I, addr - Set I = nnn.
                I = insn.nnn;
                break;
            }
            case OP_JP_V0: { // Bnnn - JP V0, addr - Jump to location nnn + V0.
                uint32_t target;
                if(quirks & QUIRKS_JUMP) { // Bxnn jumps to xnn + Vx
                    target = insn.nnn + registers[insn.x];
                } else {
                    target = insn.nnn + registers[0];
                }
                if(!memory.validRange(target, 1)) {
                    return signalFault(FAULT_ADDRESS_OUT_OF_RANGE, insn.word);
                }
                nextPC = target;
                break;
            }
            case OP_RND: { // Cxkk - RND Vx, byte - Set Vx = random byte AND kk.
                registers[insn.x] = uniform_dist(e1) & insn.kk;
                break;
            }
            case OP_DRW: { // Dxyn - DRW Vx, Vy, nibble - Display n-byte sprite starting at memory location I at (Vx, Vy), set VF = collision.
                if(!memory.validRange(I, insn.n)) {
                    return signalFault(FAULT_ADDRESS_OUT_OF_RANGE, insn.word);
                }
                drawSprite(insn, memory, interface);
                break;
            }
            case OP_SKP: { // Ex9E - SKP Vx - Skip next instruction if key with the value of Vx is pressed.
                uint8_t key = registers[insn.x] & 0xF;
                if(interface.pressed(key)) {
                    if(debug & DEBUG_KEYS) {
                        printf("clock %llu, pc %04X, SKP, key %d pressed\n", (unsigned long long)clock, pc, key);
                    }
                    nextPC = nextPC + 2;
                }
                break;
            }
            case OP_SKNP: { // ExA1 - SKNP Vx - Skip next instruction if key with the value of Vx is not pressed.
                uint8_t key = registers[insn.x] & 0xF;
                if(!interface.pressed(key)) {
                    nextPC = nextPC + 2;
                } else if(debug & DEBUG_KEYS) {
                    printf("clock %llu, pc %04X, SKNP, key %d pressed\n", (unsigned long long)clock, pc, key);
                }
                break;
            }
            case OP_GET_DELAY: { // Fx07 - LD Vx, DT - Set Vx = delay timer value.
                registers[insn.x] = timers.DT;
                break;
            }
            case OP_KEYWAIT: { // Fx0A - LD Vx, K - Wait for a key press, store the value of the key in Vx.
                // PC stays on this instruction until pollForKey() sees a key go down.
                if(debug & DEBUG_KEYS) {
                    printf("waiting for key\n");
                }
                for(uint8_t i = 0; i < KEY_COUNT; i++) {
                    keysAtLastPoll[i] = interface.pressed(i);
                }
                keyDestinationRegister = insn.x;
                state = AWAITING_KEY;
                nextPC = pc;
                stepResult = WAITING_FOR_KEY;
                break;
            }
            case OP_SET_DELAY: { // Fx15 - LD DT, Vx - Set delay timer = Vx.
                timers.DT = registers[insn.x];
                break;
            }
            case OP_SET_SOUND: { // Fx18 - LD ST, Vx - Set sound timer = Vx.  No tone is generated.
                timers.ST = registers[insn.x];
                break;
            }
            case OP_ADD_INDEX: { // Fx1E - ADD I, Vx - Set I = I + Vx.
                I = (I + registers[insn.x]) & ADDRESS_MASK;
                break;
            }
            case OP_LD_DIGIT: { // Fx29 - LD F, Vx - Set I = location of sprite for digit Vx.
                I = memory.getDigitLocation(registers[insn.x] & 0xF);
                break;
            }
            case OP_LD_BCD: { // Fx33 - LD B, Vx - Store BCD representation of Vx in memory locations I, I+1, and I+2.
                if(!memory.validRange(I, 3)) {
                    return signalFault(FAULT_ADDRESS_OUT_OF_RANGE, insn.word);
                }
                uint8_t value = registers[insn.x];
                memory.write(I + 0, value / 100);
                memory.write(I + 1, (value % 100) / 10);
                memory.write(I + 2, value % 10);
                break;
            }
            case OP_LD_IVX: { // Fx55 - LD [I], Vx - Store registers V0 through Vx in memory starting at location I.
                if(!memory.validRange(I, insn.x + 1)) {
                    return signalFault(FAULT_ADDRESS_OUT_OF_RANGE, insn.word);
                }
                for(int i = 0; i <= insn.x; i++) {
                    memory.write(I + i, registers[i]);
                }
                if(!(quirks & QUIRKS_LOAD_STORE)) {
                    I = (I + insn.x + 1) & ADDRESS_MASK;
                }
                break;
            }
            case OP_LD_VXI: { // Fx65 - LD Vx, [I] - Read registers V0 through Vx from memory starting at location I.
                if(!memory.validRange(I, insn.x + 1)) {
                    return signalFault(FAULT_ADDRESS_OUT_OF_RANGE, insn.word);
                }
                for(int i = 0; i <= insn.x; i++) {
                    registers[i] = memory.read(I + i);
                }
                if(!(quirks & QUIRKS_LOAD_STORE)) {
                    I = (I + insn.x + 1) & ADDRESS_MASK;
                }
                break;
            }
            case OP_HALT: { // FxFF - HALT - Stop the interpreter with exit code x.
                state = EXITED;
                exitCode = insn.x;
                stepResult = EXIT_INTERPRETER;
                break;
            }
            case OP_INVALID: {
                return signalFault(FAULT_INVALID_OPCODE, insn.word);
            }
        }

        pc = nextPC;
        return stepResult;
    }

    // Sprites are XORed onto the screen starting at (Vx mod 64, Vy mod 32).
    // Pixels past the right or bottom edge wrap around, or are dropped with
    // QUIRKS_CLIP.  VF is 1 if any lit pixel was erased.
    void drawSprite(const Instruction& insn, MEMORY& memory, INTERFACE& interface)
    {
        uint32_t originX = registers[insn.x] % SCREEN_WIDTH;
        uint32_t originY = registers[insn.y] % SCREEN_HEIGHT;
        bool collision = false;

        for(uint32_t rowIndex = 0; rowIndex < insn.n; rowIndex++) {
            uint8_t byte = memory.read(I + rowIndex);
            for(uint32_t bitIndex = 0; bitIndex < 8; bitIndex++) {
                bool hasPixel = (byte >> (7 - bitIndex)) & 0x1;
                if(!hasPixel) {
                    continue;
                }
                uint32_t x = originX + bitIndex;
                uint32_t y = originY + rowIndex;
                if(quirks & QUIRKS_CLIP) {
                    if((x >= SCREEN_WIDTH) || (y >= SCREEN_HEIGHT)) {
                        continue;
                    }
                } else {
                    x = x % SCREEN_WIDTH;
                    y = y % SCREEN_HEIGHT;
                }
                if(debug & DEBUG_DRAW) {
                    printf("draw %u %u (%u)\n", x, y, x + y * SCREEN_WIDTH);
                }
                collision |= interface.draw(x, y);
            }
        }

        registers[0xF] = collision ? 1 : 0;
    }
};

#endif // CHIP8VM_INTERPRETER_H

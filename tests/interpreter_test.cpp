#include <vector>

#include <gtest/gtest.h>

#include "test_machine.h"

TEST(InterpreterTest, InitialState)
{
    TestMachine machine({});

    EXPECT_EQ(machine.chip8.pc, PROGRAM_BASE);
    EXPECT_EQ(machine.chip8.sp, 0);
    EXPECT_EQ(machine.chip8.I, 0);
    EXPECT_EQ(machine.chip8.timers.DT, 0);
    EXPECT_EQ(machine.chip8.timers.ST, 0);
    EXPECT_EQ(machine.chip8.state, Chip8::RUNNING);
    EXPECT_EQ(machine.peripherals.screen.litPixelCount(), 0);
}

TEST(InterpreterTest, LoadAndAddProgram)
{
    TestMachine machine({0x60, 0x05, 0x61, 0x03, 0x80, 0x14});

    EXPECT_EQ(machine.run(3), Chip8::CONTINUE);
    EXPECT_EQ(machine.chip8.registers[0], 8);
    EXPECT_EQ(machine.chip8.registers[1], 3);
    EXPECT_EQ(machine.chip8.registers[0xF], 0);
    EXPECT_EQ(machine.chip8.pc, PROGRAM_BASE + 6);
    EXPECT_EQ(machine.chip8.clock, 3u);
}

TEST(InterpreterTest, ClearScreen)
{
    TestMachine machine({0x00, 0xE0});
    machine.peripherals.screen.draw(0, 0);
    machine.peripherals.screen.draw(63, 31);

    machine.step();

    EXPECT_EQ(machine.peripherals.screen.litPixelCount(), 0);
    EXPECT_EQ(machine.chip8.pc, 0x202);
}

TEST(InterpreterTest, SysInstructionIsIgnored)
{
    TestMachine machine({0x01, 0x23, 0x00, 0x00});

    EXPECT_EQ(machine.run(2), Chip8::CONTINUE);
    EXPECT_EQ(machine.chip8.pc, 0x204);
    EXPECT_EQ(machine.chip8.sp, 0);
}

TEST(InterpreterTest, Jump)
{
    TestMachine machine({0x12, 0x34});

    machine.step();

    EXPECT_EQ(machine.chip8.pc, 0x234);
}

TEST(InterpreterTest, CallAndReturn)
{
    TestMachine machine({0x22, 0x00});

    machine.step();
    EXPECT_EQ(machine.chip8.pc, 0x200);
    EXPECT_EQ(machine.chip8.sp, 1);
    EXPECT_EQ(machine.chip8.stack[0], 0x202);

    machine.memory.write(0x200, 0x00);
    machine.memory.write(0x201, 0xEE);
    machine.step();
    EXPECT_EQ(machine.chip8.pc, 0x202);
    EXPECT_EQ(machine.chip8.sp, 0);
}

TEST(InterpreterTest, SeventeenthNestedCallOverflows)
{
    TestMachine machine({0x22, 0x00});

    for(int i = 0; i < STACK_DEPTH; i++) {
        ASSERT_EQ(machine.step(), Chip8::CONTINUE);
    }
    EXPECT_EQ(machine.chip8.sp, STACK_DEPTH);

    EXPECT_EQ(machine.step(), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_STACK_OVERFLOW);
    EXPECT_EQ(machine.chip8.state, Chip8::FAULTED);
    EXPECT_EQ(machine.chip8.sp, STACK_DEPTH);
    EXPECT_EQ(machine.chip8.pc, 0x200);
}

TEST(InterpreterTest, ReturnWithEmptyStackUnderflows)
{
    TestMachine machine({0x00, 0xEE});

    EXPECT_EQ(machine.step(), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_STACK_UNDERFLOW);
    EXPECT_EQ(machine.chip8.faultPC, 0x200);
    EXPECT_EQ(machine.chip8.faultWord, 0x00EE);
    EXPECT_EQ(machine.chip8.pc, 0x200);
    EXPECT_TRUE(machine.chip8.halted());
}

TEST(InterpreterTest, FaultedMachineStaysHalted)
{
    TestMachine machine({0x51, 0x21, 0x60, 0x05});

    EXPECT_EQ(machine.step(), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_INVALID_OPCODE);
    EXPECT_EQ(machine.chip8.faultWord, 0x5121);

    EXPECT_EQ(machine.step(), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.pc, 0x200);
    EXPECT_EQ(machine.chip8.registers[0], 0);
    EXPECT_EQ(machine.chip8.clock, 0u);
}

TEST(InterpreterTest, FaultLeavesRegistersAndMemoryUntouched)
{
    // V0..V2 set, I = FFE, then LD [I], V2 needs FFE..1000.
    TestMachine machine({0x60, 0x11, 0x61, 0x22, 0x62, 0x33, 0xAF, 0xFE, 0xF2, 0x55});
    machine.run(4);
    Chip8 before = machine.chip8;

    EXPECT_EQ(machine.step(), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_ADDRESS_OUT_OF_RANGE);
    EXPECT_EQ(machine.chip8.registers, before.registers);
    EXPECT_EQ(machine.chip8.I, before.I);
    EXPECT_EQ(machine.chip8.pc, before.pc);
    EXPECT_EQ(machine.memory.read(0xFFE), 0x00);
    EXPECT_EQ(machine.memory.read(0xFFF), 0x00);
}

TEST(InterpreterTest, SkipIfEqualImmediate)
{
    TestMachine taken({0x60, 0x42, 0x30, 0x42});
    taken.run(2);
    EXPECT_EQ(taken.chip8.pc, 0x206);

    TestMachine notTaken({0x60, 0x41, 0x30, 0x42});
    notTaken.run(2);
    EXPECT_EQ(notTaken.chip8.pc, 0x204);
}

TEST(InterpreterTest, SkipIfNotEqualImmediate)
{
    TestMachine taken({0x60, 0x41, 0x40, 0x42});
    taken.run(2);
    EXPECT_EQ(taken.chip8.pc, 0x206);

    TestMachine notTaken({0x60, 0x42, 0x40, 0x42});
    notTaken.run(2);
    EXPECT_EQ(notTaken.chip8.pc, 0x204);
}

TEST(InterpreterTest, SkipOnRegisterComparison)
{
    TestMachine equal({0x60, 0x07, 0x61, 0x07, 0x50, 0x10});
    equal.run(3);
    EXPECT_EQ(equal.chip8.pc, 0x208);

    TestMachine notEqual({0x60, 0x07, 0x61, 0x08, 0x90, 0x10});
    notEqual.run(3);
    EXPECT_EQ(notEqual.chip8.pc, 0x208);

    TestMachine neither({0x60, 0x07, 0x61, 0x07, 0x90, 0x10});
    neither.run(3);
    EXPECT_EQ(neither.chip8.pc, 0x206);
}

TEST(InterpreterTest, AddImmediateWrapsWithoutFlag)
{
    TestMachine machine({0x6F, 0x00, 0x60, 0xFF, 0x70, 0x02});

    machine.run(3);

    EXPECT_EQ(machine.chip8.registers[0], 0x01);
    EXPECT_EQ(machine.chip8.registers[0xF], 0);
}

TEST(InterpreterTest, RegisterCopyAndLogic)
{
    TestMachine machine({0x6F, 0x05, 0x60, 0x0C, 0x61, 0x0A,
        0x82, 0x00,   // V2 = V0
        0x82, 0x11,   // V2 |= V1
        0x83, 0x00,
        0x83, 0x12,   // V3 = V0 & V1
        0x84, 0x00,
        0x84, 0x13}); // V4 = V0 ^ V1

    machine.run(9);

    EXPECT_EQ(machine.chip8.registers[2], 0x0E);
    EXPECT_EQ(machine.chip8.registers[3], 0x08);
    EXPECT_EQ(machine.chip8.registers[4], 0x06);
    EXPECT_EQ(machine.chip8.registers[0xF], 0x05);
}

TEST(InterpreterTest, LogicQuirkClearsVF)
{
    TestMachine machine({0x6F, 0x05, 0x60, 0x0C, 0x61, 0x0A, 0x80, 0x11}, QUIRKS_LOGIC);

    machine.run(4);

    EXPECT_EQ(machine.chip8.registers[0], 0x0E);
    EXPECT_EQ(machine.chip8.registers[0xF], 0);
}

TEST(InterpreterTest, AddSetsCarry)
{
    TestMachine carry({0x60, 0xFF, 0x61, 0x01, 0x80, 0x14});
    carry.run(3);
    EXPECT_EQ(carry.chip8.registers[0], 0x00);
    EXPECT_EQ(carry.chip8.registers[0xF], 1);

    TestMachine noCarry({0x6F, 0x01, 0x60, 0xFE, 0x61, 0x01, 0x80, 0x14});
    noCarry.run(4);
    EXPECT_EQ(noCarry.chip8.registers[0], 0xFF);
    EXPECT_EQ(noCarry.chip8.registers[0xF], 0);
}

TEST(InterpreterTest, SubtractSetsNotBorrow)
{
    TestMachine noBorrow({0x60, 0x05, 0x61, 0x03, 0x80, 0x15});
    noBorrow.run(3);
    EXPECT_EQ(noBorrow.chip8.registers[0], 0x02);
    EXPECT_EQ(noBorrow.chip8.registers[0xF], 1);

    TestMachine equal({0x60, 0x05, 0x61, 0x05, 0x80, 0x15});
    equal.run(3);
    EXPECT_EQ(equal.chip8.registers[0], 0x00);
    EXPECT_EQ(equal.chip8.registers[0xF], 1);

    TestMachine borrow({0x60, 0x03, 0x61, 0x05, 0x80, 0x15});
    borrow.run(3);
    EXPECT_EQ(borrow.chip8.registers[0], 0xFE);
    EXPECT_EQ(borrow.chip8.registers[0xF], 0);
}

TEST(InterpreterTest, ReverseSubtractSetsNotBorrow)
{
    TestMachine noBorrow({0x60, 0x03, 0x61, 0x05, 0x80, 0x17});
    noBorrow.run(3);
    EXPECT_EQ(noBorrow.chip8.registers[0], 0x02);
    EXPECT_EQ(noBorrow.chip8.registers[0xF], 1);

    TestMachine borrow({0x60, 0x05, 0x61, 0x03, 0x80, 0x17});
    borrow.run(3);
    EXPECT_EQ(borrow.chip8.registers[0], 0xFE);
    EXPECT_EQ(borrow.chip8.registers[0xF], 0);
}

TEST(InterpreterTest, ShiftsUseVyAndCaptureShiftedBit)
{
    TestMachine right({0x60, 0xFF, 0x61, 0x05, 0x80, 0x16});
    right.run(3);
    EXPECT_EQ(right.chip8.registers[0], 0x02);
    EXPECT_EQ(right.chip8.registers[1], 0x05);
    EXPECT_EQ(right.chip8.registers[0xF], 1);

    TestMachine left({0x61, 0x81, 0x80, 0x1E});
    left.run(2);
    EXPECT_EQ(left.chip8.registers[0], 0x02);
    EXPECT_EQ(left.chip8.registers[0xF], 1);

    TestMachine noBit({0x6F, 0x01, 0x61, 0x40, 0x80, 0x1E});
    noBit.run(3);
    EXPECT_EQ(noBit.chip8.registers[0], 0x80);
    EXPECT_EQ(noBit.chip8.registers[0xF], 0);
}

TEST(InterpreterTest, ShiftQuirkUsesVx)
{
    TestMachine machine({0x60, 0x05, 0x61, 0xF0, 0x80, 0x16}, QUIRKS_SHIFT);

    machine.run(3);

    EXPECT_EQ(machine.chip8.registers[0], 0x02);
    EXPECT_EQ(machine.chip8.registers[0xF], 1);
}

TEST(InterpreterTest, FlagWinsWhenVFIsTheDestination)
{
    TestMachine machine({0x6F, 0xFF, 0x61, 0x01, 0x8F, 0x14});
    machine.run(3);
    EXPECT_EQ(machine.chip8.registers[0xF], 1);

    TestMachine vfOrder({0x6F, 0xFF, 0x61, 0x01, 0x8F, 0x14}, QUIRKS_VFORDER);
    vfOrder.run(3);
    EXPECT_EQ(vfOrder.chip8.registers[0xF], 0);
}

TEST(InterpreterTest, LoadIndex)
{
    TestMachine machine({0xA1, 0x23});

    machine.step();

    EXPECT_EQ(machine.chip8.I, 0x123);
}

TEST(InterpreterTest, JumpPlusV0)
{
    TestMachine machine({0x60, 0x04, 0xB3, 0x00});

    machine.run(2);

    EXPECT_EQ(machine.chip8.pc, 0x304);
}

TEST(InterpreterTest, JumpQuirkUsesVx)
{
    TestMachine machine({0x60, 0x10, 0x63, 0x04, 0xB3, 0x00}, QUIRKS_JUMP);

    machine.run(3);

    EXPECT_EQ(machine.chip8.pc, 0x304);
}

TEST(InterpreterTest, JumpPlusV0PastEndOfMemoryFaults)
{
    TestMachine machine({0x60, 0xFF, 0xBF, 0xFF});

    EXPECT_EQ(machine.run(2), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_ADDRESS_OUT_OF_RANGE);
    EXPECT_EQ(machine.chip8.pc, 0x202);
}

TEST(InterpreterTest, FetchPastEndOfMemoryFaults)
{
    TestMachine machine({0x1F, 0xFF});

    machine.step();
    EXPECT_EQ(machine.chip8.pc, 0xFFF);

    EXPECT_EQ(machine.step(), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_ADDRESS_OUT_OF_RANGE);
}

TEST(InterpreterTest, RandomIsMasked)
{
    std::vector<uint8_t> image;
    for(int i = 0; i < 64; i++) {
        image.push_back(0xC0);
        image.push_back(0x0F);
    }
    TestMachine machine(image);

    for(int i = 0; i < 64; i++) {
        machine.step();
        EXPECT_EQ(machine.chip8.registers[0] & ~0x0F, 0);
    }
}

TEST(InterpreterTest, RandomWithZeroMaskIsZero)
{
    TestMachine machine({0x60, 0xAA, 0xC0, 0x00});

    machine.run(2);

    EXPECT_EQ(machine.chip8.registers[0], 0);
}

TEST(InterpreterTest, DrawDigitAndCollide)
{
    // V0 = V1 = 0, I = sprite for 0, draw it twice.
    TestMachine machine({0x60, 0x00, 0x61, 0x00, 0xF0, 0x29, 0xD0, 0x15, 0xD0, 0x15});

    machine.run(4);
    EXPECT_EQ(machine.chip8.registers[0xF], 0);
    EXPECT_EQ(machine.peripherals.screen.litPixelCount(), 14);
    EXPECT_TRUE(machine.peripherals.screen.at(0, 0));
    EXPECT_TRUE(machine.peripherals.screen.at(3, 0));
    EXPECT_FALSE(machine.peripherals.screen.at(4, 0));
    EXPECT_TRUE(machine.peripherals.screen.at(0, 1));
    EXPECT_FALSE(machine.peripherals.screen.at(1, 1));

    machine.step();
    EXPECT_EQ(machine.chip8.registers[0xF], 1);
    EXPECT_EQ(machine.peripherals.screen.litPixelCount(), 0);
}

TEST(InterpreterTest, DrawTwiceRestoresScreen)
{
    // Draw 0 at (0, 0), then 8 at (2, 1) twice.
    TestMachine machine({0x60, 0x00, 0x61, 0x00, 0xF0, 0x29, 0xD0, 0x15,
        0x62, 0x08, 0xF2, 0x29, 0x60, 0x02, 0x61, 0x01, 0xD0, 0x15, 0xD0, 0x15});

    machine.run(4);
    DisplayBuffer before = machine.peripherals.screen;

    machine.run(5);
    EXPECT_EQ(machine.chip8.registers[0xF], 1);

    machine.step();
    EXPECT_EQ(machine.chip8.registers[0xF], 1);
    EXPECT_EQ(machine.peripherals.screen.display, before.display);
}

TEST(InterpreterTest, DrawOnEmptyAreaReportsNoCollision)
{
    TestMachine machine({0x60, 0x00, 0x61, 0x00, 0xF0, 0x29, 0xD0, 0x15,
        0x60, 0x10, 0xD0, 0x15});

    machine.run(6);

    EXPECT_EQ(machine.chip8.registers[0xF], 0);
    EXPECT_EQ(machine.peripherals.screen.litPixelCount(), 28);
}

TEST(InterpreterTest, DrawWrapsAroundEdges)
{
    // Digit 0 at (62, 30).
    TestMachine machine({0x60, 0x3E, 0x61, 0x1E, 0xF2, 0x29, 0xD0, 0x15});

    machine.run(4);

    const DisplayBuffer& screen = machine.peripherals.screen;
    EXPECT_EQ(screen.litPixelCount(), 14);
    EXPECT_TRUE(screen.at(62, 30));
    EXPECT_TRUE(screen.at(63, 30));
    EXPECT_TRUE(screen.at(0, 30));
    EXPECT_TRUE(screen.at(1, 30));
    EXPECT_TRUE(screen.at(62, 31));
    EXPECT_TRUE(screen.at(1, 31));
    EXPECT_TRUE(screen.at(62, 0));
    EXPECT_TRUE(screen.at(1, 2));
}

TEST(InterpreterTest, DrawOriginIsTakenModuloScreenSize)
{
    TestMachine machine({0x60, 0x43, 0x61, 0x22, 0xF2, 0x29, 0xD0, 0x11});

    machine.run(4);

    EXPECT_TRUE(machine.peripherals.screen.at(3, 2));
    EXPECT_EQ(machine.peripherals.screen.litPixelCount(), 4);
}

TEST(InterpreterTest, ClipQuirkDropsOffscreenPixels)
{
    TestMachine machine({0x60, 0x3E, 0x61, 0x1E, 0xF2, 0x29, 0xD0, 0x15}, QUIRKS_CLIP);

    machine.run(4);

    const DisplayBuffer& screen = machine.peripherals.screen;
    EXPECT_EQ(screen.litPixelCount(), 3);
    EXPECT_TRUE(screen.at(62, 30));
    EXPECT_TRUE(screen.at(63, 30));
    EXPECT_TRUE(screen.at(62, 31));
}

TEST(InterpreterTest, DrawPastEndOfMemoryFaults)
{
    TestMachine machine({0xAF, 0xFE, 0xD0, 0x15});

    EXPECT_EQ(machine.run(2), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_ADDRESS_OUT_OF_RANGE);
    EXPECT_EQ(machine.peripherals.screen.litPixelCount(), 0);
}

TEST(InterpreterTest, SkipIfKeyPressed)
{
    TestMachine pressed({0x60, 0x15, 0xE0, 0x9E});
    pressed.peripherals.keypad.set(0x5, true);
    pressed.run(2);
    EXPECT_EQ(pressed.chip8.pc, 0x206);

    TestMachine released({0x60, 0x15, 0xE0, 0x9E});
    released.run(2);
    EXPECT_EQ(released.chip8.pc, 0x204);
}

TEST(InterpreterTest, SkipIfKeyNotPressed)
{
    TestMachine pressed({0x60, 0x05, 0xE0, 0xA1});
    pressed.peripherals.keypad.set(0x5, true);
    pressed.run(2);
    EXPECT_EQ(pressed.chip8.pc, 0x204);

    TestMachine released({0x60, 0x05, 0xE0, 0xA1});
    released.run(2);
    EXPECT_EQ(released.chip8.pc, 0x206);
}

TEST(InterpreterTest, KeyWaitHoldsUntilAKeyGoesDown)
{
    TestMachine machine({0xF3, 0x0A, 0x60, 0x01});

    EXPECT_EQ(machine.step(), Chip8::WAITING_FOR_KEY);
    EXPECT_EQ(machine.chip8.state, Chip8::AWAITING_KEY);
    EXPECT_EQ(machine.chip8.pc, 0x200);

    EXPECT_EQ(machine.run(10), Chip8::WAITING_FOR_KEY);
    EXPECT_EQ(machine.chip8.pc, 0x200);

    machine.peripherals.keypad.set(0x7, true);
    EXPECT_EQ(machine.step(), Chip8::CONTINUE);
    EXPECT_EQ(machine.chip8.registers[3], 0x7);
    EXPECT_EQ(machine.chip8.pc, 0x202);
    EXPECT_EQ(machine.chip8.state, Chip8::RUNNING);

    machine.step();
    EXPECT_EQ(machine.chip8.registers[0], 0x1);
}

TEST(InterpreterTest, KeyWaitIgnoresKeyAlreadyHeld)
{
    TestMachine machine({0xF3, 0x0A});
    machine.peripherals.keypad.set(0x4, true);

    machine.step();
    EXPECT_EQ(machine.step(), Chip8::WAITING_FOR_KEY);

    machine.peripherals.keypad.set(0x4, false);
    EXPECT_EQ(machine.step(), Chip8::WAITING_FOR_KEY);

    machine.peripherals.keypad.set(0x4, true);
    EXPECT_EQ(machine.step(), Chip8::CONTINUE);
    EXPECT_EQ(machine.chip8.registers[3], 0x4);
}

TEST(InterpreterTest, TimerRegisters)
{
    TestMachine machine({0x6A, 0x3C, 0xFA, 0x15, 0xFA, 0x18, 0xFB, 0x07});

    machine.run(3);
    EXPECT_EQ(machine.chip8.timers.DT, 0x3C);
    EXPECT_EQ(machine.chip8.timers.ST, 0x3C);

    machine.chip8.tick();
    machine.step();
    EXPECT_EQ(machine.chip8.registers[0xB], 0x3B);
    EXPECT_EQ(machine.chip8.timers.ST, 0x3B);
}

TEST(InterpreterTest, AddToIndexWrapsAt4K)
{
    TestMachine machine({0x6F, 0x07, 0xAF, 0xFF, 0x60, 0x02, 0xF0, 0x1E});

    machine.run(4);

    EXPECT_EQ(machine.chip8.I, 0x001);
    EXPECT_EQ(machine.chip8.registers[0xF], 0x07);
}

TEST(InterpreterTest, DigitLocationUsesLowNibble)
{
    TestMachine machine({0x60, 0x1A, 0xF0, 0x29});

    machine.run(2);

    EXPECT_EQ(machine.chip8.I, FONT_BASE + 0xA * FONT_GLYPH_BYTES);
}

TEST(InterpreterTest, StoreBCD)
{
    TestMachine machine({0xA3, 0x00, 0x60, 0x9C, 0xF0, 0x33});

    machine.run(3);

    EXPECT_EQ(machine.memory.read(0x300), 1);
    EXPECT_EQ(machine.memory.read(0x301), 5);
    EXPECT_EQ(machine.memory.read(0x302), 6);
    EXPECT_EQ(machine.chip8.I, 0x300);
}

TEST(InterpreterTest, StoreBCDPastEndOfMemoryFaults)
{
    TestMachine machine({0xAF, 0xFE, 0xF0, 0x33});

    EXPECT_EQ(machine.run(2), Chip8::FAULT);
    EXPECT_EQ(machine.chip8.fault, FAULT_ADDRESS_OUT_OF_RANGE);
    EXPECT_EQ(machine.memory.read(0xFFE), 0);
}

TEST(InterpreterTest, StoreAndLoadRegisterBlock)
{
    TestMachine machine({0x60, 0x11, 0x61, 0x22, 0x62, 0x33, 0xA4, 0x00, 0xF2, 0x55,
        0x60, 0x00, 0x61, 0x00, 0x62, 0x00, 0xA4, 0x00, 0xF1, 0x65});

    machine.run(5);
    EXPECT_EQ(machine.memory.read(0x400), 0x11);
    EXPECT_EQ(machine.memory.read(0x401), 0x22);
    EXPECT_EQ(machine.memory.read(0x402), 0x33);
    EXPECT_EQ(machine.memory.read(0x403), 0x00);
    EXPECT_EQ(machine.chip8.I, 0x403);

    machine.run(5);
    EXPECT_EQ(machine.chip8.registers[0], 0x11);
    EXPECT_EQ(machine.chip8.registers[1], 0x22);
    EXPECT_EQ(machine.chip8.registers[2], 0x00);
    EXPECT_EQ(machine.chip8.I, 0x402);
}

TEST(InterpreterTest, LoadStoreQuirkLeavesIndex)
{
    TestMachine machine({0xA4, 0x00, 0xF2, 0x55, 0xF2, 0x65}, QUIRKS_LOAD_STORE);

    machine.run(3);

    EXPECT_EQ(machine.chip8.I, 0x400);
}

TEST(InterpreterTest, RegisterBlockEndingAtLastByte)
{
    TestMachine machine({0x60, 0x11, 0x61, 0x22, 0x62, 0x33, 0xAF, 0xFD, 0xF2, 0x55});

    EXPECT_EQ(machine.run(5), Chip8::CONTINUE);
    EXPECT_EQ(machine.memory.read(0xFFF), 0x33);
    EXPECT_EQ(machine.chip8.I, 0x000);
}

TEST(InterpreterTest, HaltStopsWithExitCode)
{
    TestMachine machine({0x00, 0xE0, 0xF5, 0xFF, 0x60, 0x01});

    machine.step();
    EXPECT_EQ(machine.step(), Chip8::EXIT_INTERPRETER);
    EXPECT_EQ(machine.chip8.exitCode, 5);
    EXPECT_EQ(machine.chip8.state, Chip8::EXITED);

    EXPECT_EQ(machine.step(), Chip8::EXIT_INTERPRETER);
    EXPECT_EQ(machine.chip8.registers[0], 0);
}

TEST(InterpreterTest, JumpIntoInterpreterAreaHalts)
{
    TestMachine machine({0x11, 0x00});

    machine.step();

    EXPECT_EQ(machine.step(), Chip8::EXIT_INTERPRETER);
    EXPECT_EQ(machine.chip8.exitCode, 0xF);
}

TEST(InterpreterTest, StraightLineInstructionsAdvancePCByTwo)
{
    for(uint16_t word : {0x00E0, 0x6A12, 0x7A12, 0x8AB4, 0x8AB6, 0xA300, 0xC0FF, 0xD015,
            0xF007, 0xF015, 0xF018, 0xF01E, 0xF029, 0xF033, 0xF055, 0xF065}) {
        TestMachine machine({(uint8_t)(word >> 8), (uint8_t)(word & 0xFF)});
        EXPECT_EQ(machine.step(), Chip8::CONTINUE) << std::hex << word;
        EXPECT_EQ(machine.chip8.pc, 0x202) << std::hex << word;
    }
}

TEST(InterpreterTest, SameInstructionFromSameStateIsDeterministic)
{
    for(uint16_t word : {0x00E0, 0x2300, 0x3A07, 0x6A12, 0x7A12, 0x8AB4, 0x8AB5, 0x8AB6, 0x8AB7,
            0x8ABE, 0xA300, 0xB210, 0xD125, 0xE09E, 0xF00A, 0xF033, 0xF455, 0xF465, 0xF51E}) {
        TestMachine first({(uint8_t)(word >> 8), (uint8_t)(word & 0xFF)});
        for(int i = 0; i < REGISTER_COUNT; i++) {
            first.chip8.registers[i] = 0x07 + i * 0x13;
        }
        first.chip8.I = 0x300;
        first.peripherals.screen.draw(5, 5);
        TestMachine second = first;

        EXPECT_EQ(first.step(), second.step()) << std::hex << word;
        EXPECT_EQ(first.chip8.registers, second.chip8.registers) << std::hex << word;
        EXPECT_EQ(first.chip8.pc, second.chip8.pc) << std::hex << word;
        EXPECT_EQ(first.chip8.I, second.chip8.I) << std::hex << word;
        EXPECT_EQ(first.chip8.sp, second.chip8.sp) << std::hex << word;
        EXPECT_EQ(first.chip8.stack, second.chip8.stack) << std::hex << word;
        EXPECT_EQ(first.memory.memory, second.memory.memory) << std::hex << word;
        EXPECT_EQ(first.peripherals.screen.display, second.peripherals.screen.display) << std::hex << word;
    }
}

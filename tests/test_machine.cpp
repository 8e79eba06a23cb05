/**
 * test_machine.cpp
 *
 * Initial machine state and its overrides.
 */

#include <gtest/gtest.h>
#include "machine.hpp"
#include "cpu.hpp"

TEST(Machine, FreshStateIsReady) {
    auto m = create_machine("li $t0, 1\n");
    EXPECT_EQ(m.status, Status::READY);
    EXPECT_EQ(m.pc, 0);
    EXPECT_EQ(m.steps, 0);
    EXPECT_TRUE(m.output.empty());
    EXPECT_TRUE(m.error.empty());
    EXPECT_TRUE(m.touched_registers.empty());
    EXPECT_TRUE(m.touched_memory.empty());
    EXPECT_EQ(m.source, "li $t0, 1\n");
    ASSERT_NE(m.program, nullptr);
    EXPECT_EQ(m.program->size(), 1u);
    for (SignedWord v : m.registers.get_all()) {
        EXPECT_EQ(v, 0);
    }
}

TEST(Machine, RegisterOverrides) {
    auto m = create_machine("syscall\n", {{"$t0", 5}, {"$sp", -16}, {"$zero", 9}, {"$bogus", 1}, {"t1", 3}});
    EXPECT_EQ(m.registers.read(reg_index("$t0")), 5);
    EXPECT_EQ(m.registers.read(reg_index("$sp")), -16);
    EXPECT_EQ(m.registers.read(reg_index("$t1")), 0);
    EXPECT_EQ(m.registers.get_all()[REG_ZERO], 0);
    EXPECT_TRUE(m.touched_registers.empty());
}

TEST(Machine, MemoryOverrides) {
    auto m = create_machine("syscall\n", {}, {{"0x10", 7}, {"-4", 3}, {"junk", 1}, {"20", -1}});
    EXPECT_EQ(m.memory.read_word(16), 7);
    EXPECT_EQ(m.memory.read_word(-4), 3);
    EXPECT_EQ(m.memory.read_word(20), -1);
    EXPECT_EQ(m.memory.words_used(), 3u);
    EXPECT_TRUE(m.touched_memory.empty());
}

TEST(Machine, LoadFailureYieldsErrorState) {
    auto m = create_machine(".data\nx: .word 1\n", {{"$t0", 5}});
    EXPECT_EQ(m.status, Status::ERROR);
    EXPECT_EQ(m.error, "No MIPS instructions found in .text section.");
    EXPECT_EQ(m.steps, 0);
    ASSERT_NE(m.program, nullptr);
    EXPECT_EQ(m.program->size(), 0u);
    EXPECT_EQ(m.registers.read(reg_index("$t0")), 0);

    auto after = CPU::step(m);
    EXPECT_EQ(after.status, Status::ERROR);
    EXPECT_EQ(after.steps, 0);
}

TEST(Machine, SharesLoadedProgram) {
    Loader loader;
    auto res = loader.load("li $t0, 1\nli $t1, 2\n");
    ASSERT_TRUE(res.success);

    auto a = init_machine(res.program, res.source, {{"$t2", 1}});
    auto b = init_machine(res.program, res.source, {{"$t2", 2}});
    EXPECT_EQ(a.program, b.program);

    auto end_a = CPU::run(a);
    auto end_b = CPU::run(b);
    EXPECT_EQ(end_a.registers.read(reg_index("$t2")), 1);
    EXPECT_EQ(end_b.registers.read(reg_index("$t2")), 2);
    EXPECT_EQ(end_a.registers.read(reg_index("$t1")), 2);
}

TEST(Machine, CurrentInstruction) {
    auto m = create_machine("li $t0, 1\nsyscall\n");
    ASSERT_NE(m.current_instruction(), nullptr);
    EXPECT_EQ(m.current_instruction()->type, InsType::LI);

    m.pc = 2;
    EXPECT_EQ(m.current_instruction(), nullptr);
    m.pc = -1;
    EXPECT_EQ(m.current_instruction(), nullptr);
}

TEST(Machine, StatusNames) {
    EXPECT_EQ(status_name(Status::READY), "ready");
    EXPECT_EQ(status_name(Status::HALTED), "halted");
    EXPECT_EQ(status_name(Status::ERROR), "error");
}

TEST(RegisterFile, RejectsOutOfRangeIndices) {
    RegisterFile regs;
    EXPECT_THROW(regs.read(32), std::out_of_range);
    EXPECT_THROW(regs.write(-2, 1), std::out_of_range);
    EXPECT_EQ(regs.read(NO_REGISTER), 0);
    EXPECT_NO_THROW(regs.write(NO_REGISTER, 1));
}

TEST(Memory, SparseWords) {
    Memory mem;
    EXPECT_EQ(mem.read_word(12345), 0);
    EXPECT_FALSE(mem.contains(12345));
    mem.write_word(-2147483647 - 1, 8);
    EXPECT_EQ(mem.read_word(-2147483647 - 1), 8);
    EXPECT_EQ(mem.words_used(), 1u);
    mem.reset();
    EXPECT_EQ(mem.words_used(), 0u);
}

/**
 * test_emulator.cpp
 *
 * Inspector shell commands.
 */

#include <gtest/gtest.h>
#include "emulator.hpp"
#include <cstdio>

namespace {

const char* const HELLO =
    ".data\nmsg: .asciiz \"Hi\\n\"\n.text\nmain:\nli $v0,4\nla $a0,msg\nsyscall\nli $v0,10\nsyscall\n";

std::string command(Emulator& emu, const std::string& input) {
    ::testing::internal::CaptureStdout();
    emu.execute_command(input);
    return ::testing::internal::GetCapturedStdout();
}

}  // namespace

TEST(Emulator, CommandsNeedAProgram) {
    Emulator emu;
    EXPECT_FALSE(emu.is_loaded());
    EXPECT_NE(command(emu, "run").find("No program loaded"), std::string::npos);
    EXPECT_NE(command(emu, "step").find("No program loaded"), std::string::npos);
    EXPECT_NE(command(emu, "regs").find("No program loaded"), std::string::npos);
}

TEST(Emulator, RunPrintsOutputAndHalts) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source(HELLO));
    std::string out = command(emu, "run");
    EXPECT_NE(out.find("Hi\n"), std::string::npos);
    EXPECT_NE(out.find("Program halted after 5 steps"), std::string::npos);
    EXPECT_EQ(emu.current().status, Status::HALTED);
    EXPECT_EQ(emu.current().output, "Hi\n");
}

TEST(Emulator, StepAndRewind) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source(HELLO));
    EXPECT_EQ(emu.history_size(), 1u);

    std::string out = command(emu, "step 2");
    EXPECT_NE(out.find("li $v0, 4"), std::string::npos);
    EXPECT_NE(out.find("la $a0, 0x10010000"), std::string::npos);
    EXPECT_EQ(emu.current().pc, 2);
    EXPECT_EQ(emu.history_size(), 3u);

    command(emu, "back");
    EXPECT_EQ(emu.current().pc, 1);
    EXPECT_EQ(emu.current().steps, 1);

    command(emu, "back 10");
    EXPECT_EQ(emu.history_size(), 1u);
    EXPECT_EQ(emu.current().pc, 0);
}

TEST(Emulator, StepStopsAtTerminalState) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source("li $t0, 1\n"));
    std::string out = command(emu, "step 5");
    EXPECT_NE(out.find("Program halted"), std::string::npos);
    EXPECT_NE(out.find("Machine is halted"), std::string::npos);
    EXPECT_EQ(emu.history_size(), 3u);
}

TEST(Emulator, ReportsErrors) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source("foo $t0,$t1\n"));
    std::string out = command(emu, "run");
    EXPECT_NE(out.find("Error at [0]: Unsupported instruction: foo $t0,$t1"), std::string::npos);

    out = command(emu, "status");
    EXPECT_NE(out.find("Status: error"), std::string::npos);
}

TEST(Emulator, InitialRegisterOverride) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source("add $t1, $t0, $t0\n"));
    command(emu, "set $t0 21");
    command(emu, "run");
    EXPECT_EQ(emu.current().registers.read(reg_index("$t1")), 42);

    // Overrides survive a reset
    command(emu, "reset");
    EXPECT_EQ(emu.current().registers.read(reg_index("$t0")), 21);
    EXPECT_EQ(emu.current().steps, 0);

    EXPECT_NE(command(emu, "set $zero 1").find("Cannot set register"), std::string::npos);
}

TEST(Emulator, InitialMemoryOverride) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source("lw $t0, 0x20\n"));
    command(emu, "setmem 0x20 7");
    command(emu, "run");
    EXPECT_EQ(emu.current().registers.read(reg_index("$t0")), 7);

    std::string out = command(emu, "mem");
    EXPECT_NE(out.find("0x00000020"), std::string::npos);
}

TEST(Emulator, LoadFailureKeepsNothingLoaded) {
    Emulator emu;
    ::testing::internal::CaptureStdout();
    EXPECT_FALSE(emu.load_source("# nothing\n"));
    std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("No MIPS instructions found"), std::string::npos);
    EXPECT_FALSE(emu.is_loaded());
}

TEST(Emulator, LoadFromFile) {
    std::string path = ::testing::TempDir() + "emulator_test_prog.s";
    {
        std::ofstream out(path);
        out << HELLO;
    }

    Emulator emu;
    std::string out = command(emu, "load " + path);
    EXPECT_NE(out.find("Loaded 5 instructions, 1 data labels"), std::string::npos);
    ASSERT_TRUE(emu.is_loaded());
    EXPECT_EQ(emu.current().source, HELLO);
    std::remove(path.c_str());

    out = command(emu, "load /nonexistent/file.s");
    EXPECT_NE(out.find("Cannot open file"), std::string::npos);
    EXPECT_TRUE(emu.is_loaded());
}

TEST(Emulator, ListingAndSymbols) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source(HELLO));

    std::string out = command(emu, "list");
    EXPECT_NE(out.find("main:"), std::string::npos);
    EXPECT_NE(out.find("=> [   0] li $v0, 4"), std::string::npos);

    out = command(emu, "symbols");
    EXPECT_NE(out.find("msg"), std::string::npos);
    EXPECT_NE(out.find("0x10010000"), std::string::npos);
}

TEST(Emulator, RegisterViews) {
    Emulator emu;
    ASSERT_TRUE(emu.load_source("li $t0, -1\n"));
    command(emu, "run");
    EXPECT_NE(command(emu, "reg t0").find("0xffffffff (-1)"), std::string::npos);
    EXPECT_NE(command(emu, "regs").find("$t0  *= 0xffffffff"), std::string::npos);
    EXPECT_NE(command(emu, "reg $nope").find("Unknown register"), std::string::npos);
}

TEST(Emulator, QuitAndUnknownCommands) {
    Emulator emu;
    EXPECT_NE(command(emu, "frobnicate").find("Unknown command"), std::string::npos);
    EXPECT_TRUE(emu.execute_command(""));
    EXPECT_FALSE(emu.execute_command("quit"));
}

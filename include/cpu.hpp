/**
 * cpu.hpp
 *
 * Instruction executor and execution driver.
 * step() executes the instruction at pc on a copy of the given state and
 * returns the copy; run() steps until the machine leaves READY.
 */

#ifndef CPU_HPP
#define CPU_HPP

#include "common.hpp"
#include "machine.hpp"
#include "alu.hpp"

class CPU {
public:
    // Execute one instruction, the input state is left untouched
    static MachineState step(const MachineState& current);

    // Step until halted or error (bounded by MAX_STEPS)
    static MachineState run(const MachineState& start);

private:
    // Stages, all operating on the fresh copy
    static void execute(MachineState& m, const Instruction& ins);
    static void memory_access(MachineState& m, const Instruction& ins);
    static void system_call(MachineState& m);

    static Address effective_address(const MachineState& m, const MemOperand& mem);
    static void writeback(MachineState& m, int reg, SignedWord value);
    static void touch_memory(MachineState& m, Address addr);
    static void fail(MachineState& m, const std::string& msg);
};

#endif // CPU_HPP

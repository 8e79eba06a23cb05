/**
 * machine.hpp
 *
 * Machine state snapshot.
 * One value per point in execution: stepping copies the state and never
 * modifies the snapshot it was given.
 */

#ifndef MACHINE_HPP
#define MACHINE_HPP

#include "common.hpp"
#include "loader.hpp"
#include "memory.hpp"
#include "register_file.hpp"

enum class Status {
    READY,
    HALTED,
    ERROR
};

struct MachineState {
    std::string source;
    std::shared_ptr<const Program> program;
    RegisterFile registers;
    Memory memory;
    std::string output;
    Status status = Status::READY;
    std::string error;
    int pc = 0;                             // Index into program->instructions
    int steps = 0;                          // Executed instructions
    std::vector<int> touched_registers;     // First-write order, no duplicates
    std::vector<Address> touched_memory;    // First-access order, no duplicates

    const Instruction* current_instruction() const;
};

// Caller-supplied overrides, keyed by register name / textual address
using RegisterOverrides = std::map<std::string, SignedWord>;
using MemoryOverrides = std::map<std::string, SignedWord>;

// Load source and build the initial state; a load failure yields an ERROR state
MachineState create_machine(const std::string& source,
                            const RegisterOverrides& initial_registers = {},
                            const MemoryOverrides& initial_memory = {});

// Initial state for an already loaded program
MachineState init_machine(std::shared_ptr<const Program> program,
                          const std::string& source,
                          const RegisterOverrides& initial_registers = {},
                          const MemoryOverrides& initial_memory = {});

std::string status_name(Status status);

#endif // MACHINE_HPP

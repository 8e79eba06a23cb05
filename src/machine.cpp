/**
 * machine.cpp
 *
 * Initial machine state construction.
 */

#include "machine.hpp"

const Instruction* MachineState::current_instruction() const {
    if (!program || pc < 0 || pc >= static_cast<int>(program->size())) return nullptr;
    return &program->instructions[pc];
}

MachineState create_machine(const std::string& source,
                            const RegisterOverrides& initial_registers,
                            const MemoryOverrides& initial_memory) {
    Loader loader;
    Loader::Result loaded = loader.load(source);

    if (!loaded.success) {
        MachineState state;
        state.source = source;
        state.program = std::make_shared<const Program>();
        state.status = Status::ERROR;
        state.error = loaded.errors.empty() ? "Load failed." : loaded.errors.front();
        return state;
    }

    return init_machine(loaded.program, source, initial_registers, initial_memory);
}

MachineState init_machine(std::shared_ptr<const Program> program,
                          const std::string& source,
                          const RegisterOverrides& initial_registers,
                          const MemoryOverrides& initial_memory) {
    MachineState state;
    state.source = source;
    state.program = std::move(program);

    for (const auto& [name, value] : initial_registers) {
        int reg = reg_index(name);
        if (reg == NO_REGISTER || reg == REG_ZERO) continue;
        state.registers.write(reg, value);
    }
    state.registers.clear_zero();

    for (const auto& [key, value] : initial_memory) {
        auto addr = parse_number(key);
        if (!addr) continue;
        state.memory.write_word(*addr, value);
    }

    return state;
}

std::string status_name(Status status) {
    switch (status) {
        case Status::READY:  return "ready";
        case Status::HALTED: return "halted";
        case Status::ERROR:  return "error";
        default:             return "unknown";
    }
}

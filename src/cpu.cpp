/**
 * cpu.cpp
 *
 * Instruction executor.
 * Each step works on a private copy of the state.
 */

#include "cpu.hpp"
#include <algorithm>

// =============================================================================
// Helpers
// =============================================================================

void CPU::writeback(MachineState& m, int reg, SignedWord value) {
    if (reg == NO_REGISTER || reg == REG_ZERO) return;
    m.registers.write(reg, value);
    auto& touched = m.touched_registers;
    if (std::find(touched.begin(), touched.end(), reg) == touched.end()) {
        touched.push_back(reg);
    }
}

void CPU::touch_memory(MachineState& m, Address addr) {
    auto& touched = m.touched_memory;
    if (std::find(touched.begin(), touched.end(), addr) == touched.end()) {
        touched.push_back(addr);
    }
}

void CPU::fail(MachineState& m, const std::string& msg) {
    m.status = Status::ERROR;
    m.error = msg;
}

Address CPU::effective_address(const MachineState& m, const MemOperand& mem) {
    if (mem.mode == OperandMode::BASE_OFFSET) {
        return ALU::execute(AluOp::ADD, m.registers.read(mem.base), mem.offset);
    }
    return mem.offset;
}

// =============================================================================
// Memory Access
// =============================================================================

void CPU::memory_access(MachineState& m, const Instruction& ins) {
    Address addr = effective_address(m, ins.mem);

    if (ins.type == InsType::LW) {
        writeback(m, ins.rd, m.memory.read_word(addr));
    } else {
        m.memory.write_word(addr, m.registers.read(ins.rs));
    }
    touch_memory(m, addr);
}

// =============================================================================
// Syscall
// =============================================================================

void CPU::system_call(MachineState& m) {
    SignedWord v0 = m.registers.read(REG_V0);
    SignedWord a0 = m.registers.read(REG_A0);

    switch (v0) {
        case 1:     // print integer
            m.output += std::to_string(a0);
            break;
        case 4: {   // print string
            auto it = m.program->data_strings.find(a0);
            if (it != m.program->data_strings.end()) {
                m.output += it->second;
            }
            break;
        }
        case 10:    // exit
            m.status = Status::HALTED;
            break;
        case 11: {  // print character, UTF-8 above 0x7F
            unsigned c = static_cast<Word>(a0) & 0xFF;
            if (c < 0x80) {
                m.output += static_cast<char>(c);
            } else {
                m.output += static_cast<char>(0xC0 | (c >> 6));
                m.output += static_cast<char>(0x80 | (c & 0x3F));
            }
            break;
        }
        default:
            fail(m, "Unsupported syscall: " + std::to_string(v0));
            break;
    }
}

// =============================================================================
// Execute
// =============================================================================

void CPU::execute(MachineState& m, const Instruction& ins) {
    int next_pc = m.pc + 1;

    switch (ins.type) {
        case InsType::LI:
        case InsType::LA:
            writeback(m, ins.rd, ins.imm);
            break;

        case InsType::MOVE:
            writeback(m, ins.rd, m.registers.read(ins.rs));
            break;

        case InsType::ADDI:
            writeback(m, ins.rd, ALU::execute(AluOp::ADD, m.registers.read(ins.rs), ins.imm));
            break;

        case InsType::ADD:
        case InsType::SUB: {
            AluOp op = (ins.type == InsType::ADD) ? AluOp::ADD : AluOp::SUB;
            writeback(m, ins.rd, ALU::execute(op, m.registers.read(ins.rs), m.registers.read(ins.rt)));
            break;
        }

        case InsType::LW:
        case InsType::SW:
            memory_access(m, ins);
            break;

        case InsType::BEQ:
        case InsType::BNE:
            if (ALU::branch_taken(ins.type, m.registers.read(ins.rs), m.registers.read(ins.rt))) {
                if (ins.target < 0) {
                    fail(m, "Unknown label: " + ins.label);
                    return;
                }
                next_pc = ins.target;
            }
            break;

        case InsType::J:
            next_pc = ins.target;
            break;

        case InsType::SYSCALL:
            system_call(m);
            if (m.status != Status::READY) return;
            break;

        case InsType::INVALID:
        case InsType::UNSUPPORTED:
        default:
            fail(m, ins.error);
            return;
    }

    m.pc = next_pc;
}

// =============================================================================
// Step (execute one instruction)
// =============================================================================

MachineState CPU::step(const MachineState& current) {
    if (current.status != Status::READY) return current;

    MachineState next = current;

    const Instruction* ins = current.current_instruction();
    if (!ins) {
        next.status = Status::HALTED;
        return next;
    }

    if (current.steps >= MAX_STEPS) {
        next.status = Status::ERROR;
        next.error = "MIPS execution timed out.";
        return next;
    }

    next.steps++;
    execute(next, *ins);
    next.registers.clear_zero();

    return next;
}

// =============================================================================
// Run
// =============================================================================

MachineState CPU::run(const MachineState& start) {
    MachineState state = start;
    while (state.status == Status::READY) {
        state = step(state);
    }
    return state;
}

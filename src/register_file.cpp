/**
 * register_file.cpp
 *
 * Implementation of the 32 named registers.
 */

#include "register_file.hpp"
#include <algorithm>

RegisterFile::RegisterFile() {
    reset();
}

void RegisterFile::reset() {
    regs.fill(0);
}

SignedWord RegisterFile::read(int reg) const {
    if (reg == NO_REGISTER) return 0;
    if (reg < 0 || reg >= NUM_REGISTERS) {
        throw std::out_of_range("Invalid register: " + std::to_string(reg));
    }
    // $zero always returns 0
    return (reg == REG_ZERO) ? 0 : regs[reg];
}

void RegisterFile::write(int reg, SignedWord value) {
    if (reg == NO_REGISTER) return;
    if (reg < 0 || reg >= NUM_REGISTERS) {
        throw std::out_of_range("Invalid register: " + std::to_string(reg));
    }
    // Writes to $zero are ignored
    if (reg != REG_ZERO) {
        regs[reg] = value;
    }
}

void RegisterFile::clear_zero() {
    regs[REG_ZERO] = 0;
}

void RegisterFile::dump(const std::vector<int>& touched) const {
    std::cout << "Registers:\n";
    for (int row = 0; row < 8; row++) {
        std::cout << "  ";
        for (int col = 0; col < 4; col++) {
            int reg = row * 4 + col;
            bool mark = std::find(touched.begin(), touched.end(), reg) != touched.end();
            std::cout << std::setw(5) << std::left << reg_name(reg)
                      << (mark ? "*" : " ") << "= " << to_hex(static_cast<Word>(regs[reg]));
            if (col < 3) std::cout << "  ";
        }
        std::cout << "\n";
    }
    std::cout << std::right;
}

void RegisterFile::dump_reg(int reg) const {
    if (reg < 0 || reg >= NUM_REGISTERS) {
        std::cout << "Invalid register: " << reg << "\n";
        return;
    }
    std::cout << reg_name(reg) << " (r" << reg << ")"
              << " = " << to_hex(static_cast<Word>(regs[reg]))
              << " (" << regs[reg] << ")\n";
}

const std::array<SignedWord, NUM_REGISTERS>& RegisterFile::get_all() const {
    return regs;
}

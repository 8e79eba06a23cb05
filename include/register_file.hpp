/**
 * register_file.hpp
 *
 * 32 named MIPS registers ($zero ... $ra).
 * $zero is hardwired to zero.
 */

#ifndef REGISTER_FILE_HPP
#define REGISTER_FILE_HPP

#include "common.hpp"

class RegisterFile {
public:
    RegisterFile();
    void reset();

    // Read register value (NO_REGISTER reads as 0)
    SignedWord read(int reg) const;

    // Write register value (writes to $zero and NO_REGISTER are ignored)
    void write(int reg, SignedWord value);

    // Force $zero back to 0
    void clear_zero();

    // Display, touched registers are marked with '*'
    void dump(const std::vector<int>& touched = {}) const;
    void dump_reg(int reg) const;

    // Direct access for inspection
    const std::array<SignedWord, NUM_REGISTERS>& get_all() const;

private:
    std::array<SignedWord, NUM_REGISTERS> regs;
};

#endif // REGISTER_FILE_HPP

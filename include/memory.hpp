/**
 * memory.hpp
 *
 * Word memory for the MIPS emulator.
 * Sparse storage keyed by 32-bit signed address. Each address holds one
 * whole word; addresses are never bounds-checked or aligned.
 */

#ifndef MEMORY_HPP
#define MEMORY_HPP

#include "common.hpp"

class Memory {
public:
    Memory();
    void reset();

    // Word access (unset addresses read as 0)
    SignedWord read_word(Address addr) const;
    void write_word(Address addr, SignedWord value);

    bool contains(Address addr) const;

    // Display
    void dump(const std::vector<Address>& touched = {}) const;
    void dump_words(Address start, size_t count = 8) const;

    // Stats
    size_t words_used() const;

    const std::map<Address, SignedWord>& get_all() const;

private:
    std::map<Address, SignedWord> mem;
};

#endif // MEMORY_HPP

/**
 * memory.cpp
 *
 * Implementation of the word memory.
 * Uses sparse storage (std::map) so the full 32-bit address space is usable.
 */

#include "memory.hpp"
#include <algorithm>

Memory::Memory() {}

void Memory::reset() {
    mem.clear();
}

// =============================================================================
// Word Access
// =============================================================================

SignedWord Memory::read_word(Address addr) const {
    auto it = mem.find(addr);
    return (it != mem.end()) ? it->second : 0;
}

void Memory::write_word(Address addr, SignedWord value) {
    mem[addr] = value;
}

bool Memory::contains(Address addr) const {
    return mem.find(addr) != mem.end();
}

// =============================================================================
// Display
// =============================================================================

void Memory::dump(const std::vector<Address>& touched) const {
    if (mem.empty()) {
        std::cout << "Memory: (empty)\n";
        return;
    }
    std::cout << "Memory (" << mem.size() << " words):\n";
    for (const auto& [addr, val] : mem) {
        bool mark = std::find(touched.begin(), touched.end(), addr) != touched.end();
        std::cout << (mark ? " *" : "  ") << to_hex(static_cast<Word>(addr)) << ": "
                  << to_hex(static_cast<Word>(val)) << "  (" << val << ")\n";
    }
}

void Memory::dump_words(Address start, size_t count) const {
    std::cout << "Memory words [" << to_hex(static_cast<Word>(start)) << "]:\n";
    for (size_t i = 0; i < count; i++) {
        Address addr = wrap32(static_cast<int64_t>(start) + static_cast<int64_t>(i) * 4);
        SignedWord val = read_word(addr);
        std::cout << "  " << to_hex(static_cast<Word>(addr)) << ": "
                  << to_hex(static_cast<Word>(val)) << "\n";
    }
}

// =============================================================================
// Stats
// =============================================================================

size_t Memory::words_used() const {
    return mem.size();
}

const std::map<Address, SignedWord>& Memory::get_all() const {
    return mem;
}

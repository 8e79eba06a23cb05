/**
 * common.hpp
 *
 * Shared types, constants, and utility functions used throughout the emulator.
 */

#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <optional>
#include <limits>

// =============================================================================
// Basic Types
// =============================================================================

using Word = uint32_t;          // 32-bit unsigned (raw bit pattern)
using SignedWord = int32_t;     // 32-bit signed (register and memory values)
using Address = int32_t;        // Memory address (signed, arbitrary sign)

constexpr int NUM_REGISTERS = 32;
constexpr int NO_REGISTER = -1;         // Operand named a register outside the table

constexpr int MAX_STEPS = 10000;        // Step ceiling, the only termination guarantee
constexpr Address DATA_BASE = 0x10010000;

// =============================================================================
// Instruction Types
// =============================================================================

enum class InsType {
    // Loads / moves
    LI, LA, MOVE,
    // Arithmetic
    ADDI, ADD, SUB,
    // Memory
    LW, SW,
    // Control transfer
    BEQ, BNE, J,
    // System
    SYSCALL,
    // Recognized mnemonic with a bad operand (fails when executed)
    INVALID,
    // No pattern matched (fails when executed)
    UNSUPPORTED
};

// =============================================================================
// ALU Operations
// =============================================================================

enum class AluOp {
    ADD, SUB,
    NONE
};

// =============================================================================
// Memory Operand
// =============================================================================

enum class OperandMode {
    BASE_OFFSET,    // offset($base)
    ABSOLUTE        // data label or literal address
};

struct MemOperand {
    OperandMode mode = OperandMode::ABSOLUTE;
    int base = NO_REGISTER;
    SignedWord offset = 0;      // Offset, or the full address when ABSOLUTE
};

// =============================================================================
// Decoded Instruction
// =============================================================================

struct Instruction {
    InsType type = InsType::UNSUPPORTED;

    int rd = NO_REGISTER;       // Destination (li, la, move, addi, add, sub, lw)
    int rs = NO_REGISTER;       // Source 1 (move, addi, add, sub, sw, beq, bne)
    int rt = NO_REGISTER;       // Source 2 (add, sub, beq, bne)
    SignedWord imm = 0;         // Immediate, or the resolved address for la
    MemOperand mem;             // lw / sw address operand

    std::string label;          // Branch / jump label as written
    int target = -1;            // Resolved instruction index, -1 if unknown

    std::string text;           // Source line as written
    std::string error;          // Deferred failure message (INVALID / UNSUPPORTED)
};

// =============================================================================
// Utility Functions
// =============================================================================

// Truncate to 32-bit two's complement
inline SignedWord wrap32(int64_t value) {
    return static_cast<SignedWord>(static_cast<Word>(static_cast<uint64_t>(value)));
}

// Format as hex string
inline std::string to_hex(Word value, int width = 8) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(width) << value;
    return oss.str();
}

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

inline std::string to_lower(const std::string& s) {
    std::string r = s;
    for (char& c : r) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return r;
}

inline bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

/**
 * Parse an integer literal.
 *
 * "-?0x[hex]+" as a whole is hexadecimal. Anything else is read as a decimal
 * prefix: optional sign, at least one digit, stopping at the first non-digit.
 * The value is reduced modulo 2^32.
 */
inline std::optional<SignedWord> parse_number(const std::string& raw) {
    std::string t = trim(raw);
    if (t.empty()) return std::nullopt;

    size_t i = 0;
    bool negative = false;

    // Hex: the whole token must be hex digits after the prefix
    size_t h = (t[0] == '-') ? 1 : 0;
    if (t.size() > h + 2 && t[h] == '0' && (t[h + 1] == 'x' || t[h + 1] == 'X')) {
        Word val = 0;
        bool all_hex = true;
        for (size_t k = h + 2; k < t.size(); k++) {
            char c = t[k];
            Word digit;
            if (c >= '0' && c <= '9') digit = c - '0';
            else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
            else { all_hex = false; break; }
            val = val * 16 + digit;
        }
        if (all_hex) {
            if (h) val = 0U - val;
            return static_cast<SignedWord>(val);
        }
    }

    if (t[i] == '-' || t[i] == '+') {
        negative = (t[i] == '-');
        i++;
    }

    Word val = 0;
    size_t digits = 0;
    while (i < t.size() && t[i] >= '0' && t[i] <= '9') {
        val = val * 10 + static_cast<Word>(t[i] - '0');
        i++;
        digits++;
    }
    if (digits == 0) return std::nullopt;

    if (negative) val = 0U - val;
    return static_cast<SignedWord>(val);
}

// =============================================================================
// Registers
// =============================================================================

// Register names in hardware order ($zero = 0 ... $ra = 31)
inline const std::array<std::string, NUM_REGISTERS>& register_names() {
    static const std::array<std::string, NUM_REGISTERS> names = {
        "$zero", "$at", "$v0", "$v1", "$a0", "$a1", "$a2", "$a3",
        "$t0", "$t1", "$t2", "$t3", "$t4", "$t5", "$t6", "$t7",
        "$s0", "$s1", "$s2", "$s3", "$s4", "$s5", "$s6", "$s7",
        "$t8", "$t9", "$k0", "$k1", "$gp", "$sp", "$fp", "$ra"
    };
    return names;
}

// Register name for an index
inline std::string reg_name(int reg) {
    if (reg >= 0 && reg < NUM_REGISTERS) return register_names()[reg];
    return "$?";
}

// Exact (case-sensitive) lookup, NO_REGISTER when unknown
inline int reg_index(const std::string& name) {
    static const std::map<std::string, int> table = [] {
        std::map<std::string, int> m;
        for (int i = 0; i < NUM_REGISTERS; i++) m[register_names()[i]] = i;
        return m;
    }();
    auto it = table.find(name);
    return (it != table.end()) ? it->second : NO_REGISTER;
}

constexpr int REG_ZERO = 0;
constexpr int REG_V0 = 2;
constexpr int REG_A0 = 4;

// Instruction type to string
inline std::string ins_name(InsType type) {
    switch (type) {
        case InsType::LI: return "li";
        case InsType::LA: return "la";
        case InsType::MOVE: return "move";
        case InsType::ADDI: return "addi";
        case InsType::ADD: return "add";
        case InsType::SUB: return "sub";
        case InsType::LW: return "lw";
        case InsType::SW: return "sw";
        case InsType::BEQ: return "beq";
        case InsType::BNE: return "bne";
        case InsType::J: return "j";
        case InsType::SYSCALL: return "syscall";
        case InsType::INVALID: return "invalid";
        default: return "unknown";
    }
}

#endif // COMMON_HPP

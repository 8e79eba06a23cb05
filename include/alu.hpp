/**
 * alu.hpp
 *
 * Arithmetic Logic Unit.
 * 32-bit two's-complement add/subtract with wraparound, and branch conditions.
 */

#ifndef ALU_HPP
#define ALU_HPP

#include "common.hpp"

class ALU {
public:
    // Execute an ALU operation (never traps on overflow)
    static SignedWord execute(AluOp op, SignedWord a, SignedWord b);

    // Evaluate branch condition
    static bool branch_taken(InsType type, SignedWord rs_val, SignedWord rt_val);
};

#endif // ALU_HPP

/**
 * alu.cpp
 *
 * Implementation of ALU operations.
 */

#include "alu.hpp"

SignedWord ALU::execute(AluOp op, SignedWord a, SignedWord b) {
    // Unsigned arithmetic gives the wraparound result without signed overflow
    Word ua = static_cast<Word>(a);
    Word ub = static_cast<Word>(b);

    switch (op) {
        case AluOp::ADD:
            return static_cast<SignedWord>(ua + ub);
        case AluOp::SUB:
            return static_cast<SignedWord>(ua - ub);

        case AluOp::NONE:
        default:
            return 0;
    }
}

bool ALU::branch_taken(InsType type, SignedWord rs_val, SignedWord rt_val) {
    switch (type) {
        case InsType::BEQ:  return rs_val == rt_val;
        case InsType::BNE:  return rs_val != rt_val;
        default:            return false;
    }
}

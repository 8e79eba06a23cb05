/**
 * decoder.hpp
 *
 * Instruction decoder.
 * Matches one line of assembly text against the supported forms, resolves
 * registers, immediates, labels and memory operands, and produces a decoded
 * Instruction. Operand errors are stored on the instruction and reported
 * only when it executes.
 */

#ifndef DECODER_HPP
#define DECODER_HPP

#include "common.hpp"
#include "loader.hpp"

class Decoder {
public:
    // Decode one instruction line against the program's label tables
    static Instruction decode(const std::string& text, const Program& program);

    // Canonical text form for listings
    static std::string disassemble(const Instruction& ins);

private:
    // Operand shape checks
    static bool is_register_token(const std::string& s);
    static bool is_label_token(const std::string& s);
    static bool is_immediate_token(const std::string& s);

    // Split on every comma, keeping empty operands
    static std::vector<std::string> split_operands(const std::string& s);

    // Resolve an lw / sw address operand
    static bool parse_mem(const std::string& s, const Program& program, MemOperand& out);

    // Per-form matchers, false when the form does not apply
    static bool match_li(const std::vector<std::string>& ops, Instruction& ins);
    static bool match_la(const std::vector<std::string>& ops, const Program& program, Instruction& ins);
    static bool match_move(const std::vector<std::string>& ops, Instruction& ins);
    static bool match_addi(const std::vector<std::string>& ops, Instruction& ins);
    static bool match_arith(const std::string& mnem, const std::vector<std::string>& ops, Instruction& ins);
    static bool match_mem(const std::string& mnem, const std::string& rest, const Program& program, Instruction& ins);
    static bool match_branch(const std::string& mnem, const std::vector<std::string>& ops, const Program& program, Instruction& ins);
    static bool match_jump(const std::string& rest, const Program& program, Instruction& ins);

    static void invalid(Instruction& ins, const std::string& msg);
};

#endif // DECODER_HPP

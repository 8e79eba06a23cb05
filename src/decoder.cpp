/**
 * decoder.cpp
 *
 * Implementation of instruction decoding.
 */

#include "decoder.hpp"

static const char* const WHITESPACE = " \t\r\n\f\v";

// =============================================================================
// Operand Shapes
// =============================================================================

// $ followed by one or more word characters
bool Decoder::is_register_token(const std::string& s) {
    if (s.size() < 2 || s[0] != '$') return false;
    for (size_t i = 1; i < s.size(); i++) {
        if (!is_word_char(s[i])) return false;
    }
    return true;
}

// [A-Za-z_.$][A-Za-z0-9_.$]*
bool Decoder::is_label_token(const std::string& s) {
    if (s.empty()) return false;
    char c = s[0];
    bool start = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                 c == '_' || c == '.' || c == '$';
    if (!start) return false;
    for (size_t i = 1; i < s.size(); i++) {
        if (!is_word_char(s[i]) && s[i] != '.' && s[i] != '$') return false;
    }
    return true;
}

// One token without commas or whitespace; its value is checked separately
bool Decoder::is_immediate_token(const std::string& s) {
    return !s.empty() && s.find_first_of(WHITESPACE) == std::string::npos &&
           s.find(',') == std::string::npos;
}

std::vector<std::string> Decoder::split_operands(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            out.push_back(trim(s.substr(start)));
            break;
        }
        out.push_back(trim(s.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

// =============================================================================
// Memory Operands
// =============================================================================

bool Decoder::parse_mem(const std::string& s, const Program& program, MemOperand& out) {
    // offset($base)
    if (!s.empty() && s.back() == ')') {
        size_t lp = s.rfind('(');
        if (lp != std::string::npos && lp > 0) {
            std::string inner = s.substr(lp + 1, s.size() - lp - 2);
            if (is_register_token(inner)) {
                auto offset = parse_number(s.substr(0, lp));
                int base = reg_index(inner);
                if (!offset || base == NO_REGISTER) return false;
                out.mode = OperandMode::BASE_OFFSET;
                out.base = base;
                out.offset = *offset;
                return true;
            }
        }
    }

    // Data label
    auto it = program.data_addresses.find(s);
    if (it != program.data_addresses.end()) {
        out.mode = OperandMode::ABSOLUTE;
        out.offset = it->second;
        return true;
    }

    // Literal address
    auto direct = parse_number(s);
    if (!direct) return false;
    out.mode = OperandMode::ABSOLUTE;
    out.offset = *direct;
    return true;
}

// =============================================================================
// Forms
// =============================================================================

void Decoder::invalid(Instruction& ins, const std::string& msg) {
    ins.type = InsType::INVALID;
    ins.error = msg;
}

bool Decoder::match_li(const std::vector<std::string>& ops, Instruction& ins) {
    if (ops.size() != 2 || !is_register_token(ops[0]) || !is_immediate_token(ops[1])) {
        return false;
    }
    auto value = parse_number(ops[1]);
    if (!value) {
        invalid(ins, "Invalid immediate value: " + ops[1]);
        return true;
    }
    ins.type = InsType::LI;
    ins.rd = reg_index(ops[0]);
    ins.imm = *value;
    return true;
}

bool Decoder::match_la(const std::vector<std::string>& ops, const Program& program, Instruction& ins) {
    if (ops.size() != 2 || !is_register_token(ops[0]) || !is_label_token(ops[1])) {
        return false;
    }
    auto it = program.data_addresses.find(ops[1]);
    if (it == program.data_addresses.end()) {
        invalid(ins, "Unknown data label: " + ops[1]);
        return true;
    }
    ins.type = InsType::LA;
    ins.rd = reg_index(ops[0]);
    ins.imm = it->second;
    return true;
}

bool Decoder::match_move(const std::vector<std::string>& ops, Instruction& ins) {
    if (ops.size() != 2 || !is_register_token(ops[0]) || !is_register_token(ops[1])) {
        return false;
    }
    ins.type = InsType::MOVE;
    ins.rd = reg_index(ops[0]);
    ins.rs = reg_index(ops[1]);
    return true;
}

bool Decoder::match_addi(const std::vector<std::string>& ops, Instruction& ins) {
    if (ops.size() != 3 || !is_register_token(ops[0]) || !is_register_token(ops[1]) ||
        !is_immediate_token(ops[2])) {
        return false;
    }
    auto value = parse_number(ops[2]);
    if (!value) {
        invalid(ins, "Invalid immediate value: " + ops[2]);
        return true;
    }
    ins.type = InsType::ADDI;
    ins.rd = reg_index(ops[0]);
    ins.rs = reg_index(ops[1]);
    ins.imm = *value;
    return true;
}

bool Decoder::match_arith(const std::string& mnem, const std::vector<std::string>& ops, Instruction& ins) {
    if (ops.size() != 3 || !is_register_token(ops[0]) || !is_register_token(ops[1]) ||
        !is_register_token(ops[2])) {
        return false;
    }
    ins.type = (mnem == "add") ? InsType::ADD : InsType::SUB;
    ins.rd = reg_index(ops[0]);
    ins.rs = reg_index(ops[1]);
    ins.rt = reg_index(ops[2]);
    return true;
}

bool Decoder::match_mem(const std::string& mnem, const std::string& rest, const Program& program, Instruction& ins) {
    // The address operand is everything after the first comma
    size_t comma = rest.find(',');
    if (comma == std::string::npos) return false;
    std::string reg = trim(rest.substr(0, comma));
    std::string operand = trim(rest.substr(comma + 1));
    if (!is_register_token(reg) || operand.empty()) return false;

    MemOperand mem;
    if (!parse_mem(operand, program, mem)) {
        invalid(ins, "Invalid memory operand: " + operand);
        return true;
    }

    if (mnem == "lw") {
        ins.type = InsType::LW;
        ins.rd = reg_index(reg);
    } else {
        ins.type = InsType::SW;
        ins.rs = reg_index(reg);
    }
    ins.mem = mem;
    return true;
}

bool Decoder::match_branch(const std::string& mnem, const std::vector<std::string>& ops,
                           const Program& program, Instruction& ins) {
    if (ops.size() != 3 || !is_register_token(ops[0]) || !is_register_token(ops[1]) ||
        !is_label_token(ops[2])) {
        return false;
    }
    ins.type = (mnem == "beq") ? InsType::BEQ : InsType::BNE;
    ins.rs = reg_index(ops[0]);
    ins.rt = reg_index(ops[1]);
    ins.label = ops[2];

    // An unknown target only matters if the branch is taken
    auto it = program.labels.find(ops[2]);
    ins.target = (it != program.labels.end()) ? it->second : -1;
    return true;
}

bool Decoder::match_jump(const std::string& rest, const Program& program, Instruction& ins) {
    if (!is_label_token(rest)) return false;

    auto it = program.labels.find(rest);
    if (it == program.labels.end()) {
        invalid(ins, "Unknown label: " + rest);
        return true;
    }
    ins.type = InsType::J;
    ins.label = rest;
    ins.target = it->second;
    return true;
}

// =============================================================================
// Decode
// =============================================================================

Instruction Decoder::decode(const std::string& line, const Program& program) {
    Instruction ins;
    ins.text = trim(line);

    std::string mnem;
    std::string rest;
    bool has_operands = false;
    size_t sp = ins.text.find_first_of(WHITESPACE);
    if (sp != std::string::npos) {
        mnem = to_lower(ins.text.substr(0, sp));
        rest = trim(ins.text.substr(sp));
        has_operands = true;
    } else {
        mnem = to_lower(ins.text);
    }

    if (has_operands) {
        auto ops = split_operands(rest);

        // First matching form wins
        if (mnem == "li" && match_li(ops, ins)) return ins;
        if (mnem == "la" && match_la(ops, program, ins)) return ins;
        if (mnem == "move" && match_move(ops, ins)) return ins;
        if (mnem == "addi" && match_addi(ops, ins)) return ins;
        if ((mnem == "add" || mnem == "sub") && match_arith(mnem, ops, ins)) return ins;
        if ((mnem == "lw" || mnem == "sw") && match_mem(mnem, rest, program, ins)) return ins;
        if ((mnem == "beq" || mnem == "bne") && match_branch(mnem, ops, program, ins)) return ins;
        if (mnem == "j" && match_jump(rest, program, ins)) return ins;
    } else if (mnem == "syscall") {
        ins.type = InsType::SYSCALL;
        return ins;
    }

    ins.type = InsType::UNSUPPORTED;
    ins.error = "Unsupported instruction: " + ins.text;
    return ins;
}

// =============================================================================
// Disassembly
// =============================================================================

static std::string format_mem(const MemOperand& mem) {
    if (mem.mode == OperandMode::BASE_OFFSET) {
        return std::to_string(mem.offset) + "(" + reg_name(mem.base) + ")";
    }
    return to_hex(static_cast<Word>(mem.offset));
}

std::string Decoder::disassemble(const Instruction& ins) {
    std::ostringstream oss;
    std::string name = ins_name(ins.type);

    switch (ins.type) {
        case InsType::LI:
            oss << name << " " << reg_name(ins.rd) << ", " << ins.imm;
            break;
        case InsType::LA:
            oss << name << " " << reg_name(ins.rd) << ", " << to_hex(static_cast<Word>(ins.imm));
            break;
        case InsType::MOVE:
            oss << name << " " << reg_name(ins.rd) << ", " << reg_name(ins.rs);
            break;
        case InsType::ADDI:
            oss << name << " " << reg_name(ins.rd) << ", " << reg_name(ins.rs) << ", " << ins.imm;
            break;
        case InsType::ADD:
        case InsType::SUB:
            oss << name << " " << reg_name(ins.rd) << ", "
                << reg_name(ins.rs) << ", " << reg_name(ins.rt);
            break;
        case InsType::LW:
            oss << name << " " << reg_name(ins.rd) << ", " << format_mem(ins.mem);
            break;
        case InsType::SW:
            oss << name << " " << reg_name(ins.rs) << ", " << format_mem(ins.mem);
            break;
        case InsType::BEQ:
        case InsType::BNE:
            oss << name << " " << reg_name(ins.rs) << ", " << reg_name(ins.rt) << ", " << ins.label;
            break;
        case InsType::J:
            oss << name << " " << ins.label;
            break;
        case InsType::SYSCALL:
            oss << name;
            break;
        case InsType::INVALID:
        case InsType::UNSUPPORTED:
        default:
            oss << ins.text;
            break;
    }

    return oss.str();
}

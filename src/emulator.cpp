/**
 * emulator.cpp
 *
 * Top-level emulator implementation.
 */

#include "emulator.hpp"
#include "decoder.hpp"
#include <algorithm>
#include <sstream>

Emulator::Emulator()
    : running(true), program_loaded(false) {}

// =============================================================================
// Program Loading
// =============================================================================

bool Emulator::load(const std::string& filename) {
    Loader::Result res = loader.load_file(filename);

    if (!res.success) {
        std::cout << "Load failed:\n";
        for (const auto& err : res.errors) {
            std::cout << "  " << err << "\n";
        }
        return false;
    }

    source = res.source;
    program = res.program;
    restart();

    program_loaded = true;
    std::cout << "Loaded " << program->size() << " instructions, "
              << program->data_addresses.size() << " data labels\n";
    return true;
}

bool Emulator::load_source(const std::string& text) {
    Loader::Result res = loader.load(text);

    if (!res.success) {
        std::cout << "Load failed:\n";
        for (const auto& err : res.errors) {
            std::cout << "  " << err << "\n";
        }
        return false;
    }

    source = text;
    program = res.program;
    restart();

    program_loaded = true;
    return true;
}

// Fresh initial snapshot from the current program and overrides
void Emulator::restart() {
    history.clear();
    history.push_back(init_machine(program, source, initial_registers, initial_memory));
}

// =============================================================================
// Command Loop
// =============================================================================

void Emulator::run() {
    print_welcome();

    std::string input;
    while (running) {
        print_prompt();
        if (!std::getline(std::cin, input)) break;
        if (!execute_command(input)) break;
    }

    std::cout << "Goodbye!\n";
}

bool Emulator::execute_command(const std::string& input) {
    auto tokens = tokenize(input);
    if (tokens.empty()) return true;

    std::string cmd = to_lower(tokens[0]);

    if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        running = false;
        return false;
    }
    else if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    }
    else if (cmd == "load" || cmd == "l") {
        if (tokens.size() < 2) {
            std::cout << "Usage: load <filename>\n";
        } else {
            cmd_load(tokens[1]);
        }
    }
    else if (cmd == "run" || cmd == "r") {
        cmd_run();
    }
    else if (cmd == "step" || cmd == "s") {
        int count = 1;
        if (tokens.size() > 1) {
            auto n = parse_number(tokens[1]);
            if (n) count = *n;
        }
        cmd_step(count);
    }
    else if (cmd == "back" || cmd == "b") {
        int count = 1;
        if (tokens.size() > 1) {
            auto n = parse_number(tokens[1]);
            if (n) count = *n;
        }
        cmd_back(count);
    }
    else if (cmd == "reset") {
        cmd_reset();
    }
    else if (cmd == "regs" || cmd == "registers") {
        cmd_regs();
    }
    else if (cmd == "reg") {
        if (tokens.size() < 2) {
            std::cout << "Usage: reg <register>\n";
        } else {
            cmd_reg(tokens[1]);
        }
    }
    else if (cmd == "mem" || cmd == "memory" || cmd == "m") {
        cmd_mem(std::vector<std::string>(tokens.begin() + 1, tokens.end()));
    }
    else if (cmd == "set") {
        if (tokens.size() < 3) {
            std::cout << "Usage: set <register> <value>\n";
        } else {
            cmd_set(tokens[1], tokens[2]);
        }
    }
    else if (cmd == "setmem") {
        if (tokens.size() < 3) {
            std::cout << "Usage: setmem <address> <value>\n";
        } else {
            cmd_setmem(tokens[1], tokens[2]);
        }
    }
    else if (cmd == "symbols" || cmd == "sym") {
        cmd_symbols();
    }
    else if (cmd == "list" || cmd == "disasm" || cmd == "d") {
        cmd_list();
    }
    else if (cmd == "output" || cmd == "out" || cmd == "o") {
        cmd_output();
    }
    else if (cmd == "status" || cmd == "pc") {
        cmd_status();
    }
    else {
        std::cout << "Unknown command: " << cmd << ". Type 'help' for commands.\n";
    }

    return true;
}

// =============================================================================
// Command Implementations
// =============================================================================

void Emulator::cmd_help() {
    std::cout << "Commands:\n"
              << "  load <file>           Load assembly file\n"
              << "  run                   Run until halt or error\n"
              << "  step [n]              Execute n instructions (default 1)\n"
              << "  back [n]              Rewind n steps (default 1)\n"
              << "  reset                 Restart from the initial state\n"
              << "  regs                  Show all registers\n"
              << "  reg <name>            Show single register\n"
              << "  mem [addr] [n]        Show used memory, or n words from addr\n"
              << "  set <reg> <value>     Set initial register value and reset\n"
              << "  setmem <addr> <value> Set initial memory word and reset\n"
              << "  symbols               Show labels\n"
              << "  list                  Disassemble the program\n"
              << "  output                Show program output\n"
              << "  status                Show pc, steps and status\n"
              << "  quit                  Exit emulator\n";
}

void Emulator::cmd_load(const std::string& filename) {
    load(filename);
}

void Emulator::cmd_run() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    const MachineState& before = history.back();
    MachineState after = CPU::run(before);
    report_transition(before, after);
    history.push_back(std::move(after));
}

void Emulator::cmd_step(int count) {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    for (int i = 0; i < count; i++) {
        const MachineState& before = history.back();
        if (before.status != Status::READY) {
            std::cout << "Machine is " << status_name(before.status) << "\n";
            break;
        }

        if (const Instruction* ins = before.current_instruction()) {
            std::cout << "[" << std::setw(4) << before.pc << "] " << Decoder::disassemble(*ins) << "\n";
        }

        MachineState after = CPU::step(before);
        report_transition(before, after);
        history.push_back(std::move(after));
    }
}

void Emulator::cmd_back(int count) {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    int undone = 0;
    while (undone < count && history.size() > 1) {
        history.pop_back();
        undone++;
    }
    std::cout << "Rewound " << undone << " step(s), pc = " << history.back().pc << "\n";
}

void Emulator::cmd_reset() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    restart();
    std::cout << "Reset complete\n";
}

void Emulator::cmd_regs() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }
    const MachineState& m = history.back();
    m.registers.dump(m.touched_registers);
}

void Emulator::cmd_reg(const std::string& name) {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    std::string r = (!name.empty() && name[0] != '$') ? "$" + name : name;
    int reg = reg_index(r);
    if (reg == NO_REGISTER) {
        std::cout << "Unknown register: " << name << "\n";
        return;
    }
    history.back().registers.dump_reg(reg);
}

void Emulator::cmd_mem(const std::vector<std::string>& args) {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    const MachineState& m = history.back();
    if (args.empty()) {
        m.memory.dump(m.touched_memory);
        return;
    }

    Address addr;
    if (!resolve_address(args[0], addr)) return;

    int count = 8;
    if (args.size() > 1) {
        auto n = parse_number(args[1]);
        if (n && *n > 0) count = *n;
    }
    m.memory.dump_words(addr, static_cast<size_t>(count));
}

void Emulator::cmd_set(const std::string& name, const std::string& value) {
    std::string r = (!name.empty() && name[0] != '$') ? "$" + name : name;
    int reg = reg_index(r);
    if (reg == NO_REGISTER || reg == REG_ZERO) {
        std::cout << "Cannot set register: " << name << "\n";
        return;
    }

    auto v = parse_number(value);
    if (!v) {
        std::cout << "Invalid value: " << value << "\n";
        return;
    }

    initial_registers[r] = *v;
    std::cout << "Initial " << r << " = " << *v << "\n";
    if (program_loaded) cmd_reset();
}

void Emulator::cmd_setmem(const std::string& addr, const std::string& value) {
    auto a = parse_number(addr);
    if (!a) {
        std::cout << "Invalid address: " << addr << "\n";
        return;
    }

    auto v = parse_number(value);
    if (!v) {
        std::cout << "Invalid value: " << value << "\n";
        return;
    }

    initial_memory[addr] = *v;
    std::cout << "Initial [" << to_hex(static_cast<Word>(*a)) << "] = " << *v << "\n";
    if (program_loaded) cmd_reset();
}

void Emulator::cmd_symbols() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    std::cout << "Text labels:\n";
    for (const auto& [name, index] : program->labels) {
        std::cout << "  " << std::setw(6) << index << "  " << name << "\n";
    }
    std::cout << "Data labels:\n";
    for (const auto& [name, addr] : program->data_addresses) {
        std::cout << "  " << to_hex(static_cast<Word>(addr)) << "  " << name << "\n";
    }
}

void Emulator::cmd_list() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    std::multimap<int, std::string> labels_at;
    for (const auto& [name, index] : program->labels) {
        labels_at.emplace(index, name);
    }

    int pc = history.back().pc;
    for (size_t i = 0; i <= program->size(); i++) {
        int index = static_cast<int>(i);
        auto range = labels_at.equal_range(index);
        for (auto it = range.first; it != range.second; ++it) {
            std::cout << it->second << ":\n";
        }
        if (i == program->size()) break;

        const Instruction& ins = program->instructions[i];
        std::cout << (index == pc ? "=> " : "   ") << "[" << std::setw(4) << index << "] "
                  << std::left << std::setw(28) << Decoder::disassemble(ins) << std::right;
        if (!ins.error.empty()) {
            std::cout << "  ; " << ins.error;
        }
        std::cout << "\n";
    }
}

void Emulator::cmd_output() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }
    std::cout << history.back().output;
    if (!history.back().output.empty() && history.back().output.back() != '\n') {
        std::cout << "\n";
    }
}

void Emulator::cmd_status() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    const MachineState& m = history.back();
    std::cout << "Status: " << status_name(m.status) << "\n"
              << "  PC: " << m.pc << " / " << program->size() << "\n"
              << "  Steps: " << m.steps << " (limit " << MAX_STEPS << ")\n";
    if (m.status == Status::ERROR) {
        std::cout << "  Error: " << m.error << "\n";
    }
}

// =============================================================================
// Helpers
// =============================================================================

// Echo new output and any change of status
void Emulator::report_transition(const MachineState& before, const MachineState& after) {
    if (after.output.size() > before.output.size()) {
        std::cout << after.output.substr(before.output.size());
        if (after.output.back() != '\n') std::cout << "\n";
    }

    if (after.status == before.status) return;
    if (after.status == Status::HALTED) {
        std::cout << "Program halted after " << after.steps << " steps\n";
    } else if (after.status == Status::ERROR) {
        std::cout << "Error at [" << after.pc << "]: " << after.error << "\n";
    }
}

void Emulator::print_welcome() {
    std::cout << "\n";
    std::cout << "MIPS Emulator\n";
    std::cout << "Type 'help' for commands\n";
    std::cout << "\n";
}

void Emulator::print_prompt() {
    if (program_loaded) {
        const MachineState& m = history.back();
        std::cout << "[" << status_name(m.status) << " " << m.pc << "] > ";
    } else {
        std::cout << "[no program] > ";
    }
}

bool Emulator::resolve_address(const std::string& str, Address& addr) {
    // Try as data label first
    auto it = program->data_addresses.find(str);
    if (it != program->data_addresses.end()) {
        addr = it->second;
        return true;
    }

    auto n = parse_number(str);
    if (!n) {
        std::cout << "Invalid address: " << str << "\n";
        return false;
    }
    addr = *n;
    return true;
}

std::vector<std::string> Emulator::tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::istringstream ss(input);
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// =============================================================================
// Accessors
// =============================================================================

const MachineState& Emulator::current() const {
    return history.back();
}

size_t Emulator::history_size() const {
    return history.size();
}

bool Emulator::is_loaded() const {
    return program_loaded;
}

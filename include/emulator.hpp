/**
 * emulator.hpp
 *
 * Top-level emulator controller.
 * Interactive inspector over a history of machine snapshots: load, step,
 * run, rewind, and view registers, memory and output.
 */

#ifndef EMULATOR_HPP
#define EMULATOR_HPP

#include "common.hpp"
#include "loader.hpp"
#include "machine.hpp"
#include "cpu.hpp"

class Emulator {
public:
    Emulator();

    // Load program from file
    bool load(const std::string& filename);

    // Load program from string
    bool load_source(const std::string& source);

    // Run the command loop
    void run();

    // Execute a single command, returns false to quit
    bool execute_command(const std::string& input);

    // Latest snapshot (only valid once a program is loaded)
    const MachineState& current() const;
    size_t history_size() const;
    bool is_loaded() const;

private:
    Loader loader;
    std::string source;
    std::shared_ptr<const Program> program;
    RegisterOverrides initial_registers;
    MemoryOverrides initial_memory;
    std::vector<MachineState> history;

    bool running;
    bool program_loaded;

    // Command handlers
    void cmd_help();
    void cmd_load(const std::string& filename);
    void cmd_run();
    void cmd_step(int count);
    void cmd_back(int count);
    void cmd_reset();
    void cmd_regs();
    void cmd_reg(const std::string& name);
    void cmd_mem(const std::vector<std::string>& args);
    void cmd_set(const std::string& name, const std::string& value);
    void cmd_setmem(const std::string& addr, const std::string& value);
    void cmd_symbols();
    void cmd_list();
    void cmd_output();
    void cmd_status();

    // Helpers
    void restart();
    void report_transition(const MachineState& before, const MachineState& after);
    void print_welcome();
    void print_prompt();
    bool resolve_address(const std::string& str, Address& addr);
    std::vector<std::string> tokenize(const std::string& input);
};

#endif // EMULATOR_HPP

/**
 * main.cpp
 *
 * Entry point for the MIPS emulator.
 *
 *   mipsemu [file]          interactive inspector
 *   mipsemu --run <file>    run to completion, print output, exit 1 on error
 */

#include "emulator.hpp"

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--run] [file]\n";
}

// Batch mode: program output on stdout, failures on stderr
static int run_file(const std::string& filename) {
    Loader loader;
    Loader::Result res = loader.load_file(filename);
    if (!res.success) {
        for (const auto& err : res.errors) {
            std::cerr << err << "\n";
        }
        return 1;
    }

    MachineState end = CPU::run(init_machine(res.program, res.source));
    std::cout << end.output;
    std::cout.flush();

    if (end.status == Status::ERROR) {
        std::cerr << "Error at [" << end.pc << "]: " << end.error << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool batch = false;
    std::string filename;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--run" || arg == "-r") {
            batch = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            filename = arg;
        }
    }

    if (batch) {
        if (filename.empty()) {
            print_usage(argv[0]);
            return 1;
        }
        return run_file(filename);
    }

    Emulator emu;

    // If a file is provided as argument, load it
    if (!filename.empty()) {
        emu.load(filename);
    }

    // Run the interactive command loop
    emu.run();

    return 0;
}

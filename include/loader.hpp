/**
 * loader.hpp
 *
 * Program loader for MIPS assembly text.
 * Pass 1 collects instructions, labels and the data segment.
 * Pass 2 decodes every instruction line once.
 */

#ifndef LOADER_HPP
#define LOADER_HPP

#include "common.hpp"
#include <memory>

// Loaded program, immutable once built
struct Program {
    std::vector<Instruction> instructions;
    std::map<std::string, int> labels;              // Text label -> instruction index
    std::map<std::string, Address> data_addresses;  // Data label -> address
    std::map<Address, std::string> data_strings;    // Address -> .asciiz payload

    size_t size() const { return instructions.size(); }
};

enum class LoadError {
    NONE,
    EMPTY_PROGRAM,
    FILE_NOT_FOUND
};

class Loader {
public:
    // Result of loading
    struct Result {
        bool success = false;
        LoadError error = LoadError::NONE;
        std::shared_ptr<const Program> program;
        std::string source;                         // Text that was loaded
        std::vector<std::string> errors;
    };

    // Load from string
    Result load(const std::string& source);

    // Load from file
    Result load_file(const std::string& filename);

private:
    // State during loading
    std::vector<std::string> lines_out;
    std::map<std::string, int> labels;
    std::map<std::string, Address> data_labels;
    std::map<Address, std::string> data_strings;
    Address data_addr;
    bool in_data;

    // Label prefix "name:", returns false when the line has none
    static bool split_label(const std::string& line, std::string& label, std::string& rest);

    // Process a line
    void process_line(const std::string& line);

    // Handle .data directives
    void handle_data(const std::string& line);

    // .asciiz payload with \n and \" expanded
    static bool parse_asciiz(const std::string& line, std::string& out);

    // Number of comma separated .word values, -1 if not a .word line
    static int parse_word_count(const std::string& line);
};

#endif // LOADER_HPP

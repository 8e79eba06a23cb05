/**
 * loader.cpp
 *
 * Program loader implementation.
 * Pass 1: Collect instruction lines, labels, data segment
 * Pass 2: Decode instructions
 */

#include "loader.hpp"
#include "decoder.hpp"
#include <algorithm>

// =============================================================================
// Line Helpers
// =============================================================================

static bool is_label_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           c == '_' || c == '.' || c == '$';
}

static bool is_label_char(char c) {
    return is_word_char(c) || c == '.' || c == '$';
}

static bool starts_with_ci(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return to_lower(s.substr(0, prefix.size())) == prefix;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool Loader::split_label(const std::string& line, std::string& label, std::string& rest) {
    if (line.empty() || !is_label_start(line[0])) return false;

    size_t i = 1;
    while (i < line.size() && is_label_char(line[i])) i++;
    if (i >= line.size() || line[i] != ':') return false;

    label = line.substr(0, i);
    rest = trim(line.substr(i + 1));
    return true;
}

// =============================================================================
// Data Directives
// =============================================================================

bool Loader::parse_asciiz(const std::string& line, std::string& out) {
    if (!starts_with_ci(line, ".asciiz")) return false;

    size_t p = 7;
    if (p >= line.size() || !is_space(line[p])) return false;
    while (p < line.size() && is_space(line[p])) p++;

    // Payload runs from the opening quote to the final quote of the line
    if (p >= line.size() || line[p] != '"') return false;
    if (line.size() - p < 2 || line.back() != '"') return false;

    std::string raw = line.substr(p + 1, line.size() - p - 2);

    std::string step;
    for (size_t i = 0; i < raw.size(); i++) {
        if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == 'n') {
            step += '\n';
            i++;
        } else {
            step += raw[i];
        }
    }

    out.clear();
    for (size_t i = 0; i < step.size(); i++) {
        if (step[i] == '\\' && i + 1 < step.size() && step[i + 1] == '"') {
            out += '"';
            i++;
        } else {
            out += step[i];
        }
    }
    return true;
}

int Loader::parse_word_count(const std::string& line) {
    if (!starts_with_ci(line, ".word")) return -1;

    size_t p = 5;
    if (p >= line.size() || !is_space(line[p])) return -1;
    std::string values = trim(line.substr(p));
    if (values.empty()) return -1;

    int count = 0;
    std::stringstream ss(values);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        if (!trim(tok).empty()) count++;
    }
    return count;
}

void Loader::handle_data(const std::string& line) {
    std::string str;
    if (parse_asciiz(line, str)) {
        data_strings[data_addr] = str;
        data_addr = wrap32(static_cast<int64_t>(data_addr) + static_cast<int64_t>(str.size()) + 1);
        return;
    }

    int count = parse_word_count(line);
    if (count >= 0) {
        data_addr = wrap32(static_cast<int64_t>(data_addr) + std::max(1, count) * 4);
        return;
    }

    // Other directives are accepted and ignored
}

// =============================================================================
// Process Line
// =============================================================================

void Loader::process_line(const std::string& orig) {
    std::string line = orig;

    // Remove comments
    size_t hash = line.find('#');
    if (hash != std::string::npos) line = line.substr(0, hash);
    line = trim(line);
    if (line.empty()) return;

    // Segment switches
    if (line == ".text") {
        in_data = false;
        return;
    }
    if (line == ".data") {
        in_data = true;
        return;
    }
    if (starts_with_ci(line, ".globl") &&
        (line.size() == 6 || !is_word_char(line[6]))) {
        return;  // Ignore, execution starts at the first instruction
    }

    // Label
    std::string label;
    std::string rest;
    if (split_label(line, label, rest)) {
        if (in_data) {
            data_labels.emplace(label, data_addr);
        } else {
            labels[label] = static_cast<int>(lines_out.size());
        }
        line = rest;
        if (line.empty()) return;
    }

    if (in_data) {
        handle_data(line);
        return;
    }

    // Instruction, kept verbatim and decoded in pass 2
    lines_out.push_back(line);
}

// =============================================================================
// Main Load
// =============================================================================

Loader::Result Loader::load(const std::string& source) {
    Result res;
    res.source = source;

    // Reset state
    lines_out.clear();
    labels.clear();
    data_labels.clear();
    data_strings.clear();
    data_addr = DATA_BASE;
    in_data = false;

    // Pass 1: collect lines and labels
    std::istringstream ss(source);
    std::string line;
    while (std::getline(ss, line)) {
        process_line(line);
    }

    if (lines_out.empty()) {
        res.success = false;
        res.error = LoadError::EMPTY_PROGRAM;
        res.errors.push_back("No MIPS instructions found in .text section.");
        return res;
    }

    // Pass 2: decode
    auto program = std::make_shared<Program>();
    program->labels = labels;
    program->data_addresses = data_labels;
    program->data_strings = data_strings;
    program->instructions.reserve(lines_out.size());
    for (const auto& text : lines_out) {
        program->instructions.push_back(Decoder::decode(text, *program));
    }

    res.success = true;
    res.program = program;
    return res;
}

Loader::Result Loader::load_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Result res;
        res.success = false;
        res.error = LoadError::FILE_NOT_FOUND;
        res.errors.push_back("Cannot open file: " + filename);
        return res;
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return load(buf.str());
}

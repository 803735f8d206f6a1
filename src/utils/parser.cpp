#include "utils/parser.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "project_config.hpp"

namespace pattern_automata {
namespace {

bool is_blank(const std::string& value) {
    for (char ch : value) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::vector<std::string> Parser::parse_patterns(std::istream& input) {
    std::vector<std::string> patterns;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line) || line[0] == kCommentPrefix) {
            continue;
        }
        patterns.push_back(line);
    }
    return patterns;
}

std::vector<std::string> Parser::load_patterns(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open pattern file: " + path);
    }
    return parse_patterns(input);
}

std::string Parser::read_text(const std::string& path) {
    if (path == kStdinPath) {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open input file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw std::runtime_error("Failed to read input file: " + path);
    }
    return buffer.str();
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

}  // namespace pattern_automata

#pragma once

#include <istream>
#include <string>
#include <vector>

namespace pattern_automata {

class Parser {
public:
    // One pattern per line. Blank lines and lines starting with '#' are
    // skipped; a trailing '\r' is dropped.
    static std::vector<std::string> load_patterns(const std::string& path);
    static std::vector<std::string> parse_patterns(std::istream& input);

    // Whole file as bytes; "-" reads standard input.
    static std::string read_text(const std::string& path);
};

// Splits on runs of whitespace.
std::vector<std::string> tokenize(const std::string& text);

}  // namespace pattern_automata

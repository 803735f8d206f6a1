#include <iostream>
#include <string>
#include <vector>

#include "scanner/scan_command.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return pattern_automata::scan_main(args, argv[0], std::cout, std::cerr);
}

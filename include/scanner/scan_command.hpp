#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "project_config.hpp"

namespace pattern_automata {

struct CommandLineOptions {
    std::vector<std::string> pattern_paths;
    std::vector<std::string> inline_patterns;
    std::vector<std::string> input_paths;
    std::string export_dot_path;
    std::size_t max_report{kDefaultMaxReport};
    bool deterministic{false};
    bool tokens{false};
    bool count_only{false};
    bool verify{false};
    bool print_definition{false};
};

enum class ParseStatus {
    kRun,    // options complete, go on scanning
    kExit,   // --help or --version handled
    kError,  // unknown option, usage printed
};

// Throws std::runtime_error on a malformed option value.
ParseStatus parse_arguments(const std::vector<std::string>& args,
                            CommandLineOptions& opts,
                            const char* program,
                            std::ostream& out,
                            std::ostream& err);

int run_scan(CommandLineOptions options, std::ostream& out, std::ostream& err);

// Whole pattern_scan command: args excludes the program name. Returns the
// process exit code; every error is reported on err as "Error: ...".
int scan_main(const std::vector<std::string>& args,
              const char* program,
              std::ostream& out,
              std::ostream& err);

}  // namespace pattern_automata

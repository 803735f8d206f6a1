#include "scanner/scan_command.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>

#include "automata/aho_corasick.hpp"
#include "evaluator.hpp"
#include "utils/parser.hpp"

namespace pattern_automata {
namespace {

struct InputResult {
    std::string source_path;
    ScanMetrics metrics;
    std::optional<Verification> verification;
};

void print_usage(const char* program, std::ostream& out) {
    out << "Usage: " << program
        << " [--patterns=FILE] [--pattern=WORD] [--input=FILE]"
           " [--deterministic] [--tokens]\n";
    out << "Options:\n"
        << "  --patterns=FILE     Load patterns from FILE, one per line (repeatable).\n"
        << "  --pattern=WORD      Add a single pattern (repeatable).\n"
        << "  --input=FILE        Text to scan, '-' for stdin (repeatable, default stdin).\n"
        << "  --deterministic     Precompute every transition (faster scan, more memory).\n"
        << "  --tokens            Match whitespace-separated tokens instead of bytes.\n"
        << "  --max-report=N      Print at most N matches per input (default "
        << kDefaultMaxReport << ").\n"
        << "  --count-only        Print counts only, no individual matches.\n"
        << "  --verify            Cross-check matches against a brute-force scan.\n"
        << "  --export-dot=FILE   Export the compiled automaton to a DOT file.\n"
        << "  --print-definition  Print the automaton tables to stdout.\n"
        << "  --version           Print version information.\n"
        << "  --help              Show this message.\n";
}

std::size_t parse_count(const std::string& option, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("invalid " + option + " value: '" + value + "'");
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::runtime_error("invalid " + option + " value: '" + value + "' is too large");
    }
}

std::optional<std::string> parse_key_value(const std::string& option, const std::string& prefix) {
    if (option.rfind(prefix, 0) == 0) {
        return option.substr(prefix.size());
    }
    return std::nullopt;
}

// Returns false for an unknown option.
bool parse_argument(const std::string& arg, CommandLineOptions& opts) {
    if (auto value = parse_key_value(arg, "--patterns=")) {
        opts.pattern_paths.push_back(*value);
        return true;
    }
    if (auto value = parse_key_value(arg, "--pattern=")) {
        opts.inline_patterns.push_back(*value);
        return true;
    }
    if (auto value = parse_key_value(arg, "--input=")) {
        opts.input_paths.push_back(*value);
        return true;
    }
    if (auto value = parse_key_value(arg, "--max-report=")) {
        opts.max_report = parse_count("--max-report", *value);
        return true;
    }
    if (auto value = parse_key_value(arg, "--export-dot=")) {
        opts.export_dot_path = *value;
        return true;
    }
    if (arg == "--deterministic") {
        opts.deterministic = true;
        return true;
    }
    if (arg == "--tokens") {
        opts.tokens = true;
        return true;
    }
    if (arg == "--count-only") {
        opts.count_only = true;
        return true;
    }
    if (arg == "--verify") {
        opts.verify = true;
        return true;
    }
    if (arg == "--print-definition") {
        opts.print_definition = true;
        return true;
    }
    return false;
}

std::vector<std::string> collect_patterns(const CommandLineOptions& opts,
                                          std::ostream& out,
                                          std::ostream& err) {
    std::vector<std::string> patterns;
    for (const auto& path : opts.pattern_paths) {
        auto loaded = Parser::load_patterns(path);
        if (loaded.empty()) {
            err << "Warning: No patterns loaded from " << path << std::endl;
        }
        out << "      " << loaded.size() << " patterns from " << path << std::endl;
        patterns.insert(patterns.end(),
                        std::make_move_iterator(loaded.begin()),
                        std::make_move_iterator(loaded.end()));
    }
    patterns.insert(patterns.end(), opts.inline_patterns.begin(), opts.inline_patterns.end());
    return patterns;
}

template <class Automaton, class Pattern>
void insert_all(Automaton& automaton, const std::vector<Pattern>& patterns, std::ostream& err) {
    for (const auto& pattern : patterns) {
        try {
            automaton.insert(pattern);
        } catch (const EmptyPatternError& ex) {
            err << "Warning: skipping pattern: " << ex.what() << std::endl;
        }
    }
}

void export_dot_if_requested(const std::string& dot, const std::string& path) {
    if (path.empty()) {
        return;
    }

    std::ofstream output(path);
    if (!output.is_open()) {
        throw std::runtime_error("Failed to open DOT output file: " + path);
    }

    output << dot;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string joined;
    for (const auto& token : tokens) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += token;
    }
    return joined;
}

const std::string& pattern_text(const TextAutomaton& automaton, std::size_t id) {
    return automaton.pattern(id);
}

std::string pattern_text(const TokenAutomaton& automaton, std::size_t id) {
    return join_tokens(automaton.pattern(id));
}

// Shared pipeline for byte and token mode. to_symbols turns raw input text
// into the automaton's pattern_type.
template <class Automaton, class ToSymbols>
int run(const CommandLineOptions& options,
        const std::vector<std::string>& raw_patterns,
        ToSymbols to_symbols,
        std::ostream& out,
        std::ostream& err) {
    out << "[2/4] Building automaton ("
        << (options.deterministic ? "deterministic" : "non-deterministic") << ")..."
        << std::endl;

    std::vector<typename Automaton::pattern_type> patterns;
    patterns.reserve(raw_patterns.size());
    for (const auto& raw : raw_patterns) {
        patterns.push_back(to_symbols(raw));
    }

    Automaton automaton;
    insert_all(automaton, patterns, err);
    if (automaton.empty()) {
        err << "Error: No usable patterns. Check pattern files and --pattern values." << std::endl;
        return 1;
    }
    automaton.compile(options.deterministic);
    out << "      Patterns: " << automaton.size() << ", states: " << automaton.state_count()
        << ", transitions: " << automaton.transition_count() << std::endl;

    if (options.print_definition) {
        out << "\n" << automaton.to_definition() << std::endl;
    }

    out << "[3/4] Scanning inputs..." << std::endl;
    std::vector<InputResult> results;
    bool verification_failed = false;

    for (const auto& path : options.input_paths) {
        const auto text = to_symbols(Parser::read_text(path));

        std::vector<Match> reported;
        const std::size_t limit = options.count_only ? 0 : options.max_report;

        InputResult result;
        result.source_path = path;
        result.metrics = evaluate(automaton, text, &reported, limit);
        for (const auto& match : reported) {
            out << path << ":" << match.start << ":" << pattern_text(automaton, match.pattern_id)
                << "\n";
        }
        if (result.metrics.total_matches > reported.size() && !options.count_only) {
            out << "      ... " << (result.metrics.total_matches - reported.size())
                << " more matches not shown" << std::endl;
        }

        if (options.verify) {
            result.verification = verify(automaton, text);
            if (!result.verification->ok) {
                verification_failed = true;
            }
        }
        results.push_back(std::move(result));
    }

    out << "[4/4] Summary" << std::endl;
    out << std::fixed << std::setprecision(4);
    out << "\nSummary" << std::endl;
    out << "=======" << std::endl;
    out << "Mode: " << (options.deterministic ? "deterministic" : "non-deterministic") << " ("
        << (options.tokens ? "tokens" : "bytes") << ")\n";
    out << "Patterns: " << automaton.size() << "\n";
    out << "States: " << automaton.state_count()
        << ", transitions: " << automaton.transition_count() << "\n";

    for (const auto& result : results) {
        out << "\nResults for: " << result.source_path << "\n";
        out << "  Symbols scanned: " << result.metrics.symbols_scanned << "\n";
        out << "  Matches: " << result.metrics.total_matches << "\n";
        out << "  Scan time: " << result.metrics.scan_ms << " ms\n";

        std::vector<std::size_t> order(result.metrics.matches_per_pattern.size());
        for (std::size_t i = 0; i < order.size(); ++i) {
            order[i] = i;
        }
        const auto& counts = result.metrics.matches_per_pattern;
        std::stable_sort(order.begin(), order.end(), [&counts](std::size_t lhs, std::size_t rhs) {
            return counts[lhs] > counts[rhs];
        });
        for (const auto id : order) {
            if (counts[id] == 0) {
                break;
            }
            out << "    " << pattern_text(automaton, id) << ": " << counts[id] << "\n";
        }

        if (result.verification) {
            const auto& check = *result.verification;
            out << "  Verification: " << (check.ok ? "OK" : "FAILED")
                << " (expected=" << check.expected << ", missing=" << check.missing
                << ", unexpected=" << check.unexpected << ")\n";
        }
    }

    try {
        export_dot_if_requested(automaton.to_dot(), options.export_dot_path);
    } catch (const std::exception& ex) {
        err << "Warning: " << ex.what() << std::endl;
    }

    if (verification_failed) {
        err << "Error: automaton matches differ from the reference scan" << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace

ParseStatus parse_arguments(const std::vector<std::string>& args,
                            CommandLineOptions& opts,
                            const char* program,
                            std::ostream& out,
                            std::ostream& err) {
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            print_usage(program, out);
            return ParseStatus::kExit;
        }
        if (arg == "--version") {
            out << "pattern-scan " << kVersion << "\n";
            return ParseStatus::kExit;
        }
        if (!parse_argument(arg, opts)) {
            err << "Error: unknown option: " << arg << "\n";
            print_usage(program, err);
            return ParseStatus::kError;
        }
    }

    // Standard input can only be drained once.
    if (std::count(opts.input_paths.begin(), opts.input_paths.end(), kStdinPath) > 1) {
        throw std::runtime_error(std::string("standard input ('") + kStdinPath +
                                 "') given more than once");
    }
    return ParseStatus::kRun;
}

int run_scan(CommandLineOptions options, std::ostream& out, std::ostream& err) {
    if (options.input_paths.empty()) {
        options.input_paths.push_back(kStdinPath);
    }

    out << "[1/4] Loading patterns..." << std::endl;
    auto raw_patterns = collect_patterns(options, out, err);
    if (raw_patterns.empty()) {
        err << "Error: No patterns given. Use --patterns=FILE or --pattern=WORD." << std::endl;
        return 1;
    }
    out << "      Total: " << raw_patterns.size() << " patterns." << std::endl;

    if (options.tokens) {
        return run<TokenAutomaton>(
            options, raw_patterns, [](const std::string& raw) { return tokenize(raw); }, out, err);
    }
    return run<TextAutomaton>(
        options, raw_patterns, [](const std::string& raw) { return raw; }, out, err);
}

int scan_main(const std::vector<std::string>& args,
              const char* program,
              std::ostream& out,
              std::ostream& err) {
    try {
        CommandLineOptions options;
        switch (parse_arguments(args, options, program, out, err)) {
            case ParseStatus::kExit:
                return 0;
            case ParseStatus::kError:
                return 1;
            case ParseStatus::kRun:
                break;
        }
        return run_scan(std::move(options), out, err);
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

}  // namespace pattern_automata

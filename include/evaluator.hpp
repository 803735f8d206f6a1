#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "automata/aho_corasick.hpp"

namespace pattern_automata {

struct ScanMetrics {
    std::size_t symbols_scanned{0};
    std::size_t total_matches{0};
    std::vector<std::size_t> matches_per_pattern;  // indexed by pattern id
    std::size_t states{0};
    std::size_t transitions{0};
    double scan_ms{0.0};
};

// Scans the text once, reporting at most max_report matches through
// `reported` while counting all of them.
ScanMetrics evaluate(const TextAutomaton& automaton,
                     const std::string& text,
                     std::vector<Match>* reported = nullptr,
                     std::size_t max_report = 0);

ScanMetrics evaluate(const TokenAutomaton& automaton,
                     const std::vector<std::string>& tokens,
                     std::vector<Match>* reported = nullptr,
                     std::size_t max_report = 0);

// Quadratic scan comparing every pattern at every offset. Used to check the
// automaton; results are sorted.
std::vector<Match> reference_matches(const TextAutomaton& automaton, const std::string& text);
std::vector<Match> reference_matches(const TokenAutomaton& automaton,
                                     const std::vector<std::string>& tokens);

struct Verification {
    bool ok{true};
    std::size_t expected{0};
    std::size_t missing{0};     // found by the reference scan only
    std::size_t unexpected{0};  // reported by the automaton only
};

Verification verify(const TextAutomaton& automaton, const std::string& text);
Verification verify(const TokenAutomaton& automaton, const std::vector<std::string>& tokens);

}  // namespace pattern_automata

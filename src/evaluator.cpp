#include "evaluator.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

namespace pattern_automata {
namespace {

template <class Automaton, class Sequence>
ScanMetrics evaluate_impl(const Automaton& automaton,
                          const Sequence& text,
                          std::vector<Match>* reported,
                          std::size_t max_report) {
    ScanMetrics metrics;
    metrics.matches_per_pattern.assign(automaton.size(), 0);
    metrics.states = automaton.state_count();
    metrics.transitions = automaton.transition_count();

    // Drive the cursor directly so the symbol count is known even when the
    // text ends without a match.
    auto cursor = automaton.cursor();
    const auto scan_start = std::chrono::steady_clock::now();
    for (const auto& symbol : text) {
        const auto& ids = cursor.step(symbol);
        for (const auto id : ids) {
            ++metrics.matches_per_pattern[id];
            ++metrics.total_matches;
            if (reported != nullptr && reported->size() < max_report) {
                const std::size_t length = automaton.pattern(id).size();
                reported->push_back(Match{id, cursor.position() - length, length});
            }
        }
    }
    const auto scan_end = std::chrono::steady_clock::now();

    metrics.symbols_scanned = cursor.position();
    metrics.scan_ms = std::chrono::duration<double, std::milli>(scan_end - scan_start).count();
    return metrics;
}

template <class Automaton, class Sequence>
std::vector<Match> reference_impl(const Automaton& automaton, const Sequence& text) {
    std::vector<Match> matches;
    const auto text_begin = std::begin(text);
    const auto text_size = static_cast<std::size_t>(std::distance(std::begin(text), std::end(text)));

    for (std::size_t id = 0; id < automaton.size(); ++id) {
        const auto& pattern = automaton.pattern(id);
        const std::size_t length = pattern.size();
        if (length == 0 || length > text_size) {
            continue;
        }
        for (std::size_t start = 0; start + length <= text_size; ++start) {
            if (std::equal(pattern.begin(), pattern.end(), text_begin + start)) {
                matches.push_back(Match{id, start, length});
            }
        }
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

template <class Automaton, class Sequence>
Verification verify_impl(const Automaton& automaton, const Sequence& text) {
    auto expected = reference_impl(automaton, text);
    auto actual = automaton.find_all(text);
    std::sort(actual.begin(), actual.end());

    std::vector<Match> missing;
    std::set_difference(expected.begin(), expected.end(), actual.begin(), actual.end(),
                        std::back_inserter(missing));
    std::vector<Match> unexpected;
    std::set_difference(actual.begin(), actual.end(), expected.begin(), expected.end(),
                        std::back_inserter(unexpected));

    Verification result;
    result.expected = expected.size();
    result.missing = missing.size();
    result.unexpected = unexpected.size();
    // Duplicated reports survive set_difference, so compare sizes as well.
    result.ok = missing.empty() && unexpected.empty() && expected.size() == actual.size();
    return result;
}

}  // namespace

ScanMetrics evaluate(const TextAutomaton& automaton,
                     const std::string& text,
                     std::vector<Match>* reported,
                     std::size_t max_report) {
    return evaluate_impl(automaton, text, reported, max_report);
}

ScanMetrics evaluate(const TokenAutomaton& automaton,
                     const std::vector<std::string>& tokens,
                     std::vector<Match>* reported,
                     std::size_t max_report) {
    return evaluate_impl(automaton, tokens, reported, max_report);
}

std::vector<Match> reference_matches(const TextAutomaton& automaton, const std::string& text) {
    return reference_impl(automaton, text);
}

std::vector<Match> reference_matches(const TokenAutomaton& automaton,
                                     const std::vector<std::string>& tokens) {
    return reference_impl(automaton, tokens);
}

Verification verify(const TextAutomaton& automaton, const std::string& text) {
    return verify_impl(automaton, text);
}

Verification verify(const TokenAutomaton& automaton, const std::vector<std::string>& tokens) {
    return verify_impl(automaton, tokens);
}

}  // namespace pattern_automata

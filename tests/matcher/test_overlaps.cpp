#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "automata/aho_corasick.hpp"

using namespace pattern_automata;

namespace {

bool check_ushers(bool deterministic) {
    TextAutomaton ac;
    const auto he = ac.insert("he");
    const auto she = ac.insert("she");
    ac.compile(deterministic);

    const std::string text = "ushers";
    const auto matches = ac.find_all(text);

    // Both end at position 4; the longer pattern is reported first.
    const std::vector<Match> expected{Match{she, 1, 3}, Match{he, 2, 2}};
    if (matches != expected) {
        std::cerr << "ushers (deterministic=" << deterministic << "): got " << matches.size()
                  << " matches\n";
        for (const auto& m : matches) {
            std::cerr << "  " << ac.pattern(m.pattern_id) << " @ " << m.start << "\n";
        }
        return false;
    }
    return true;
}

bool check_single_symbol(bool deterministic) {
    TextAutomaton ac;
    const auto aa = ac.insert("aa");
    const auto aaa = ac.insert("aaa");
    ac.compile(deterministic);

    const std::string text = "aaaa";
    auto matches = ac.find_all(text);
    std::sort(matches.begin(), matches.end());

    std::vector<Match> expected{
        Match{aa, 0, 2}, Match{aaa, 0, 3}, Match{aa, 1, 2}, Match{aaa, 1, 3}, Match{aa, 2, 2},
    };
    std::sort(expected.begin(), expected.end());

    if (matches != expected) {
        std::cerr << "aaaa (deterministic=" << deterministic << "): expected 5 matches got "
                  << matches.size() << "\n";
        return false;
    }
    return true;
}

bool check_no_match(bool deterministic) {
    TextAutomaton ac;
    ac.insert("needle");
    ac.insert("pin");
    ac.compile(deterministic);

    const std::string text = "a haystack with nothing in it";
    if (!ac.find_all(text).empty()) {
        std::cerr << "Expected no matches (deterministic=" << deterministic << ")\n";
        return false;
    }
    const std::string empty_text;
    if (!ac.find_all(empty_text).empty()) {
        std::cerr << "Expected no matches on empty text\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    for (bool deterministic : {false, true}) {
        if (!check_ushers(deterministic) || !check_single_symbol(deterministic) ||
            !check_no_match(deterministic)) {
            return 1;
        }
    }

    std::cout << "test_overlaps: PASS\n";
    return 0;
}

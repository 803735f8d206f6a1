#include <iostream>
#include <string>

#include "automata/aho_corasick.hpp"

using namespace pattern_automata;

int main() {
    TextAutomaton sparse;
    TextAutomaton dense;
    for (const std::string word : {"he", "she", "his", "hers"}) {
        sparse.insert(word);
        dense.insert(word);
    }
    sparse.compile();
    dense.compile(true);

    if (!dense.deterministic()) {
        std::cerr << "Expected deterministic mode\n";
        return 1;
    }

    // Failure links are dropped once every transition is direct.
    if (dense.failure(5) != kNoState) {
        std::cerr << "Deterministic automaton still exposes failure links\n";
        return 1;
    }

    if (dense.state_count() != sparse.state_count()) {
        std::cerr << "Closure must not add states\n";
        return 1;
    }
    if (dense.transition_count() <= sparse.transition_count()) {
        std::cerr << "Closure should add derived transitions: sparse="
                  << sparse.transition_count() << " dense=" << dense.transition_count() << "\n";
        return 1;
    }

    // Every (state, symbol) pair gives the same target in both modes.
    const std::string alphabet = "hesirxz";
    for (std::size_t state = 0; state < sparse.state_count(); ++state) {
        for (char symbol : alphabet) {
            const auto expected = sparse.next(state, symbol);
            const auto actual = dense.next(state, symbol);
            if (expected != actual) {
                std::cerr << "next(s" << state << ", " << symbol << "): sparse=s" << expected
                          << " dense=s" << actual << "\n";
                return 1;
            }
        }
        if (sparse.outputs(state) != dense.outputs(state)) {
            std::cerr << "Output sets differ at s" << state << "\n";
            return 1;
        }
    }

    // s5 ("she") reaches "her" directly through the closed edge.
    if (dense.next(5, 'r') != 8) {
        std::cerr << "Missing closed edge s5 -r-> s8\n";
        return 1;
    }

    std::cout << "test_deterministic_closure: PASS\n";
    return 0;
}

#include <iostream>
#include <string>

#include "automata/aho_corasick.hpp"

using namespace pattern_automata;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    if (haystack.find(needle) == std::string::npos) {
        std::cerr << "Expected '" << needle << "' in:\n" << haystack << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    TextAutomaton ac;
    ac.insert("he");
    ac.insert("she");

    // Before compile only the trie is shown.
    const auto pending = ac.to_definition();
    if (!contains(pending, "Mode: not built") || !contains(pending, "δ(s0, h) = s1")) {
        return 1;
    }

    ac.compile();
    const auto definition = ac.to_definition();
    if (!contains(definition, "Mode: non-deterministic") || !contains(definition, "w1 = she") ||
        !contains(definition, "f(s5) = s2") || !contains(definition, "o(s5) = {w1, w0}")) {
        return 1;
    }

    const auto dot = ac.to_dot();
    if (!contains(dot, "digraph AhoCorasick") || !contains(dot, "s5 -> s2 [style=dashed") ||
        !contains(dot, "shape=doublecircle")) {
        return 1;
    }

    TextAutomaton dense;
    dense.insert("he");
    dense.insert("she");
    dense.compile(true);
    const auto dense_definition = dense.to_definition();
    if (!contains(dense_definition, "Mode: deterministic") ||
        dense_definition.find("Failure (f):") != std::string::npos) {
        std::cerr << "Deterministic definition should have no failure table\n";
        return 1;
    }
    if (dense.to_dot().find("style=dashed") != std::string::npos) {
        std::cerr << "Deterministic DOT should have no failure edges\n";
        return 1;
    }

    std::cout << "test_definition: PASS\n";
    return 0;
}

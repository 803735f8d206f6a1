#include <iostream>
#include <string>

#include "automata/trie.hpp"

using namespace pattern_automata;

int main() {
    Trie<std::string> trie;

    const auto he = trie.insert("he");
    const auto she = trie.insert("she");
    trie.insert("his");
    trie.insert("hers");

    // root + h,e + s,h,e + i,s + r,s
    if (trie.state_count() != 10) {
        std::cerr << "Expected 10 states got " << trie.state_count() << "\n";
        return 1;
    }
    if (trie.transition_count() != 9) {
        std::cerr << "Expected 9 transitions got " << trie.transition_count() << "\n";
        return 1;
    }

    // States are numbered in the order their edges were first created.
    if (trie.find(kRootState, 'h') != 1 || trie.find(1, 'e') != 2 ||
        trie.find(kRootState, 's') != 3) {
        std::cerr << "Unexpected state numbering\n";
        return 1;
    }
    if (trie.find(kRootState, 'x') != kNoState) {
        std::cerr << "Lookup of a missing edge must not create it\n";
        return 1;
    }

    const auto& root_alphabet = trie.alphabet(kRootState);
    if (root_alphabet.size() != 2 || root_alphabet[0] != 'h' || root_alphabet[1] != 's') {
        std::cerr << "Root alphabet should be {h, s} in insertion order\n";
        return 1;
    }

    if (trie.node(2).pattern != he || trie.node(5).pattern != she) {
        std::cerr << "Pattern ids not recorded on their final states\n";
        return 1;
    }

    const auto again = trie.insert("she");
    if (again != she || trie.patterns().size() != 4 || trie.state_count() != 10) {
        std::cerr << "Re-inserting a pattern must reuse its id and states\n";
        return 1;
    }

    try {
        trie.insert("");
        std::cerr << "Empty pattern accepted\n";
        return 1;
    } catch (const EmptyPatternError&) {
    }
    if (trie.state_count() != 10 || trie.patterns().size() != 4) {
        std::cerr << "Rejected pattern changed the trie\n";
        return 1;
    }

    trie.release_alphabet();
    if (!trie.frozen()) {
        std::cerr << "release_alphabet() should freeze the trie\n";
        return 1;
    }

    // Growth after the alphabet is gone is a lifecycle error, not a crash.
    try {
        trie.insert("hex");
        std::cerr << "insert() after release_alphabet() did not throw\n";
        return 1;
    } catch (const AlreadyBuiltError&) {
    }
    try {
        trie.get_or_create(kRootState, 'z');
        std::cerr << "get_or_create() after release_alphabet() did not throw\n";
        return 1;
    } catch (const AlreadyBuiltError&) {
    }
    try {
        trie.alphabet(kRootState);
        std::cerr << "alphabet() after release_alphabet() did not throw\n";
        return 1;
    } catch (const AlreadyBuiltError&) {
    }
    if (trie.state_count() != 10 || trie.find(2, 'r') != 8) {
        std::cerr << "Frozen trie should stay readable\n";
        return 1;
    }

    std::cout << "test_trie_insert: PASS\n";
    return 0;
}

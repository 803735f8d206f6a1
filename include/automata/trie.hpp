#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "automata/errors.hpp"

namespace pattern_automata {

inline constexpr std::size_t kRootState = 0;
inline constexpr std::size_t kNoState = std::numeric_limits<std::size_t>::max();
inline constexpr std::size_t kNoPattern = std::numeric_limits<std::size_t>::max();

// Prefix tree over the symbols of the inserted patterns. State 0 is the root;
// every other state is created by get_or_create() with the next free id.
template <class Pattern, class Hash = std::hash<typename Pattern::value_type>>
class Trie {
public:
    using pattern_type = Pattern;
    using symbol_type = typename Pattern::value_type;
    using state_id = std::size_t;
    using transition_map = std::unordered_map<symbol_type, state_id, Hash>;

    struct Node {
        transition_map transitions;
        std::size_t pattern{kNoPattern};  // pattern ending exactly here
    };

    Trie() {
        nodes_.emplace_back();
        alphabet_.emplace_back();
    }

    // Adds the pattern and returns its id. Inserting a pattern twice returns
    // the id it got the first time.
    std::size_t insert(const Pattern& pattern) {
        ensure_growing();
        state_id current = kRootState;
        for (const auto& symbol : pattern) {
            current = get_or_create(current, symbol);
        }

        if (current == kRootState) {
            throw EmptyPatternError();
        }

        auto& node = nodes_[current];
        if (node.pattern == kNoPattern) {
            node.pattern = patterns_.size();
            patterns_.push_back(pattern);
        }
        return node.pattern;
    }

    state_id find(state_id state, const symbol_type& symbol) const {
        const auto& transitions = nodes_[state].transitions;
        auto it = transitions.find(symbol);
        return it == transitions.end() ? kNoState : it->second;
    }

    // Follows (state, symbol), allocating a fresh state when the edge is new.
    // New edges are also recorded in the state's alphabet.
    state_id get_or_create(state_id state, const symbol_type& symbol) {
        ensure_growing();
        state_id target = find(state, symbol);
        if (target != kNoState) {
            return target;
        }

        target = nodes_.size();
        nodes_.emplace_back();
        alphabet_.emplace_back();
        nodes_[state].transitions.emplace(symbol, target);
        alphabet_[state].push_back(symbol);
        return target;
    }

    // Adds a derived edge (not part of the trie); an existing edge is kept.
    void link(state_id from, const symbol_type& symbol, state_id to) {
        nodes_[from].transitions.emplace(symbol, to);
    }

    const std::vector<symbol_type>& alphabet(state_id state) const {
        ensure_growing();
        return alphabet_[state];
    }

    // Drops the construction-only alphabet. The trie is frozen afterwards:
    // insert(), get_or_create() and alphabet() throw AlreadyBuiltError.
    void release_alphabet() {
        std::vector<std::vector<symbol_type>>().swap(alphabet_);
        frozen_ = true;
    }

    bool frozen() const { return frozen_; }

    const Node& node(state_id state) const { return nodes_[state]; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const Pattern& pattern(std::size_t id) const { return patterns_[id]; }
    const std::vector<Pattern>& patterns() const { return patterns_; }

    std::size_t state_count() const { return nodes_.size(); }

    std::size_t transition_count() const {
        std::size_t count = 0;
        for (const auto& node : nodes_) {
            count += node.transitions.size();
        }
        return count;
    }

private:
    std::vector<Node> nodes_;
    std::vector<std::vector<symbol_type>> alphabet_;  // construction only
    std::vector<Pattern> patterns_;
    bool frozen_{false};

    void ensure_growing() const {
        if (frozen_) {
            throw AlreadyBuiltError();
        }
    }
};

}  // namespace pattern_automata

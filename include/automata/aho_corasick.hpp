#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <queue>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "automata/errors.hpp"
#include "automata/matcher.hpp"
#include "automata/trie.hpp"

namespace pattern_automata {

// Aho-Corasick multi-pattern matcher over any hashable symbol type. The
// symbol type is Pattern::value_type, so AhoCorasick<std::string> matches
// bytes and AhoCorasick<std::vector<std::string>> matches token sequences.
//
// Lifecycle: insert() any number of times, compile() once, then search()
// any number of times, from any number of threads.
//
// compile(true) builds the deterministic automaton: every state gets a
// direct edge for each symbol reachable through its failure chain and the
// failure links are dropped. Scanning then costs one lookup per symbol, but
// the transition table may grow to O(states x alphabet) entries. Use
// transition_count() to see what the closure cost.
template <class Pattern, class Hash = std::hash<typename Pattern::value_type>>
class AhoCorasick {
public:
    using pattern_type = Pattern;
    using symbol_type = typename Pattern::value_type;
    using state_id = std::size_t;
    using trie_type = Trie<Pattern, Hash>;
    using cursor_type = Cursor<AhoCorasick>;

    AhoCorasick() = default;

    std::size_t insert(const Pattern& pattern) {
        if (built_) {
            throw AlreadyBuiltError();
        }
        return trie_.insert(pattern);
    }

    template <class InputIt>
    std::size_t insert(InputIt first, InputIt last) {
        return insert(Pattern(first, last));
    }

    void compile(bool deterministic = false);

    cursor_type cursor() const {
        ensure_built();
        return cursor_type(*this);
    }

    template <class InputIt>
    MatchRange<AhoCorasick, InputIt> search(InputIt first, InputIt last) const {
        ensure_built();
        return MatchRange<AhoCorasick, InputIt>(*this, std::move(first), std::move(last));
    }

    // The range keeps iterators into text; text must outlive the scan.
    template <class Range>
    auto search(const Range& text) const {
        return search(std::begin(text), std::end(text));
    }

    template <class Range>
    void search(const Range&& text) const = delete;

    template <class Range>
    std::vector<Match> find_all(const Range& text) const {
        std::vector<Match> matches;
        for (const auto& match : search(text)) {
            matches.push_back(match);
        }
        return matches;
    }

    // Transition function used by Cursor. Symbols with no edge anywhere on
    // the failure chain lead back to the root.
    state_id next(state_id state, const symbol_type& symbol) const {
        state_id target = trie_.find(state, symbol);
        if (!deterministic_) {
            while (target == kNoState && state != kRootState) {
                state = failure_[state];
                target = trie_.find(state, symbol);
            }
        }
        return target == kNoState ? kRootState : target;
    }

    const std::vector<std::size_t>& outputs(state_id state) const { return outputs_[state]; }

    // Failure link of a non-root state; kNoState in deterministic mode.
    state_id failure(state_id state) const {
        return failure_.empty() ? kNoState : failure_[state];
    }

    const Pattern& pattern(std::size_t id) const { return trie_.pattern(id); }
    const std::vector<Pattern>& patterns() const { return trie_.patterns(); }
    std::size_t size() const { return trie_.patterns().size(); }
    bool empty() const { return size() == 0; }

    std::size_t state_count() const { return trie_.state_count(); }
    std::size_t transition_count() const { return trie_.transition_count(); }

    bool built() const { return built_; }
    bool deterministic() const { return deterministic_; }

    std::string to_dot() const;
    std::string to_definition() const;

private:
    trie_type trie_;
    std::vector<state_id> failure_;
    std::vector<std::vector<std::size_t>> outputs_;
    bool built_{false};
    bool deterministic_{false};

    void ensure_built() const {
        if (!built_) {
            throw NotBuiltError();
        }
    }

    void close_transitions(state_id state);

    static std::string format_symbol(const symbol_type& symbol);
    std::string format_pattern(std::size_t id) const;
    std::vector<std::pair<std::string, state_id>> sorted_edges(state_id state) const;
};

template <class Pattern, class Hash>
void AhoCorasick<Pattern, Hash>::compile(bool deterministic) {
    if (built_) {
        throw AlreadyBuiltError();
    }

    const std::size_t state_total = trie_.state_count();
    failure_.assign(state_total, kRootState);
    outputs_.assign(state_total, {});
    for (state_id s = 0; s < state_total; ++s) {
        const std::size_t own = trie_.node(s).pattern;
        if (own != kNoPattern) {
            outputs_[s].push_back(own);
        }
    }

    // Breadth-first: the failure link and output set of every shallower state
    // are final before a deeper state reads them.
    std::queue<state_id> queue;
    for (const auto& symbol : trie_.alphabet(kRootState)) {
        const state_id child = trie_.find(kRootState, symbol);
        failure_[child] = kRootState;
        queue.push(child);
    }

    while (!queue.empty()) {
        const state_id r = queue.front();
        queue.pop();

        for (const auto& symbol : trie_.alphabet(r)) {
            const state_id s = trie_.find(r, symbol);
            queue.push(s);

            state_id fallback = failure_[r];
            state_id target = trie_.find(fallback, symbol);
            while (target == kNoState && fallback != kRootState) {
                fallback = failure_[fallback];
                target = trie_.find(fallback, symbol);
            }

            const state_id link = target == kNoState ? kRootState : target;
            failure_[s] = link;

            const auto& inherited = outputs_[link];
            outputs_[s].insert(outputs_[s].end(), inherited.begin(), inherited.end());
        }

        if (deterministic) {
            close_transitions(r);
        }
    }

    trie_.release_alphabet();
    if (deterministic) {
        std::vector<state_id>().swap(failure_);
    }

    deterministic_ = deterministic;
    built_ = true;
}

template <class Pattern, class Hash>
void AhoCorasick<Pattern, Hash>::close_transitions(state_id state) {
    state_id fallback = failure_[state];
    for (;;) {
        for (const auto& symbol : trie_.alphabet(fallback)) {
            trie_.link(state, symbol, trie_.find(fallback, symbol));
        }
        if (fallback == kRootState) {
            break;
        }
        fallback = failure_[fallback];
    }
}

template <class Pattern, class Hash>
std::string AhoCorasick<Pattern, Hash>::format_symbol(const symbol_type& symbol) {
    std::ostringstream out;
    if constexpr (std::is_same<symbol_type, char>::value) {
        const auto byte = static_cast<unsigned char>(symbol);
        if (symbol == '"' || symbol == '\\') {
            out << '\\' << symbol;
        } else if (byte < 0x20 || byte >= 0x7f) {
            static const char* const kHex = "0123456789abcdef";
            out << "\\x" << kHex[byte >> 4] << kHex[byte & 0x0f];
        } else {
            out << symbol;
        }
    } else {
        out << symbol;
    }
    return out.str();
}

template <class Pattern, class Hash>
std::string AhoCorasick<Pattern, Hash>::format_pattern(std::size_t id) const {
    std::string text;
    bool first = true;
    for (const auto& symbol : trie_.pattern(id)) {
        if (!first && !std::is_same<symbol_type, char>::value) {
            text += ' ';
        }
        text += format_symbol(symbol);
        first = false;
    }
    return text;
}

template <class Pattern, class Hash>
std::vector<std::pair<std::string, typename AhoCorasick<Pattern, Hash>::state_id>>
AhoCorasick<Pattern, Hash>::sorted_edges(state_id state) const {
    std::vector<std::pair<std::string, state_id>> edges;
    edges.reserve(trie_.node(state).transitions.size());
    for (const auto& [symbol, target] : trie_.node(state).transitions) {
        edges.emplace_back(format_symbol(symbol), target);
    }
    std::sort(edges.begin(), edges.end());
    return edges;
}

template <class Pattern, class Hash>
std::string AhoCorasick<Pattern, Hash>::to_dot() const {
    std::ostringstream out;
    out << "digraph AhoCorasick {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=circle];\n";

    out << "  __start [shape=point];\n";
    out << "  __start -> s" << kRootState << ";\n";

    for (state_id i = 0; i < trie_.state_count(); ++i) {
        out << "  s" << i << " [label=\"s" << i;
        const bool accepting = built_ ? !outputs_[i].empty()
                                      : trie_.node(i).pattern != kNoPattern;
        if (built_) {
            for (const auto id : outputs_[i]) {
                out << "\\n" << format_pattern(id);
            }
        } else if (accepting) {
            out << "\\n" << format_pattern(trie_.node(i).pattern);
        }
        out << "\"";
        if (accepting) {
            out << ", shape=doublecircle";
        }
        out << "];\n";
    }

    for (state_id i = 0; i < trie_.state_count(); ++i) {
        for (const auto& [label, target] : sorted_edges(i)) {
            out << "  s" << i << " -> s" << target << " [label=\"" << label << "\"];\n";
        }
    }

    if (built_ && !deterministic_) {
        for (state_id i = 1; i < trie_.state_count(); ++i) {
            out << "  s" << i << " -> s" << failure_[i] << " [style=dashed, color=gray];\n";
        }
    }

    out << "}\n";
    return out.str();
}

template <class Pattern, class Hash>
std::string AhoCorasick<Pattern, Hash>::to_definition() const {
    std::ostringstream out;
    out << "Aho-Corasick Automaton\n";
    out << "======================\n";
    out << "Mode: "
        << (built_ ? (deterministic_ ? "deterministic" : "non-deterministic") : "not built")
        << "\n";
    out << "States: " << trie_.state_count() << "\n";
    out << "Transitions: " << trie_.transition_count() << "\n";

    out << "Patterns (" << size() << "):\n";
    for (std::size_t id = 0; id < size(); ++id) {
        out << "  w" << id << " = " << format_pattern(id) << "\n";
    }

    out << "Transitions (δ):\n";
    for (state_id i = 0; i < trie_.state_count(); ++i) {
        for (const auto& [label, target] : sorted_edges(i)) {
            out << "  δ(s" << i << ", " << label << ") = s" << target << "\n";
        }
    }

    if (built_ && !deterministic_) {
        out << "Failure (f):\n";
        for (state_id i = 1; i < trie_.state_count(); ++i) {
            out << "  f(s" << i << ") = s" << failure_[i] << "\n";
        }
    }

    if (built_) {
        out << "Output (o):\n";
        for (state_id i = 0; i < trie_.state_count(); ++i) {
            if (outputs_[i].empty()) {
                continue;
            }
            out << "  o(s" << i << ") = {";
            bool first = true;
            for (const auto id : outputs_[i]) {
                if (!first) {
                    out << ", ";
                }
                out << "w" << id;
                first = false;
            }
            out << "}\n";
        }
    }

    return out.str();
}

extern template class Trie<std::string>;
extern template class Trie<std::vector<std::string>>;
extern template class AhoCorasick<std::string>;
extern template class AhoCorasick<std::vector<std::string>>;

using TextAutomaton = AhoCorasick<std::string>;
using TokenAutomaton = AhoCorasick<std::vector<std::string>>;

}  // namespace pattern_automata

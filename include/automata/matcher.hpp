#pragma once

#include <cstddef>
#include <iterator>
#include <tuple>
#include <utility>
#include <vector>

namespace pattern_automata {

// One occurrence: the pattern occupies [start, start + length) of the scanned
// sequence.
struct Match {
    std::size_t pattern_id{0};
    std::size_t start{0};
    std::size_t length{0};

    std::size_t end() const { return start + length; }
};

inline bool operator==(const Match& lhs, const Match& rhs) {
    return lhs.pattern_id == rhs.pattern_id && lhs.start == rhs.start &&
           lhs.length == rhs.length;
}

inline bool operator!=(const Match& lhs, const Match& rhs) { return !(lhs == rhs); }

inline bool operator<(const Match& lhs, const Match& rhs) {
    return std::tie(lhs.start, lhs.length, lhs.pattern_id) <
           std::tie(rhs.start, rhs.length, rhs.pattern_id);
}

// Traversal state of a single scan over a compiled automaton. The automaton
// is only read, so any number of cursors may walk it concurrently.
template <class Automaton>
class Cursor {
public:
    using symbol_type = typename Automaton::symbol_type;
    using state_id = typename Automaton::state_id;

    explicit Cursor(const Automaton& automaton) : automaton_(&automaton) {}

    // Consumes one symbol and returns the ids of the patterns ending at it.
    const std::vector<std::size_t>& step(const symbol_type& symbol) {
        state_ = automaton_->next(state_, symbol);
        ++position_;
        return automaton_->outputs(state_);
    }

    void reset() {
        state_ = 0;
        position_ = 0;
    }

    // Number of symbols consumed so far, i.e. the 1-indexed end position of
    // the last symbol.
    std::size_t position() const { return position_; }
    state_id state() const { return state_; }
    const Automaton& automaton() const { return *automaton_; }

private:
    template <class, class>
    friend class MatchIterator;

    // Placeholder held by the end iterator; never stepped.
    Cursor() = default;

    const Automaton* automaton_{nullptr};
    state_id state_{0};
    std::size_t position_{0};
};

// Input iterator producing matches while pulling symbols from [first, last).
// A symbol is read only when the matches of the previous one are exhausted.
template <class Automaton, class InputIt>
class MatchIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Match;
    using difference_type = std::ptrdiff_t;
    using pointer = const Match*;
    using reference = const Match&;

    MatchIterator() = default;

    MatchIterator(Cursor<Automaton> cursor, InputIt first, InputIt last)
        : cursor_(std::move(cursor)), current_(std::move(first)), last_(std::move(last)),
          done_(false) {
        advance();
    }

    reference operator*() const { return match_; }
    pointer operator->() const { return &match_; }

    MatchIterator& operator++() {
        advance();
        return *this;
    }

    MatchIterator operator++(int) {
        MatchIterator previous = *this;
        advance();
        return previous;
    }

    // Only comparison against the end iterator is meaningful.
    friend bool operator==(const MatchIterator& lhs, const MatchIterator& rhs) {
        return lhs.done_ == rhs.done_;
    }

    friend bool operator!=(const MatchIterator& lhs, const MatchIterator& rhs) {
        return !(lhs == rhs);
    }

private:
    Cursor<Automaton> cursor_;
    InputIt current_{};
    InputIt last_{};
    const std::vector<std::size_t>* outputs_{nullptr};
    std::size_t next_output_{0};
    Match match_;
    bool done_{true};

    void advance() {
        while (outputs_ == nullptr || next_output_ == outputs_->size()) {
            if (current_ == last_) {
                done_ = true;
                outputs_ = nullptr;
                return;
            }
            outputs_ = &cursor_.step(*current_);
            ++current_;
            next_output_ = 0;
        }

        const std::size_t id = (*outputs_)[next_output_++];
        match_.pattern_id = id;
        match_.length = cursor_.automaton().pattern(id).size();
        match_.start = cursor_.position() - match_.length;
    }
};

// Lazy, restartable view of the matches in [first, last). Every begin() call
// starts a fresh scan; with single-pass iterators only the first one is
// meaningful.
template <class Automaton, class InputIt>
class MatchRange {
public:
    using iterator = MatchIterator<Automaton, InputIt>;

    MatchRange(const Automaton& automaton, InputIt first, InputIt last)
        : automaton_(&automaton), first_(std::move(first)), last_(std::move(last)) {}

    iterator begin() const { return iterator(Cursor<Automaton>(*automaton_), first_, last_); }
    iterator end() const { return iterator(); }

private:
    const Automaton* automaton_;
    InputIt first_;
    InputIt last_;
};

}  // namespace pattern_automata

#pragma once

#include <stdexcept>
#include <string>

namespace pattern_automata {

// Lifecycle violations of an automaton (insert* -> compile -> search*).
class AutomatonError : public std::runtime_error {
public:
    explicit AutomatonError(const std::string& what) : std::runtime_error(what) {}
};

class AlreadyBuiltError : public AutomatonError {
public:
    AlreadyBuiltError() : AutomatonError("automaton already built") {}
};

class NotBuiltError : public AutomatonError {
public:
    NotBuiltError() : AutomatonError("automaton not built; call compile() before searching") {}
};

class EmptyPatternError : public AutomatonError {
public:
    EmptyPatternError() : AutomatonError("empty pattern not allowed") {}
};

}  // namespace pattern_automata

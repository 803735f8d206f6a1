#include "automata/aho_corasick.hpp"

#include <string>
#include <vector>

namespace pattern_automata {

template class Trie<std::string>;
template class Trie<std::vector<std::string>>;
template class AhoCorasick<std::string>;
template class AhoCorasick<std::vector<std::string>>;

}  // namespace pattern_automata

#pragma once

#include <cstddef>
#include <string>

namespace pattern_automata {

inline constexpr std::size_t kDefaultMaxReport = 100;

inline constexpr const char* kStdinPath = "-";

inline constexpr char kCommentPrefix = '#';

inline const std::string kVersion = "0.1.0";

}  // namespace pattern_automata

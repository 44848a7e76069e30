#pragma once

#include <string>
#include <string_view>

namespace csvsed {

// Expands "a-f" style ranges into the explicit characters "abcdef".
// A backslash emits the next character literally; a dash with nothing before
// or after it is literal. Chained ranges continue from the last emitted
// character ("a-c-e" == "abcde").
// Throws std::invalid_argument when a range runs backwards ("z-a").
auto expand_ranges(std::u32string_view pattern) -> std::u32string;

// UTF-8 convenience overload
auto expand_ranges(std::string_view pattern) -> std::string;

} // namespace csvsed

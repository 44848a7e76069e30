#include "csvsed/core/char_ranges.hpp"
#include "csvsed/string_utils.hpp"
#include <stdexcept>

namespace csvsed {

auto expand_ranges(std::u32string_view pattern) -> std::u32string {
    std::u32string result;
    size_t index = 0;

    while (index < pattern.size()) {
        char32_t c = pattern[index++];

        if (c == U'-' && !result.empty() && index < pattern.size()) {
            char32_t first = result.back();
            char32_t last = pattern[index++];
            if (first > last) {
                throw std::invalid_argument("invalid range \"" +
                                            StringUtils::encode_utf8(std::u32string{first, U'-', last}) +
                                            "\": start is after end");
            }
            for (char32_t next = first + 1; next <= last; ++next) {
                result.push_back(next);
            }
            continue;
        }

        if (c == U'\\' && index < pattern.size()) {
            c = pattern[index++];
        }
        result.push_back(c);
    }

    return result;
}

auto expand_ranges(std::string_view pattern) -> std::string {
    return StringUtils::encode_utf8(expand_ranges(std::u32string_view(StringUtils::decode_utf8(pattern))));
}

} // namespace csvsed

#pragma once

#include <locale>
#include <string>
#include <string_view>
#include <vector>

namespace csvsed {

class StringUtils {
public:
    // Malformed bytes round-trip through lone surrogates U+DC80..U+DCFF
    static auto decode_utf8(std::string_view text) -> std::u32string;
    static auto encode_utf8(std::u32string_view text) -> std::string;

    // Wide strings for <regex>; wchar_t holds a full code point on supported platforms
    static auto to_wide(std::string_view text) -> std::wstring;
    static auto from_wide(std::wstring_view text) -> std::string;

    // Split on every occurrence of separator, keeping empty parts
    static auto split_on(std::u32string_view text, char32_t separator) -> std::vector<std::u32string>;
    static auto split_on(std::string_view text, char separator) -> std::vector<std::string>;

    // UTF-8 locale for case mapping and regex traits; classic "C" when none is installed
    static auto unicode_locale() -> const std::locale&;

    static auto trim(std::string_view text) -> std::string;
    static auto is_unsigned_integer(std::string_view text) -> bool;
};

} // namespace csvsed

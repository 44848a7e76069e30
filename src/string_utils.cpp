#include "csvsed/string_utils.hpp"
#include <cctype>
#include <initializer_list>
#include <stdexcept>

namespace csvsed {

static_assert(sizeof(wchar_t) == sizeof(char32_t), "wchar_t must hold a full code point");

namespace {

constexpr char32_t ESCAPE_BASE = 0xDC00;  // lone surrogate carrying a raw byte

auto sequence_length(unsigned char lead) -> size_t {
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 0;
}

} // namespace

auto StringUtils::decode_utf8(std::string_view text) -> std::u32string {
    static constexpr char32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
    static constexpr unsigned char lead_mask[] = {0, 0, 0x1F, 0x0F, 0x07};

    std::u32string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            result.push_back(lead);
            ++i;
            continue;
        }

        size_t length = sequence_length(lead);
        bool valid = length > 0 && i + length <= text.size();
        char32_t code_point = valid ? (lead & lead_mask[length]) : 0;

        for (size_t k = 1; valid && k < length; ++k) {
            auto continuation = static_cast<unsigned char>(text[i + k]);
            if ((continuation & 0xC0) != 0x80) {
                valid = false;
            } else {
                code_point = (code_point << 6) | (continuation & 0x3F);
            }
        }

        // Overlong forms, surrogates and values past U+10FFFF are malformed
        if (valid) {
            valid = code_point >= min_for_length[length] && code_point <= 0x10FFFF &&
                    !(code_point >= 0xD800 && code_point <= 0xDFFF);
        }

        if (!valid) {
            result.push_back(ESCAPE_BASE + lead);
            ++i;
            continue;
        }

        result.push_back(code_point);
        i += length;
    }

    return result;
}

auto StringUtils::encode_utf8(std::u32string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());

    for (char32_t code_point : text) {
        if (code_point >= ESCAPE_BASE + 0x80 && code_point <= ESCAPE_BASE + 0xFF) {
            result.push_back(static_cast<char>(code_point - ESCAPE_BASE));
        } else if (code_point < 0x80) {
            result.push_back(static_cast<char>(code_point));
        } else if (code_point < 0x800) {
            result.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
            result.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else if (code_point < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
            result.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
            result.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    return result;
}

auto StringUtils::to_wide(std::string_view text) -> std::wstring {
    auto decoded = decode_utf8(text);
    return std::wstring(decoded.begin(), decoded.end());
}

auto StringUtils::from_wide(std::wstring_view text) -> std::string {
    std::u32string code_points(text.begin(), text.end());
    return encode_utf8(code_points);
}

auto StringUtils::split_on(std::u32string_view text, char32_t separator)
    -> std::vector<std::u32string> {
    std::vector<std::u32string> parts;
    size_t start = 0;
    while (true) {
        size_t end = text.find(separator, start);
        if (end == std::u32string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

auto StringUtils::split_on(std::string_view text, char separator) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = text.find(separator, start);
        if (end == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

auto StringUtils::unicode_locale() -> const std::locale& {
    static const std::locale locale = [] {
        for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
            try {
                return std::locale(name);
            } catch (const std::runtime_error&) {
                // not installed, try the next name
            }
        }
        return std::locale::classic();
    }();
    return locale;
}

auto StringUtils::trim(std::string_view text) -> std::string {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

auto StringUtils::is_unsigned_integer(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace csvsed

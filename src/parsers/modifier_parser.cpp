#include "csvsed/parsers/modifier_parser.hpp"
#include "csvsed/core/char_ranges.hpp"
#include "csvsed/core/errors.hpp"
#include "csvsed/io/shell_command_runner.hpp"
#include "csvsed/string_utils.hpp"
#include <cwctype>
#include <locale>
#include <stdexcept>

namespace csvsed {

namespace {

constexpr size_t SUBSTITUTE_PARTS = 4;
constexpr size_t TRANSLITERATE_PARTS = 4;
constexpr size_t EXECUTE_PARTS = 3;

auto quoted(char32_t c) -> std::string {
    return "'" + StringUtils::encode_utf8(std::u32string(1, c)) + "'";
}

auto is_digit(char32_t c) -> bool {
    return c >= U'0' && c <= U'9';
}

// Removes verbose-mode whitespace/comments and widens '.' for dot-all mode.
// Escapes and bracket expressions are copied through untouched.
auto rewrite_pattern(const std::u32string& pattern, bool verbose, bool dot_all) -> std::u32string {
    std::u32string result;
    bool in_class = false;

    for (size_t i = 0; i < pattern.size(); ++i) {
        char32_t c = pattern[i];

        if (c == U'\\' && i + 1 < pattern.size()) {
            result.push_back(c);
            result.push_back(pattern[++i]);
            continue;
        }

        if (in_class) {
            in_class = c != U']';
            result.push_back(c);
            continue;
        }

        if (c == U'[') {
            in_class = true;
            result.push_back(c);
            // A leading ']' (after an optional '^') is a literal member
            if (i + 1 < pattern.size() && pattern[i + 1] == U'^') {
                result.push_back(pattern[++i]);
            }
            if (i + 1 < pattern.size() && pattern[i + 1] == U']') {
                result.push_back(pattern[++i]);
            }
            continue;
        }

        if (verbose && std::iswspace(static_cast<wint_t>(c))) {
            continue;
        }

        if (verbose && c == U'#') {
            while (i + 1 < pattern.size() && pattern[i + 1] != U'\n') {
                ++i;
            }
            continue;
        }

        if (dot_all && c == U'.') {
            result += U"[\\s\\S]";
            continue;
        }

        result.push_back(c);
    }

    return result;
}

auto format_group(unsigned group) -> std::wstring {
    std::wstring reference = L"$";
    reference.push_back(static_cast<wchar_t>(L'0' + group / 10));
    reference.push_back(static_cast<wchar_t>(L'0' + group % 10));
    return reference;
}

// Translates a sed-style replacement ("\1", "\g<1>", "\\") into <regex>
// format syntax ("$01"). A literal '$' is escaped as "$$".
auto translate_replacement(const std::string& spec, const std::u32string& replacement,
                           unsigned group_count) -> std::wstring {
    std::wstring format;

    auto add_group = [&](unsigned group) {
        if (group > group_count) {
            throw InvalidModifierError(spec, "invalid group reference " + std::to_string(group));
        }
        format += format_group(group);
    };

    for (size_t i = 0; i < replacement.size(); ++i) {
        char32_t c = replacement[i];

        if (c == U'$') {
            format += L"$$";
            continue;
        }
        if (c != U'\\' || i + 1 == replacement.size()) {
            format.push_back(static_cast<wchar_t>(c));
            continue;
        }

        char32_t escaped = replacement[++i];
        if (is_digit(escaped)) {
            unsigned group = escaped - U'0';
            if (i + 1 < replacement.size() && is_digit(replacement[i + 1])) {
                group = group * 10 + (replacement[++i] - U'0');
            }
            add_group(group);
        } else if (escaped == U'g' && i + 1 < replacement.size() && replacement[i + 1] == U'<') {
            size_t close = replacement.find(U'>', i + 2);
            auto name = close == std::u32string::npos ? std::u32string{}
                                                      : replacement.substr(i + 2, close - i - 2);
            if (name.empty() || name.size() > 2 ||
                !StringUtils::is_unsigned_integer(StringUtils::encode_utf8(name))) {
                throw InvalidModifierError(spec, "bad group reference in replacement \"" +
                                                     StringUtils::encode_utf8(replacement) + "\"");
            }
            add_group(static_cast<unsigned>(std::stoul(StringUtils::encode_utf8(name))));
            i = close;
        } else if (escaped == U'n') {
            format.push_back(L'\n');
        } else if (escaped == U't') {
            format.push_back(L'\t');
        } else if (escaped == U'r') {
            format.push_back(L'\r');
        } else if (escaped == U'\\') {
            format.push_back(L'\\');
        } else {
            format.push_back(L'\\');
            format.push_back(static_cast<wchar_t>(escaped));
        }
    }

    return format;
}

auto fold_case(const std::u32string& text, bool upper) -> std::u32string {
    const auto& locale = StringUtils::unicode_locale();
    std::u32string result;
    result.reserve(text.size());
    for (char32_t c : text) {
        auto wide = static_cast<wchar_t>(c);
        result.push_back(static_cast<char32_t>(upper ? std::toupper(wide, locale)
                                                     : std::tolower(wide, locale)));
    }
    return result;
}

} // namespace

ModifierParser::ModifierParser(ParserOptions options) : options_(std::move(options)) {
    if (!options_.runner) {
        options_.runner = std::make_shared<ShellCommandRunner>();
    }
}

auto ModifierParser::expected_form(char32_t type, char32_t delimiter) -> std::string {
    std::u32string form;
    switch (type) {
    case U's':
        form = U"s/REGEX/REPL/FLAGS";
        break;
    case U'y':
        form = U"y/SOURCE/DEST/FLAGS";
        break;
    case U'e':
        form = U"e/COMMAND/";
        break;
    default:
        return "";
    }
    for (auto& c : form) {
        if (c == U'/') {
            c = delimiter;
        }
    }
    return StringUtils::encode_utf8(form);
}

auto ModifierParser::parse(const std::string& spec) const -> Modifier {
    if (spec.empty()) {
        throw InvalidModifierError(spec, "empty modifier");
    }

    auto text = StringUtils::decode_utf8(spec);
    switch (text[0]) {
    case U's':
        return parse_substitute(spec, text);
    case U'y':
        return parse_transliterate(spec, text);
    case U'e':
        return parse_execute(spec, text);
    default:
        throw InvalidModifierError(spec, "unsupported modifier type " + quoted(text[0]) +
                                             " (expected 's', 'y' or 'e')");
    }
}

auto ModifierParser::split_parts(const std::string& spec, const std::u32string& text,
                                 size_t expected_parts) const -> std::vector<std::u32string> {
    char32_t delimiter = text.size() > 1 ? text[1] : U'/';
    auto mismatch = [&]() {
        return InvalidModifierError(spec, "does not match expected form \"" +
                                              expected_form(text[0], delimiter) + "\"");
    };

    // type + one delimiter per remaining part
    if (text.size() < expected_parts) {
        throw mismatch();
    }

    auto parts = StringUtils::split_on(text, delimiter);
    if (parts.size() != expected_parts) {
        throw mismatch();
    }
    return parts;
}

auto ModifierParser::validate_flags(const std::string& spec, const std::u32string& flags,
                                    std::u32string_view supported) const -> void {
    for (char32_t flag : flags) {
        if (supported.find(flag) != std::u32string_view::npos) {
            continue;
        }

        std::string message = "unsupported flag " + quoted(flag) + ": modifier " + quoted(spec.front());
        if (supported.empty()) {
            message += " takes no flags";
        } else if (supported.size() == 1) {
            message += " supports only the flag " + quoted(supported.front());
        } else {
            message += " supports the flags ";
            for (size_t i = 0; i < supported.size(); ++i) {
                message += (i == 0 ? "" : ", ") + quoted(supported[i]);
            }
        }
        throw InvalidModifierError(spec, message);
    }
}

auto ModifierParser::parse_substitute(const std::string& spec, const std::u32string& text) const
    -> Modifier {
    auto parts = split_parts(spec, text, SUBSTITUTE_PARTS);
    if (parts[1].empty()) {
        throw InvalidModifierError(spec, "no previous regular expression");
    }

    const auto& flags = parts[3];
    validate_flags(spec, flags, substitute_flags_);

    auto has_flag = [&flags](char32_t flag) { return flags.find(flag) != std::u32string::npos; };

    auto syntax = std::regex_constants::ECMAScript;
    if (has_flag(U'i')) {
        syntax |= std::regex_constants::icase;
    }
    if (has_flag(U'l')) {
        syntax |= std::regex_constants::collate;
    }
    if (has_flag(U'm')) {
        syntax |= std::regex_constants::multiline;
    }

    auto source = rewrite_pattern(parts[1], has_flag(U'x'), has_flag(U's'));

    SubstituteModifier modifier;
    modifier.spec = spec;
    try {
        modifier.pattern.imbue(StringUtils::unicode_locale());
        modifier.pattern.assign(std::wstring(source.begin(), source.end()), syntax);
    } catch (const std::regex_error& e) {
        throw InvalidModifierError(spec, std::string("cannot compile regular expression: ") + e.what());
    }
    modifier.format = translate_replacement(spec, parts[2],
                                            static_cast<unsigned>(modifier.pattern.mark_count()));
    modifier.count = has_flag(U'g') ? 0 : 1;
    return modifier;
}

auto ModifierParser::parse_transliterate(const std::string& spec, const std::u32string& text) const
    -> Modifier {
    auto parts = split_parts(spec, text, TRANSLITERATE_PARTS);
    if (parts[1].empty()) {
        throw InvalidModifierError(spec, "no previous regular expression");
    }
    validate_flags(spec, parts[3], transliterate_flags_);

    std::u32string source;
    std::u32string destination;
    try {
        source = expand_ranges(std::u32string_view(parts[1]));
        destination = expand_ranges(std::u32string_view(parts[2]));
    } catch (const std::invalid_argument& e) {
        throw InvalidModifierError(spec, e.what());
    }

    if (source.size() != destination.size()) {
        throw InvalidModifierError(spec, "source and destination must have equal length (" +
                                             std::to_string(source.size()) + " != " +
                                             std::to_string(destination.size()) + ")");
    }

    if (parts[3].find(U'i') != std::u32string::npos) {
        source = fold_case(source, false) + fold_case(source, true);
        destination += destination;
    }

    TransliterateModifier modifier;
    modifier.spec = spec;
    for (size_t i = 0; i < source.size(); ++i) {
        // First mapping of a character wins
        modifier.table.emplace(source[i], destination[i]);
    }
    return modifier;
}

auto ModifierParser::parse_execute(const std::string& spec, const std::u32string& text) const
    -> Modifier {
    auto parts = split_parts(spec, text, EXECUTE_PARTS);
    validate_flags(spec, parts[2], execute_flags_);

    ExecuteModifier modifier;
    modifier.spec = spec;
    modifier.command = StringUtils::encode_utf8(parts[1]);
    modifier.runner = options_.runner;
    modifier.timeout = options_.command_timeout;
    return modifier;
}

} // namespace csvsed

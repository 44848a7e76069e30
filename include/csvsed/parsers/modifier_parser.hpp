#pragma once

#include "csvsed/core/modifier.hpp"
#include "csvsed/interfaces.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace csvsed {

struct ParserOptions {
    std::shared_ptr<ICommandRunner> runner;  // defaults to ShellCommandRunner when null
    std::chrono::milliseconds command_timeout{DEFAULT_COMMAND_TIMEOUT};
};

class ModifierParser {
public:
    explicit ModifierParser(ParserOptions options = {});

    // Throws InvalidModifierError naming the modifier and the expected form
    auto parse(const std::string& spec) const -> Modifier;

    // "s/REGEX/REPL/FLAGS" with '/' replaced by the modifier's own delimiter
    static auto expected_form(char32_t type, char32_t delimiter) -> std::string;

private:
    auto split_parts(const std::string& spec, const std::u32string& text, size_t expected_parts) const
        -> std::vector<std::u32string>;
    auto validate_flags(const std::string& spec, const std::u32string& flags,
                        std::u32string_view supported) const -> void;

    auto parse_substitute(const std::string& spec, const std::u32string& text) const -> Modifier;
    auto parse_transliterate(const std::string& spec, const std::u32string& text) const -> Modifier;
    auto parse_execute(const std::string& spec, const std::u32string& text) const -> Modifier;

    ParserOptions options_;

    static constexpr std::u32string_view substitute_flags_ = U"iglmsux";
    static constexpr std::u32string_view transliterate_flags_ = U"i";
    static constexpr std::u32string_view execute_flags_ = U"";
};

} // namespace csvsed

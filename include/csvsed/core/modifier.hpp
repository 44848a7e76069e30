#pragma once

#include "csvsed/interfaces.hpp"
#include <chrono>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <variant>

namespace csvsed {

// s/REGEX/REPL/FLAGS
struct SubstituteModifier {
    std::string spec;
    std::wregex pattern;
    std::wstring format;  // replacement in <regex> format syntax ($NN back-references)
    size_t count{};       // 0 = every match, 1 = first match only

    auto apply(const std::string& value) const -> std::string;
};

// y/SOURCE/DEST/FLAGS
struct TransliterateModifier {
    std::string spec;
    std::unordered_map<char32_t, char32_t> table;

    auto apply(const std::string& value) const -> std::string;
};

// e/COMMAND/
struct ExecuteModifier {
    std::string spec;
    std::string command;
    std::shared_ptr<ICommandRunner> runner;
    std::chrono::milliseconds timeout{DEFAULT_COMMAND_TIMEOUT};

    auto apply(const std::string& value) const -> std::string;
};

// Library callers may plug in their own function instead of an expression
struct FunctionModifier {
    std::string spec;  // label used in error messages
    ColumnFunction function;

    auto apply(const std::string& value) const -> std::string;
};

using Modifier =
    std::variant<SubstituteModifier, TransliterateModifier, ExecuteModifier, FunctionModifier>;

enum class ModifierKind { SUBSTITUTE, TRANSLITERATE, EXECUTE, FUNCTION };

auto apply_modifier(const Modifier& modifier, const std::string& value) -> std::string;
auto modifier_kind(const Modifier& modifier) -> ModifierKind;
auto modifier_spec(const Modifier& modifier) -> const std::string&;

} // namespace csvsed

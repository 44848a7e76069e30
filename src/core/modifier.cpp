#include "csvsed/core/modifier.hpp"
#include "csvsed/core/errors.hpp"
#include "csvsed/string_utils.hpp"
#include <string_view>

namespace csvsed {

auto SubstituteModifier::apply(const std::string& value) const -> std::string {
    auto flags = count == 1 ? std::regex_constants::format_first_only
                            : std::regex_constants::format_default;
    auto replaced = std::regex_replace(StringUtils::to_wide(value), pattern, format, flags);
    return StringUtils::from_wide(replaced);
}

auto TransliterateModifier::apply(const std::string& value) const -> std::string {
    auto text = StringUtils::decode_utf8(value);
    for (auto& c : text) {
        if (auto it = table.find(c); it != table.end()) {
            c = it->second;
        }
    }
    return StringUtils::encode_utf8(text);
}

auto ExecuteModifier::apply(const std::string& value) const -> std::string {
    std::string prefix = "Execution of modifier \"" + spec + "\" failed: command \"" + command + "\"";
    if (!runner) {
        throw ExecutionError(command, prefix + " has no command runner");
    }

    auto result = runner->run(command, value, timeout);
    if (result.timed_out) {
        throw ExecutionError(command,
                             prefix + " timed out after " + std::to_string(timeout.count()) + " ms",
                             result.error_output);
    }
    if (result.exit_status != 0) {
        std::string_view message = result.error_output;
        if (!message.empty() && message.back() == '\n') {
            message.remove_suffix(1);
        }
        throw ExecutionError(command,
                             prefix + " exited with status " + std::to_string(result.exit_status) +
                                 ": " + std::string(message),
                             result.error_output, result.exit_status);
    }

    auto output = std::move(result.output);
    if (!output.empty() && output.back() == '\n') {
        output.pop_back();
    }
    return output;
}

auto FunctionModifier::apply(const std::string& value) const -> std::string {
    if (!function) {
        throw CsvsedError("Column function \"" + spec + "\" is empty");
    }
    return function(value);
}

auto apply_modifier(const Modifier& modifier, const std::string& value) -> std::string {
    return std::visit([&value](const auto& m) { return m.apply(value); }, modifier);
}

auto modifier_kind(const Modifier& modifier) -> ModifierKind {
    if (std::holds_alternative<SubstituteModifier>(modifier)) {
        return ModifierKind::SUBSTITUTE;
    }
    if (std::holds_alternative<TransliterateModifier>(modifier)) {
        return ModifierKind::TRANSLITERATE;
    }
    if (std::holds_alternative<ExecuteModifier>(modifier)) {
        return ModifierKind::EXECUTE;
    }
    return ModifierKind::FUNCTION;
}

auto modifier_spec(const Modifier& modifier) -> const std::string& {
    return std::visit([](const auto& m) -> const std::string& { return m.spec; }, modifier);
}

} // namespace csvsed

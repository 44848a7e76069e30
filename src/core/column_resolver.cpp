#include "csvsed/core/column_resolver.hpp"
#include "csvsed/core/errors.hpp"
#include <algorithm>
#include <utility>

namespace csvsed {

namespace {

struct ParsedEntry {
    const ModifierEntry* entry;
    Modifier modifier;
};

auto header_position(const Row& header, const std::string& name) -> std::optional<size_t> {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(header.begin(), it));
}

constexpr auto FUNCTION_LABEL = "<function>";

auto entry_label(const ModifierEntry& entry) -> std::string {
    if (entry.function && entry.spec.empty()) {
        return FUNCTION_LABEL;
    }
    return entry.spec;
}

// Empty when the entry carries neither a function nor an expression
auto make_modifier(const ModifierParser& parser, const ModifierEntry& entry)
    -> std::optional<Modifier> {
    if (entry.function) {
        return FunctionModifier{.spec = entry_label(entry), .function = entry.function};
    }
    if (entry.spec.empty()) {
        return std::nullopt;
    }
    return parser.parse(entry.spec);
}

} // namespace

auto describe_column_key(const ColumnKey& key) -> std::string {
    if (const auto* index = std::get_if<size_t>(&key)) {
        return "index " + std::to_string(*index);
    }
    return "\"" + std::get<std::string>(key) + "\"";
}

auto resolve_columns(const ModifierParser& parser, const std::optional<Row>& header,
                     const std::vector<ModifierEntry>& entries) -> ColumnMapping {
    // Parse everything first so a bad modifier is reported before any column error
    std::vector<ParsedEntry> parsed;
    parsed.reserve(entries.size());
    for (const auto& entry : entries) {
        if (auto modifier = make_modifier(parser, entry)) {
            parsed.push_back(ParsedEntry{.entry = &entry, .modifier = std::move(*modifier)});
        }
    }

    ColumnMapping mapping;
    std::map<size_t, const ModifierEntry*> owners;

    auto assign = [&](size_t index, ParsedEntry& item) {
        if (auto owner = owners.find(index); owner != owners.end()) {
            const auto* first = owner->second;
            const auto* second = item.entry;
            // Report the name side of the collision as the subject when there is one
            if (std::holds_alternative<std::string>(first->column) &&
                !std::holds_alternative<std::string>(second->column)) {
                std::swap(first, second);
            }
            throw ColumnIdentifierError(
                "Column " + describe_column_key(second->column) + " has index " +
                std::to_string(index) + " which already has a modifier (" +
                describe_column_key(first->column) + ": \"" + entry_label(*first) +
                "\"; conflicting: \"" + entry_label(*second) + "\")");
        }
        owners.emplace(index, item.entry);
        mapping.emplace(index, std::move(item.modifier));
    };

    // Explicit indices claim their columns before names are resolved
    for (auto& item : parsed) {
        if (const auto* index = std::get_if<size_t>(&item.entry->column)) {
            assign(*index, item);
        }
    }

    for (auto& item : parsed) {
        const auto* name = std::get_if<std::string>(&item.entry->column);
        if (name == nullptr) {
            continue;
        }
        if (!header) {
            throw ColumnIdentifierError("Column \"" + *name +
                                        "\" cannot be resolved by name: input has no header row");
        }
        auto position = header_position(*header, *name);
        if (!position) {
            throw ColumnIdentifierError("Column \"" + *name + "\" is not a header name");
        }
        assign(*position, item);
    }

    return mapping;
}

auto resolve_columns(const ModifierParser& parser, const std::vector<std::string>& specs)
    -> ColumnMapping {
    ColumnMapping mapping;
    for (size_t index = 0; index < specs.size(); ++index) {
        if (specs[index].empty()) {
            continue;
        }
        mapping.emplace(index, parser.parse(specs[index]));
    }
    return mapping;
}

} // namespace csvsed

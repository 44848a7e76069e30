#pragma once

#include "csvsed/core/modifier.hpp"
#include "csvsed/parsers/modifier_parser.hpp"
#include "csvsed/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace csvsed {

// Zero-based column index -> the single operator applied to it.
// Ordered so operators run in column order on every row.
using ColumnMapping = std::map<size_t, Modifier>;

// Keyed entries: indices stay as-is, names are looked up in header.
// Every modifier is parsed before any column is resolved.
// Throws InvalidModifierError or ColumnIdentifierError.
auto resolve_columns(const ModifierParser& parser, const std::optional<Row>& header,
                     const std::vector<ModifierEntry>& entries) -> ColumnMapping;

// Positional entries: specs[i] applies to column i; empty specs are skipped
auto resolve_columns(const ModifierParser& parser, const std::vector<std::string>& specs)
    -> ColumnMapping;

auto describe_column_key(const ColumnKey& key) -> std::string;

} // namespace csvsed

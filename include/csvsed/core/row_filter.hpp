#pragma once

#include "csvsed/core/column_resolver.hpp"
#include "csvsed/interfaces.hpp"
#include <optional>

namespace csvsed {

enum class FilterState { AWAITING_HEADER, STREAMING, EXHAUSTED };

// Pulls rows from an upstream source and applies the column mapping to each
// data row. The header row (if configured) is passed through untouched.
// A RowFilter is itself a row source so filters can be chained.
class RowFilter : public IRowSource {
public:
    RowFilter(IRowSource& source, ColumnMapping mapping, bool has_header);

    auto next() -> std::optional<Row> override;

    auto state() const -> FilterState { return state_; }
    auto rows_filtered() const -> size_t { return rows_filtered_; }

private:
    auto transform(Row& row) const -> void;

    IRowSource& source_;
    ColumnMapping mapping_;
    FilterState state_;
    size_t rows_filtered_{};
};

} // namespace csvsed

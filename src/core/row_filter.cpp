#include "csvsed/core/row_filter.hpp"
#include "csvsed/core/errors.hpp"

namespace csvsed {

RowFilter::RowFilter(IRowSource& source, ColumnMapping mapping, bool has_header)
    : source_(source), mapping_(std::move(mapping)),
      state_(has_header ? FilterState::AWAITING_HEADER : FilterState::STREAMING) {}

auto RowFilter::next() -> std::optional<Row> {
    switch (state_) {
    case FilterState::EXHAUSTED:
        return std::nullopt;

    case FilterState::AWAITING_HEADER: {
        auto header = source_.next();
        if (!header) {
            state_ = FilterState::EXHAUSTED;
            return std::nullopt;
        }
        state_ = FilterState::STREAMING;
        return header;
    }

    case FilterState::STREAMING: {
        auto row = source_.next();
        if (!row) {
            state_ = FilterState::EXHAUSTED;
            return std::nullopt;
        }
        ++rows_filtered_;
        transform(*row);
        return row;
    }
    }
    return std::nullopt;
}

auto RowFilter::transform(Row& row) const -> void {
    for (const auto& [index, modifier] : mapping_) {
        if (index >= row.size()) {
            throw ColumnIdentifierError("Column index " + std::to_string(index) +
                                        " is out of range for record " +
                                        std::to_string(rows_filtered_) + " with " +
                                        std::to_string(row.size()) + " fields");
        }
        row[index] = apply_modifier(modifier, row[index]);
    }
}

} // namespace csvsed

#include "csvsed/core/row_sources.hpp"
#include <utility>

namespace csvsed {

VectorRowSource::VectorRowSource(std::vector<Row> rows) : rows_(std::move(rows)) {}

auto VectorRowSource::next() -> std::optional<Row> {
    if (position_ >= rows_.size()) {
        return std::nullopt;
    }
    return rows_[position_++];
}

PeekableRowSource::PeekableRowSource(IRowSource& source) : source_(source) {}

auto PeekableRowSource::peek() -> const std::optional<Row>& {
    if (!has_buffered_) {
        buffered_ = source_.next();
        has_buffered_ = true;
    }
    return buffered_;
}

auto PeekableRowSource::next() -> std::optional<Row> {
    if (has_buffered_) {
        has_buffered_ = false;
        return std::exchange(buffered_, std::nullopt);
    }
    return source_.next();
}

} // namespace csvsed

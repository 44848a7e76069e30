#pragma once

#include "csvsed/interfaces.hpp"
#include <optional>
#include <vector>

namespace csvsed {

// In-memory source
class VectorRowSource : public IRowSource {
public:
    explicit VectorRowSource(std::vector<Row> rows);

    auto next() -> std::optional<Row> override;

private:
    std::vector<Row> rows_;
    size_t position_{};
};

// Buffers at most one row so callers can inspect the header before streaming
class PeekableRowSource : public IRowSource {
public:
    explicit PeekableRowSource(IRowSource& source);

    auto peek() -> const std::optional<Row>&;
    auto next() -> std::optional<Row> override;

private:
    IRowSource& source_;
    std::optional<Row> buffered_;
    bool has_buffered_{};
};

} // namespace csvsed

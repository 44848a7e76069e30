#pragma once

#include "csvsed/interfaces.hpp"
#include <istream>
#include <optional>

namespace csvsed {

struct CsvDialect {
    char delimiter = ',';
    char quote_char = '"';
};

// RFC 4180 reader; consumes exactly one record per next() call
class CsvReader : public IRowSource {
public:
    explicit CsvReader(std::istream& input, CsvDialect dialect = {});

    auto next() -> std::optional<Row> override;

    // Physical line on which the last returned record ended (1-based)
    auto line_number() const -> size_t { return line_number_; }

private:
    std::istream& input_;
    CsvDialect dialect_;
    size_t line_number_{};
};

} // namespace csvsed

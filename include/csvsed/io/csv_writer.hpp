#pragma once

#include "csvsed/interfaces.hpp"
#include "csvsed/io/csv_reader.hpp"
#include <ostream>
#include <string>

namespace csvsed {

// Minimal-quoting writer with "\n" record terminators
class CsvWriter : public IRowSink {
public:
    explicit CsvWriter(std::ostream& output, CsvDialect dialect = {});

    auto write_header(const Row& header) -> void override;
    auto write_row(const Row& row) -> void override;

private:
    auto needs_quoting(const std::string& field) const -> bool;
    auto write_field(const std::string& field) -> void;

    std::ostream& output_;
    CsvDialect dialect_;
};

} // namespace csvsed

#include "csvsed/io/csv_writer.hpp"

namespace csvsed {

CsvWriter::CsvWriter(std::ostream& output, CsvDialect dialect) : output_(output), dialect_(dialect) {}

auto CsvWriter::write_header(const Row& header) -> void {
    write_row(header);
}

auto CsvWriter::write_row(const Row& row) -> void {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            output_ << dialect_.delimiter;
        }
        write_field(row[i]);
    }
    output_ << '\n';
}

auto CsvWriter::needs_quoting(const std::string& field) const -> bool {
    return field.find_first_of(std::string{dialect_.delimiter, dialect_.quote_char, '\r', '\n'}) !=
           std::string::npos;
}

auto CsvWriter::write_field(const std::string& field) -> void {
    if (!needs_quoting(field)) {
        output_ << field;
        return;
    }

    output_ << dialect_.quote_char;
    for (char c : field) {
        if (c == dialect_.quote_char) {
            output_ << dialect_.quote_char;
        }
        output_ << c;
    }
    output_ << dialect_.quote_char;
}

} // namespace csvsed

#include "csvsed/io/csv_reader.hpp"
#include "csvsed/core/errors.hpp"
#include <string>

namespace csvsed {

CsvReader::CsvReader(std::istream& input, CsvDialect dialect) : input_(input), dialect_(dialect) {}

auto CsvReader::next() -> std::optional<Row> {
    using traits = std::istream::traits_type;

    if (traits::eq_int_type(input_.peek(), traits::eof())) {
        return std::nullopt;
    }

    Row row;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    size_t start_line = ++line_number_;

    while (true) {
        auto next_char = input_.get();
        if (traits::eq_int_type(next_char, traits::eof())) {
            if (in_quotes) {
                throw CsvsedError("Unterminated quoted field in record starting on line " +
                                  std::to_string(start_line));
            }
            row.push_back(std::move(field));
            return row;
        }

        char c = traits::to_char_type(next_char);

        if (in_quotes) {
            if (c == dialect_.quote_char) {
                if (traits::eq_int_type(input_.peek(), traits::to_int_type(dialect_.quote_char))) {
                    input_.get();
                    field.push_back(c);
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line_number_;
                }
                field.push_back(c);
            }
            continue;
        }

        if (c == dialect_.quote_char && field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
        } else if (c == dialect_.delimiter) {
            row.push_back(std::move(field));
            field.clear();
            field_quoted = false;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && traits::eq_int_type(input_.peek(), traits::to_int_type('\n'))) {
                input_.get();
            }
            row.push_back(std::move(field));
            return row;
        } else {
            field.push_back(c);
        }
    }
}

} // namespace csvsed

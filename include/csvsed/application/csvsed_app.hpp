#pragma once

#include "csvsed/interfaces.hpp"
#include "csvsed/io/csv_reader.hpp"
#include "csvsed/types.hpp"
#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace csvsed {

struct Config {
    std::string input_file = "-";     // stdin by default
    std::string expression;           // modifier applied to every selected column
    std::string columns;              // comma separated indices/names; empty = all
    CsvDialect input_dialect;
    CsvDialect output_dialect;
    bool has_header = true;
    std::chrono::milliseconds command_timeout{DEFAULT_COMMAND_TIMEOUT};
};

class CsvsedApp {
private:
    std::shared_ptr<ICommandRunner> runner_;

public:
    explicit CsvsedApp(std::shared_ptr<ICommandRunner> runner);

    // Reads config.input_file (or stdin) and writes to std::cout
    auto run(const Config& config) -> int;

    // Returns 0 on success, 1 on any error (reported on err)
    auto run(const Config& config, std::istream& in, std::ostream& out, std::ostream& err) -> int;

private:
    auto build_entries(const Config& config, const std::optional<Row>& first_row,
                       const std::optional<Row>& header) const -> std::vector<ModifierEntry>;
    auto stream_rows(IRowSource& rows, IRowSink& sink, bool has_header, size_t& records) const
        -> void;
};

// Splits a --columns value into index and name selectors; "2-4" selects indices 2, 3 and 4
auto parse_column_list(const std::string& columns) -> std::vector<ColumnKey>;

} // namespace csvsed

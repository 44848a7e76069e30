#include "csvsed/application/csvsed_app.hpp"
#include "csvsed/core/column_resolver.hpp"
#include "csvsed/core/errors.hpp"
#include "csvsed/core/row_filter.hpp"
#include "csvsed/core/row_sources.hpp"
#include "csvsed/io/csv_writer.hpp"
#include "csvsed/parsers/modifier_parser.hpp"
#include "csvsed/string_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace csvsed {

namespace {

// Widest N-M range accepted on the command line
constexpr size_t MAX_COLUMN_RANGE = 100000;

auto parse_index(const std::string& token) -> size_t {
    try {
        return static_cast<size_t>(std::stoull(token));
    } catch (const std::out_of_range&) {
        throw ColumnIdentifierError("Column index " + token + " is out of range");
    }
}

} // namespace

auto parse_column_list(const std::string& columns) -> std::vector<ColumnKey> {
    std::vector<ColumnKey> keys;
    for (const auto& raw : StringUtils::split_on(columns, ',')) {
        auto token = StringUtils::trim(raw);
        if (token.empty()) {
            continue;
        }

        if (StringUtils::is_unsigned_integer(token)) {
            keys.emplace_back(parse_index(token));
            continue;
        }

        // Index range; anything else containing '-' is a header name
        auto dash = token.find('-');
        if (dash != std::string::npos && dash > 0) {
            auto first = token.substr(0, dash);
            auto last = token.substr(dash + 1);
            if (StringUtils::is_unsigned_integer(first) && StringUtils::is_unsigned_integer(last)) {
                auto begin = parse_index(first);
                auto end = parse_index(last);
                if (begin > end) {
                    throw ColumnIdentifierError("Column range " + token + " runs backwards");
                }
                if (end - begin >= MAX_COLUMN_RANGE) {
                    throw ColumnIdentifierError("Column range " + token + " spans more than " +
                                                std::to_string(MAX_COLUMN_RANGE) + " columns");
                }
                for (auto index = begin; index <= end; ++index) {
                    keys.emplace_back(index);
                }
                continue;
            }
        }

        keys.emplace_back(token);
    }
    return keys;
}

CsvsedApp::CsvsedApp(std::shared_ptr<ICommandRunner> runner) : runner_(std::move(runner)) {}

auto CsvsedApp::run(const Config& config) -> int {
    if (config.input_file.empty() || config.input_file == "-") {
        return run(config, std::cin, std::cout, std::cerr);
    }

    std::ifstream file(config.input_file, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open input file " << config.input_file << "\n";
        return 1;
    }
    return run(config, file, std::cout, std::cerr);
}

auto CsvsedApp::run(const Config& config, std::istream& in, std::ostream& out, std::ostream& err)
    -> int {
    size_t records = 0;
    bool streaming = false;

    try {
        ModifierParser parser(
            ParserOptions{.runner = runner_, .command_timeout = config.command_timeout});

        // A bad expression fails the run even when there is no input
        parser.parse(config.expression);

        CsvReader reader(in, config.input_dialect);
        PeekableRowSource source(reader);

        const auto& first_row = source.peek();
        if (!first_row) {
            return 0;
        }

        std::optional<Row> header;
        if (config.has_header) {
            header = first_row;
        }
        auto entries = build_entries(config, first_row, header);
        auto mapping = resolve_columns(parser, header, entries);

        RowFilter filter(source, std::move(mapping), config.has_header);
        CsvWriter writer(out, config.output_dialect);

        streaming = true;
        stream_rows(filter, writer, config.has_header, records);
        out.flush();
    } catch (const std::exception& e) {
        out.flush();
        err << "Error: " << e.what();
        if (streaming) {
            err << " (record " << records + 1 << ")";
        }
        err << "\n";
        return 1;
    }

    return 0;
}

auto CsvsedApp::build_entries(const Config& config, const std::optional<Row>& first_row,
                              const std::optional<Row>& header) const
    -> std::vector<ModifierEntry> {
    auto keys = parse_column_list(config.columns);

    // No selection: every column of the first row
    if (keys.empty() && first_row) {
        for (size_t index = 0; index < first_row->size(); ++index) {
            keys.emplace_back(index);
        }
    }

    // The same column selected twice (by index, range or name) gets the expression once.
    // Unknown names are left for the resolver to report.
    std::vector<ColumnKey> unique_keys;
    for (auto& key : keys) {
        if (const auto* name = std::get_if<std::string>(&key); name != nullptr && header) {
            auto it = std::find(header->begin(), header->end(), *name);
            if (it != header->end()) {
                key = static_cast<size_t>(std::distance(header->begin(), it));
            }
        }
        if (std::find(unique_keys.begin(), unique_keys.end(), key) == unique_keys.end()) {
            unique_keys.push_back(std::move(key));
        }
    }

    std::vector<ModifierEntry> entries;
    entries.reserve(unique_keys.size());
    for (auto& key : unique_keys) {
        entries.push_back(ModifierEntry{.column = std::move(key), .spec = config.expression});
    }
    return entries;
}

auto CsvsedApp::stream_rows(IRowSource& rows, IRowSink& sink, bool has_header,
                            size_t& records) const -> void {
    if (has_header) {
        if (auto header = rows.next()) {
            sink.write_header(*header);
        }
    }

    while (auto row = rows.next()) {
        sink.write_row(*row);
        ++records;
    }
}

} // namespace csvsed

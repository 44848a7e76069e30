#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace csvsed {

// One CSV record: ordered fields, already decoded by the reader
using Row = std::vector<std::string>;

// Column selector: zero-based position or header name
using ColumnKey = std::variant<size_t, std::string>;

// Caller-supplied operator: takes one field value, returns the replacement
using ColumnFunction = std::function<std::string(const std::string&)>;

// Raw (unparsed) modifier assigned to a column
struct ModifierEntry {
    ColumnKey column;
    std::string spec;         // e.g. "s/REGEX/REPL/FLAGS"; only a label when function is set
    ColumnFunction function;  // used instead of parsing spec when set
};

// Outcome of running an external command
struct CommandResult {
    int exit_status{};
    std::string output;        // captured stdout
    std::string error_output;  // captured stderr
    bool timed_out{};
};

// Upper bound on one external command; zero means unbounded
inline constexpr std::chrono::milliseconds DEFAULT_COMMAND_TIMEOUT{30000};

} // namespace csvsed

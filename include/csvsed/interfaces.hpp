#pragma once

#include "csvsed/types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace csvsed {

// Abstract interfaces for dependency injection
class IRowSource {
public:
    virtual ~IRowSource() = default;
    // Returns std::nullopt once the source is exhausted
    virtual auto next() -> std::optional<Row> = 0;
};

class IRowSink {
public:
    virtual ~IRowSink() = default;
    virtual auto write_header(const Row& header) -> void = 0;
    virtual auto write_row(const Row& row) -> void = 0;
};

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual auto run(const std::string& command, const std::string& input,
                     std::chrono::milliseconds timeout) -> CommandResult = 0;
};

} // namespace csvsed

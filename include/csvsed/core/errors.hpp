#pragma once

#include <stdexcept>
#include <string>

namespace csvsed {

class CsvsedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed modifier: bad syntax, unsupported type or flag, range/length
// mismatch, regex compilation failure
class InvalidModifierError : public CsvsedError {
public:
    InvalidModifierError(const std::string& modifier, const std::string& reason);

    auto modifier() const -> const std::string& { return modifier_; }
    auto reason() const -> const std::string& { return reason_; }

private:
    std::string modifier_;
    std::string reason_;
};

// Column selection that cannot be mapped onto exactly one physical column
class ColumnIdentifierError : public CsvsedError {
public:
    using CsvsedError::CsvsedError;
};

// External command failed, timed out, or could not be spawned
class ExecutionError : public CsvsedError {
public:
    ExecutionError(const std::string& command, const std::string& message,
                   std::string error_output = "", int exit_status = -1);

    auto command() const -> const std::string& { return command_; }
    auto error_output() const -> const std::string& { return error_output_; }
    auto exit_status() const -> int { return exit_status_; }

private:
    std::string command_;
    std::string error_output_;
    int exit_status_;
};

} // namespace csvsed

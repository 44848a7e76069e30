#pragma once

#include "csvsed/interfaces.hpp"
#include <chrono>
#include <string>

namespace csvsed {

// Runs a command through /bin/sh -c, feeding input on stdin and capturing
// stdout/stderr. One process per call; the child is always reaped.
class ShellCommandRunner : public ICommandRunner {
public:
    auto run(const std::string& command, const std::string& input,
             std::chrono::milliseconds timeout) -> CommandResult override;
};

} // namespace csvsed

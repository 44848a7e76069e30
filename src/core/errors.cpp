#include "csvsed/core/errors.hpp"
#include <utility>

namespace csvsed {

InvalidModifierError::InvalidModifierError(const std::string& modifier, const std::string& reason)
    : CsvsedError("Invalid modifier \"" + modifier + "\": " + reason), modifier_(modifier),
      reason_(reason) {}

ExecutionError::ExecutionError(const std::string& command, const std::string& message,
                               std::string error_output, int exit_status)
    : CsvsedError(message), command_(command), error_output_(std::move(error_output)),
      exit_status_(exit_status) {}

} // namespace csvsed

#pragma once

#include <CommandDescriptor.hpp>

#include <optional>

// Checks a call-site argument against the descriptor's declared type and
// inclusive bounds. Throws InvalidArgument, has no side effects.
void validateArgument(const CommandDescriptor& command,
                      const std::optional<ArgumentValue>& argument);

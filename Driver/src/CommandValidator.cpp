#include <CommandValidator.hpp>

#include <DeviceErrors.hpp>
#include <magic_enum/magic_enum.hpp>

#include <cmath>
#include <format>

namespace {
std::string describe(const ArgumentValue& value) {
  return std::visit([](const auto v) { return std::format("{}", v); }, value);
}

double asReal(const ArgumentValue& value) {
  return std::visit([](const auto v) { return static_cast<double>(v); },
                    value);
}
}  // namespace

void validateArgument(const CommandDescriptor& command,
                      const std::optional<ArgumentValue>& argument) {
  if (!argument.has_value()) {
    return;
  }

  if (!command.argumentType.has_value()) {
    throw InvalidArgument(
        std::format("Command {} takes no argument, got {}", command.name,
                    describe(*argument)));
  }

  const auto expected = *command.argumentType;
  const bool isInteger = std::holds_alternative<std::int64_t>(*argument);
  // Integers widen to reals, reals never narrow.
  if (expected == ArgumentType::Integer && !isInteger) {
    throw InvalidArgument(std::format(
        "Command {} expects an {} argument, got real {}", command.name,
        magic_enum::enum_name(expected), describe(*argument)));
  }

  const auto value = asReal(*argument);
  if (!std::isfinite(value)) {
    throw InvalidArgument(std::format("Command {} got non-finite argument {}",
                                      command.name, describe(*argument)));
  }

  if (command.bounds.has_value()) {
    const auto& bounds = *command.bounds;
    if (!(value >= bounds.min && value <= bounds.max)) {
      throw InvalidArgument(std::format(
          "Command {} argument {} is outside the allowed range [{}, {}]",
          command.name, describe(*argument), bounds.min, bounds.max));
    }
  }
}

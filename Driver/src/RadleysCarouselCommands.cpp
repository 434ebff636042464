#include <RadleysCarouselCommands.hpp>

#include <algorithm>

std::optional<std::string_view> RadleysCarouselCommands::statusName(
    const int code) {
  // Codes outside (-2, 3) are device errors.
  if (!(3 > code && code > -2)) {
    return std::nullopt;
  }
  const auto it = std::find_if(kStatus.begin(), kStatus.end(),
                               [code](const auto& e) { return e.first == code; });
  if (it == kStatus.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string_view> RadleysCarouselCommands::lookup(
    const CodeTable& table, const int code) {
  const auto it = std::find_if(table.begin(), table.end(),
                               [code](const auto& e) { return e.first == code; });
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

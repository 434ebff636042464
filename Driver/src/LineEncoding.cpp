#include <LineEncoding.hpp>

#include <DeviceErrors.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <stdexcept>

void requireSupportedEncoding(const std::string& encoding) {
  std::string normalized(encoding);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized == "utf-8" || normalized == "utf_8" || normalized == "utf8" ||
      normalized == "ascii") {
    return;
  }
  throw std::runtime_error(std::format("Unsupported encoding '{}'", encoding));
}

void requireSevenBit(std::string_view frame, std::string_view link) {
  const auto it = std::find_if(frame.begin(), frame.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0x80u) != 0u;
  });
  if (it != frame.end()) {
    throw InvalidArgument(
        std::format("Frame for {} contains a non 7-bit character at offset {}",
                    link, std::distance(frame.begin(), it)));
  }
}

void maskSevenBit(std::string& line) {
  for (auto& c : line) {
    c = static_cast<char>(static_cast<unsigned char>(c) & 0x7Fu);
  }
}

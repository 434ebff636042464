#include <ReplyParser.hpp>

#include <DeviceErrors.hpp>
#include <magic_enum/magic_enum.hpp>

#include <charconv>
#include <format>
#include <string>
#include <system_error>

namespace {
std::string_view trimAscii(std::string_view text) {
  constexpr std::string_view kWhitespace{" \t\r\n\v\f"};
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

// from_chars rejects an explicit '+', the instruments occasionally send one.
std::string_view dropPlusSign(std::string_view text) {
  if (text.size() > 1 && text.front() == '+') {
    text.remove_prefix(1);
  }
  return text;
}

template <typename T>
T parseNumber(std::string_view original, ReplyType type) {
  const auto text = dropPlusSign(trimAscii(original));
  T value{};
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    throw MalformedReply(std::format("Cannot parse '{}' as {}", original,
                                     magic_enum::enum_name(type)));
  }
  return value;
}
}  // namespace

ReplyValue castReply(std::string_view text, const ReplyType type) {
  switch (type) {
    case ReplyType::String:
      return std::string(text);
    case ReplyType::Integer:
      return parseNumber<std::int64_t>(text, type);
    case ReplyType::Real:
      return parseNumber<double>(text, type);
  }
  throw MalformedReply(std::format("Unknown reply type {}",
                                   static_cast<int>(type)));
}

ReplyValue sliceAndCast(std::string_view raw, const std::size_t start,
                        const std::optional<std::size_t> end,
                        const ReplyType type) {
  if (start > raw.size()) {
    throw MalformedReply(
        std::format("Reply '{}' is too short: slice starts at {} but reply "
                    "has {} characters",
                    raw, start, raw.size()));
  }
  const auto stop = end.value_or(raw.size());
  if (stop < start || stop > raw.size()) {
    throw MalformedReply(std::format(
        "Reply '{}' cannot be sliced to [{}, {})", raw, start, stop));
  }
  return castReply(raw.substr(start, stop - start), type);
}

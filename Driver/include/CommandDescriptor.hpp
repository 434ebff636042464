#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class ArgumentType { Integer, Real };
enum class ReplyType { String, Integer, Real };

using ArgumentValue = std::variant<std::int64_t, double>;
using ReplyValue = std::variant<std::string, std::int64_t, double>;

// Inclusive range applied to the argument before encoding.
struct ArgumentBounds {
  double min{0};
  double max{0};
};

// Substring [start, end) of the reply line; no end means "to end of line".
// Offsets are fixed per command, the reply itself carries no field markers.
struct ReplySlice {
  std::size_t start{0};
  std::optional<std::size_t> end{};
};

struct ReplySpec {
  ReplyType type{ReplyType::String};
  std::optional<ReplySlice> slice{};
};

// Immutable description of one protocol command. Instances are constexpr
// tables owned by the device command set, dispatch only reads them.
struct CommandDescriptor {
  std::string_view name;
  std::optional<ArgumentType> argumentType{};
  std::optional<ArgumentBounds> bounds{};
  std::optional<ReplySpec> reply{};
};

// Framing strings of a line-oriented protocol.
struct ProtocolFraming {
  std::string commandTerminator{"\r\n"};
  std::string replyTerminator{"\r\n"};
  std::string argumentDelimiter{" "};
};

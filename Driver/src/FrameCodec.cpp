#include <FrameCodec.hpp>

#include <ReplyParser.hpp>

#include <format>

std::string formatArgument(const ArgumentValue& argument) {
  if (const auto* integer = std::get_if<std::int64_t>(&argument)) {
    return std::format("{}", *integer);
  }
  auto text = std::format("{}", std::get<double>(argument));
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

std::string encodeFrame(const CommandDescriptor& command,
                        const std::optional<ArgumentValue>& argument,
                        const ProtocolFraming& framing) {
  std::string frame(command.name);
  if (argument.has_value()) {
    frame += framing.argumentDelimiter;
    frame += formatArgument(*argument);
  }
  frame += framing.commandTerminator;
  return frame;
}

std::optional<ReplyValue> decodeReply(const CommandDescriptor& command,
                                      std::string_view raw) {
  if (!command.reply.has_value()) {
    return std::nullopt;
  }
  const auto& spec = *command.reply;
  if (!spec.slice.has_value()) {
    return castReply(raw, spec.type);
  }
  return sliceAndCast(raw, spec.slice->start, spec.slice->end, spec.type);
}

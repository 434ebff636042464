#pragma once

#include <CommandDescriptor.hpp>

#include <optional>
#include <string>
#include <string_view>

// Text form of an argument on the wire: integers in base 10, reals in
// shortest round-trip form with a trailing ".0" when integral.
[[nodiscard]] std::string formatArgument(const ArgumentValue& argument);

// name [delimiter argument] commandTerminator
[[nodiscard]] std::string encodeFrame(
    const CommandDescriptor& command,
    const std::optional<ArgumentValue>& argument,
    const ProtocolFraming& framing);

// Applies the descriptor's reply rule to a line whose terminator was already
// stripped. Returns nullopt for commands that declare no reply.
[[nodiscard]] std::optional<ReplyValue> decodeReply(
    const CommandDescriptor& command, std::string_view raw);

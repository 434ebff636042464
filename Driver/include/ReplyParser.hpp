#pragma once

#include <CommandDescriptor.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

// Cuts raw[start, end) out of a reply line and converts it to `type`.
// Throws MalformedReply when the slice does not fit or the text does not
// parse as the requested type.
[[nodiscard]] ReplyValue sliceAndCast(std::string_view raw, std::size_t start,
                                      std::optional<std::size_t> end,
                                      ReplyType type);

[[nodiscard]] ReplyValue castReply(std::string_view text, ReplyType type);

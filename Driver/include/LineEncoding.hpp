#pragma once

#include <string>
#include <string_view>

// Text rules shared by the byte transports.

// Accepts utf-8 (any spelling) and ascii, throws std::runtime_error otherwise.
void requireSupportedEncoding(const std::string& encoding);

// Throws InvalidArgument naming `link` if any byte of `frame` has bit 7 set.
void requireSevenBit(std::string_view frame, std::string_view link);

// Clears bit 7 of every byte in place.
void maskSevenBit(std::string& line);

#pragma once

#include <string>

namespace utl {
enum class EParity { None, Even, Odd };
enum class EStopBits { One, Two };
enum class ETemperatureSensor { Hotplate = 0, Probe = 1 };

// Default wire encoding of line-oriented instruments.
inline const std::string kDefaultEncoding{"utf-8"};

}  // namespace utl

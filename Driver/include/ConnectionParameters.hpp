#pragma once

#include <CommonDefinitions.hpp>

#include <optional>
#include <string>

// Link settings, fixed when the connection object is built.
// For serial links `port` is the device path; for TCP it is the port number
// and `address` the host.
struct ConnectionParameters {
  std::string port;
  std::optional<std::string> address{};
  int baudRate{9600};
  int byteSize{8};
  utl::EParity parity{utl::EParity::None};
  utl::EStopBits stopBits{utl::EStopBits::One};
  std::string encoding{utl::kDefaultEncoding};
  bool strict7Bit{true};
  unsigned readTimeoutMS{1000};
};

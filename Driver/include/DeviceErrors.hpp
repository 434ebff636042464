#pragma once

#include <stdexcept>
#include <string>

// Base of every error raised by the driver layer.
class DeviceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Argument failed the descriptor's type or bounds check. Never sent.
class InvalidArgument : public DeviceError {
 public:
  using DeviceError::DeviceError;
};

// Transport open/write/read failure or read timeout.
class ConnectionError : public DeviceError {
 public:
  using DeviceError::DeviceError;
};

// Reply could not be sliced or cast to the expected type.
class MalformedReply : public DeviceError {
 public:
  using DeviceError::DeviceError;
};

class UnsupportedOperation : public DeviceError {
 public:
  using DeviceError::DeviceError;
};

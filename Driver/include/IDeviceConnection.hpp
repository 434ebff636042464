#pragma once

#include <string>
#include <string_view>

// Byte transport of one instrument. Implementations throw ConnectionError on
// open/write/read failures; readUntil also throws when its bounded wait
// elapses. No internal locking: one caller at a time.
class IDeviceConnection {
 public:
  virtual ~IDeviceConnection() = default;

  virtual void open() = 0;
  virtual void closeNoThrow() noexcept = 0;
  [[nodiscard]] virtual bool isOpen() const = 0;
  virtual void write(std::string_view frame) = 0;
  // Returns the line without the terminator.
  [[nodiscard]] virtual std::string readUntil(std::string_view terminator) = 0;
  [[nodiscard]] virtual std::string describe() const = 0;
};

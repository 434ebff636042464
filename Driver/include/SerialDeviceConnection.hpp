#pragma once

#include <libserial/SerialPort.h>

#include <memory>
#include <string>
#include <string_view>

#include "ConnectionParameters.hpp"
#include "IDeviceConnection.hpp"

class SerialDeviceConnection final : public IDeviceConnection {
 public:
  explicit SerialDeviceConnection(ConnectionParameters parameters);
  ~SerialDeviceConnection() override;

  void open() override;
  void closeNoThrow() noexcept override;
  [[nodiscard]] bool isOpen() const override;
  void write(std::string_view frame) override;
  [[nodiscard]] std::string readUntil(std::string_view terminator) override;
  [[nodiscard]] std::string describe() const override;

  [[nodiscard]] const ConnectionParameters& parameters() const {
    return _parameters;
  }

  static LibSerial::BaudRate toBaudRate(int baud);
  static LibSerial::CharacterSize toCharacterSize(int byteSize);

 private:
  std::unique_ptr<LibSerial::SerialPort> _serial;
  ConnectionParameters _parameters;
  LibSerial::BaudRate _baudRate;
  LibSerial::CharacterSize _characterSize;
  LibSerial::Parity _parity;
  LibSerial::StopBits _stopBits;
};

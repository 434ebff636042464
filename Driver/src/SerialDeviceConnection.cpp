#include "SerialDeviceConnection.hpp"

#include <DeviceErrors.hpp>
#include <LineEncoding.hpp>
#include <Logger.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <stdexcept>
#include <utility>

namespace {
LibSerial::Parity toParity(const utl::EParity parity) {
  switch (parity) {
    case utl::EParity::None:
      return LibSerial::Parity::PARITY_NONE;
    case utl::EParity::Even:
      return LibSerial::Parity::PARITY_EVEN;
    case utl::EParity::Odd:
      return LibSerial::Parity::PARITY_ODD;
  }
  throw std::runtime_error("Unknown parity setting");
}

LibSerial::StopBits toStopBits(const utl::EStopBits stopBits) {
  return stopBits == utl::EStopBits::Two ? LibSerial::StopBits::STOP_BITS_2
                                         : LibSerial::StopBits::STOP_BITS_1;
}
}  // namespace

SerialDeviceConnection::SerialDeviceConnection(ConnectionParameters parameters)
    : _serial(std::make_unique<LibSerial::SerialPort>()),
      _parameters(std::move(parameters)),
      _baudRate(toBaudRate(_parameters.baudRate)),
      _characterSize(toCharacterSize(_parameters.byteSize)),
      _parity(toParity(_parameters.parity)),
      _stopBits(toStopBits(_parameters.stopBits)) {
  if (_parameters.port.empty()) {
    throw std::runtime_error("Serial connection requires a port");
  }
  requireSupportedEncoding(_parameters.encoding);
  _parameters.readTimeoutMS = std::max(1u, _parameters.readTimeoutMS);
}

SerialDeviceConnection::~SerialDeviceConnection() { closeNoThrow(); }

void SerialDeviceConnection::open() {
  closeNoThrow();
  try {
    _serial->Open(_parameters.port);
    _serial->SetBaudRate(_baudRate);
    _serial->SetCharacterSize(_characterSize);
    _serial->SetFlowControl(LibSerial::FlowControl::FLOW_CONTROL_NONE);
    _serial->SetParity(_parity);
    _serial->SetStopBits(_stopBits);
    _serial->FlushIOBuffers();
  } catch (const std::exception& e) {
    closeNoThrow();
    throw ConnectionError(
        std::format("Failed to open {}: {}", describe(), e.what()));
  }
  SPDLOG_DEBUG("Opened {} at {} baud", describe(), _parameters.baudRate);
}

void SerialDeviceConnection::closeNoThrow() noexcept {
  try {
    if (_serial->IsOpen()) {
      _serial->Close();
    }
  } catch (const std::exception& e) {
    SPDLOG_WARN("Closing {} failed: {}", describe(), e.what());
    // A port that failed to close is not reused.
    _serial = std::make_unique<LibSerial::SerialPort>();
  }
}

bool SerialDeviceConnection::isOpen() const { return _serial->IsOpen(); }

void SerialDeviceConnection::write(std::string_view frame) {
  if (_parameters.strict7Bit) {
    requireSevenBit(frame, describe());
  }
  if (!_serial->IsOpen()) {
    throw ConnectionError(std::format("{} is not open", describe()));
  }
  try {
    // Anything still buffered belongs to an earlier exchange.
    _serial->FlushInputBuffer();
    _serial->Write(std::string(frame));
    _serial->DrainWriteBuffer();
  } catch (const std::exception& e) {
    throw ConnectionError(
        std::format("Write to {} failed: {}", describe(), e.what()));
  }
}

std::string SerialDeviceConnection::readUntil(std::string_view terminator) {
  if (terminator.empty()) {
    throw InvalidArgument("Reply terminator must not be empty");
  }
  if (!_serial->IsOpen()) {
    throw ConnectionError(std::format("{} is not open", describe()));
  }
  using Clock = std::chrono::steady_clock;
  const auto deadline =
      Clock::now() + std::chrono::milliseconds(_parameters.readTimeoutMS);

  std::string line;
  while (!line.ends_with(terminator)) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (remaining.count() <= 0) {
      throw ConnectionError(std::format(
          "Timed out after {} ms waiting for reply on {} (partial '{}')",
          _parameters.readTimeoutMS, describe(), line));
    }
    char byte = 0;
    try {
      _serial->ReadByte(byte, static_cast<std::size_t>(remaining.count()));
    } catch (const LibSerial::ReadTimeout&) {
      continue;
    } catch (const std::exception& e) {
      throw ConnectionError(
          std::format("Read from {} failed: {}", describe(), e.what()));
    }
    if (_parameters.strict7Bit) {
      byte = static_cast<char>(static_cast<unsigned char>(byte) & 0x7Fu);
    }
    line.push_back(byte);
  }
  line.resize(line.size() - terminator.size());
  return line;
}

std::string SerialDeviceConnection::describe() const {
  return std::format("serial({})", _parameters.port);
}

LibSerial::BaudRate SerialDeviceConnection::toBaudRate(const int baud) {
  switch (baud) {
    case 1200:
      return LibSerial::BaudRate::BAUD_1200;
    case 2400:
      return LibSerial::BaudRate::BAUD_2400;
    case 4800:
      return LibSerial::BaudRate::BAUD_4800;
    case 9600:
      return LibSerial::BaudRate::BAUD_9600;
    case 19200:
      return LibSerial::BaudRate::BAUD_19200;
    case 38400:
      return LibSerial::BaudRate::BAUD_38400;
    case 57600:
      return LibSerial::BaudRate::BAUD_57600;
    case 115200:
      return LibSerial::BaudRate::BAUD_115200;
    default:
      throw std::runtime_error(std::format("Unsupported baud rate {}", baud));
  }
}

LibSerial::CharacterSize SerialDeviceConnection::toCharacterSize(
    const int byteSize) {
  switch (byteSize) {
    case 5:
      return LibSerial::CharacterSize::CHAR_SIZE_5;
    case 6:
      return LibSerial::CharacterSize::CHAR_SIZE_6;
    case 7:
      return LibSerial::CharacterSize::CHAR_SIZE_7;
    case 8:
      return LibSerial::CharacterSize::CHAR_SIZE_8;
    default:
      throw std::runtime_error(
          std::format("Unsupported byte size {}", byteSize));
  }
}

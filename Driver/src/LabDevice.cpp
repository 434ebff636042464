#include <LabDevice.hpp>

#include <CommandValidator.hpp>
#include <FrameCodec.hpp>
#include <Logger.hpp>

#include <stdexcept>
#include <utility>

namespace {
// Frames carry CR/LF, keep log lines on one line.
std::string printable(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '\r':
        out += "\\r";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out += c;
    }
  }
  return out;
}
}  // namespace

LabDevice::LabDevice(std::string name,
                     std::unique_ptr<IDeviceConnection> connection,
                     ProtocolFraming framing, const bool simulation)
    : _name(std::move(name)),
      _connection(std::move(connection)),
      _framing(std::move(framing)),
      _simulation(simulation) {
  if (!_connection && !_simulation) {
    throw std::runtime_error(
        std::format("{}: communication backend is null.", _name));
  }
}

LabDevice::~LabDevice() { disconnect(); }

void LabDevice::connect() {
  if (_simulation) {
    SPDLOG_INFO("SIM :: {} connection opened", _name);
    return;
  }
  SPDLOG_INFO("Opening {} via {}", _name, _connection->describe());
  _connection->open();
}

void LabDevice::disconnect() noexcept {
  if (_connection) {
    _connection->closeNoThrow();
  }
  _initialized = false;
  onDisconnected();
}

std::optional<ReplyValue> LabDevice::send(
    const CommandDescriptor& command,
    const std::optional<ArgumentValue>& argument) {
  validateArgument(command, argument);
  const auto frame = encodeFrame(command, argument, _framing);

  if (_simulation) {
    SPDLOG_INFO("SIM :: {} << {}", _name, printable(frame));
    return std::nullopt;
  }

  SPDLOG_DEBUG("{} << {}", _name, printable(frame));
  _connection->write(frame);
  const auto raw = _connection->readUntil(_framing.replyTerminator);
  SPDLOG_DEBUG("{} >> {}", _name, printable(raw));

  return decodeReply(command, raw);
}

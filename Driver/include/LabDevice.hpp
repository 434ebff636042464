#pragma once

#include <CommandDescriptor.hpp>
#include <DeviceErrors.hpp>
#include <IDeviceConnection.hpp>

#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

// Shared lifecycle of a line-protocol instrument plus the dispatcher every
// device operation goes through. Not thread safe: one caller per device.
class LabDevice {
 public:
  // `connection` may be null only in simulation mode.
  LabDevice(std::string name, std::unique_ptr<IDeviceConnection> connection,
            ProtocolFraming framing, bool simulation);
  virtual ~LabDevice();

  LabDevice(const LabDevice&) = delete;
  LabDevice& operator=(const LabDevice&) = delete;

  // Opens the link and performs the device handshake.
  virtual void initialize() = 0;
  [[nodiscard]] virtual bool isConnected() = 0;
  [[nodiscard]] virtual bool isIdle() = 0;
  [[nodiscard]] virtual std::string getStatus() = 0;
  virtual void checkErrors() = 0;
  virtual void clearErrors() = 0;

  void connect();
  void disconnect() noexcept;

  // validate -> encode -> write -> read one line -> decode.
  // Returns nullopt for commands without a reply rule and in simulation.
  std::optional<ReplyValue> send(
      const CommandDescriptor& command,
      const std::optional<ArgumentValue>& argument = std::nullopt);

  // send() narrowed to the reply type the descriptor declares. In simulation
  // mode a value-initialized T is returned.
  template <typename T>
  T sendAs(const CommandDescriptor& command,
           const std::optional<ArgumentValue>& argument = std::nullopt) {
    static_assert(std::is_same_v<T, std::string> ||
                      std::is_same_v<T, std::int64_t> ||
                      std::is_same_v<T, double>,
                  "sendAs<T>: T must be a ReplyValue alternative");
    auto reply = send(command, argument);
    if (_simulation) {
      return T{};
    }
    if (!reply.has_value()) {
      throw MalformedReply(
          std::format("{}: command {} declares no reply", _name, command.name));
    }
    if (auto* value = std::get_if<T>(&*reply)) {
      return std::move(*value);
    }
    throw MalformedReply(std::format(
        "{}: reply to {} decoded to an unexpected type", _name, command.name));
  }

  [[nodiscard]] const std::string& name() const { return _name; }
  [[nodiscard]] bool simulation() const { return _simulation; }
  [[nodiscard]] bool initialized() const { return _initialized; }

 protected:
  void markInitialized() { _initialized = true; }
  // Called after the link is closed so subclasses can drop their state.
  virtual void onDisconnected() noexcept {}

 private:
  std::string _name;
  std::unique_ptr<IDeviceConnection> _connection;
  ProtocolFraming _framing;
  bool _simulation;
  bool _initialized{false};
};

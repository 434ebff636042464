#pragma once

#include <string>
#include <string_view>

#include "ConnectionParameters.hpp"
#include "IDeviceConnection.hpp"

// Instrument behind a serial-to-Ethernet bridge: `address` is the host,
// `port` the TCP port.
class TcpDeviceConnection final : public IDeviceConnection {
 public:
  explicit TcpDeviceConnection(ConnectionParameters parameters);
  ~TcpDeviceConnection() override;

  void open() override;
  void closeNoThrow() noexcept override;
  [[nodiscard]] bool isOpen() const override { return _fd >= 0; }
  void write(std::string_view frame) override;
  [[nodiscard]] std::string readUntil(std::string_view terminator) override;
  [[nodiscard]] std::string describe() const override;

 private:
  // Drops buffered and queued bytes, e.g. a reply that arrived after its
  // read timed out.
  void discardStaleInput();

  ConnectionParameters _parameters;
  std::string _host;
  std::string _service;
  int _fd{-1};
  // Bytes received past the last returned line.
  std::string _pending;
};

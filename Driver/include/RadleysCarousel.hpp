#pragma once

#include <AbstractHotplate.hpp>
#include <ConnectionParameters.hpp>
#include <IDeviceConnection.hpp>
#include <RadleysCarouselCommands.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

class RadleysCarousel final : public AbstractHotplate {
 public:
  using Commands = RadleysCarouselCommands;

  // Builds the device from `classes.RadleysCarousel` of the loaded config.
  RadleysCarousel();
  RadleysCarousel(std::string name,
                  std::unique_ptr<IDeviceConnection> connection,
                  bool simulation = false);

  // 9600 8N1, utf-8, strict 7-bit. `port` is left empty.
  [[nodiscard]] static ConnectionParameters defaultConnectionParameters();
  [[nodiscard]] static ProtocolFraming defaultFraming();

  void initialize() override;
  [[nodiscard]] bool isConnected() override;
  [[nodiscard]] bool isIdle() override;
  [[nodiscard]] std::string getStatus() override;
  // Not supported by the instrument.
  void checkErrors() override;
  void clearErrors() override;

  void startTemperatureRegulation() override;
  void stopTemperatureRegulation() override;
  void startStirring() override;
  void stopStirring() override;

  void setSpeed(double speed) override;
  [[nodiscard]] double getSpeed() override;
  [[nodiscard]] double getSpeedSetpoint() override;

  // The controller takes whole degrees; the fraction is dropped.
  void setTemperature(double temperature, int sensor = 0) override;
  // sensor 0 = hotplate, 1 = external probe.
  [[nodiscard]] double getTemperature(int sensor = 0) override;
  [[nodiscard]] double getTemperatureSetpoint(int sensor = 0) override;
  [[nodiscard]] double getTemperatureSafetyDelta() override;
  [[nodiscard]] std::string getSensorType() override;
  void setResetMode(int mode) override;
  [[nodiscard]] std::string getResetMode() override;
  void setHeatMode(int mode) override;
  [[nodiscard]] std::string getHeatMode() override;
  void reset() override;
  void setConnectionCheckOn() override;
  void setConnectionCheckOff() override;

  [[nodiscard]] double getProbeSafetyTemperature();
  [[nodiscard]] double getHotplateSafetyTemperature();
  [[nodiscard]] std::string getSoftwareVersion();
  // Switches the controller back to the legacy protocol until the next
  // initialize().
  void useLegacyProtocol();

 private:
  // Raw STATUS code, nullopt when the query failed.
  std::optional<std::int64_t> queryStatusCode();
};

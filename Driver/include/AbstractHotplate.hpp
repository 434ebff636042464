#pragma once

#include <LabDevice.hpp>

#include <string>
#include <string_view>

// Capability contract shared by hotplate/stirrer instruments. Optional
// capabilities throw UnsupportedOperation unless an instrument overrides them.
class AbstractHotplate : public LabDevice {
 public:
  enum class State {
    Disconnected,
    Initialized,
    Idle,
    Heating,
    Stirring,
    HeatingAndStirring
  };

  using LabDevice::LabDevice;

  [[nodiscard]] State state() const;

  virtual void startTemperatureRegulation() = 0;
  virtual void stopTemperatureRegulation() = 0;
  virtual void startStirring() = 0;
  virtual void stopStirring() = 0;

  virtual void setSpeed(double speed) = 0;
  [[nodiscard]] virtual double getSpeed() = 0;
  [[nodiscard]] virtual double getSpeedSetpoint() = 0;

  virtual void setTemperature(double temperature, int sensor = 0) = 0;
  [[nodiscard]] virtual double getTemperature(int sensor = 0) = 0;
  [[nodiscard]] virtual double getTemperatureSetpoint(int sensor = 0) = 0;

  [[nodiscard]] virtual double getTemperatureSafetyDelta();
  [[nodiscard]] virtual std::string getSensorType();
  virtual void setResetMode(int mode);
  [[nodiscard]] virtual std::string getResetMode();
  virtual void setHeatMode(int mode);
  [[nodiscard]] virtual std::string getHeatMode();
  virtual void reset();
  virtual void setConnectionCheckOn();
  virtual void setConnectionCheckOff();

 protected:
  void setHeating(bool heating);
  void setStirring(bool stirring);
  void onDisconnected() noexcept override;

  [[noreturn]] void unsupported(std::string_view operation) const;

 private:
  bool _heating{false};
  bool _stirring{false};
  // Set by the first start/stop command after initialize().
  bool _regulated{false};
};

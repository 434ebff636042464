#include <AbstractHotplate.hpp>


#include <format>

AbstractHotplate::State AbstractHotplate::state() const {
  if (!initialized()) {
    return State::Disconnected;
  }
  if (_heating && _stirring) {
    return State::HeatingAndStirring;
  }
  if (_heating) {
    return State::Heating;
  }
  if (_stirring) {
    return State::Stirring;
  }
  return _regulated ? State::Idle : State::Initialized;
}

void AbstractHotplate::setHeating(const bool heating) {
  _heating = heating;
  _regulated = true;
}

void AbstractHotplate::setStirring(const bool stirring) {
  _stirring = stirring;
  _regulated = true;
}

void AbstractHotplate::onDisconnected() noexcept {
  _heating = false;
  _stirring = false;
  _regulated = false;
}

void AbstractHotplate::unsupported(std::string_view operation) const {
  throw UnsupportedOperation(
      std::format("{} does not support {}", name(), operation));
}

double AbstractHotplate::getTemperatureSafetyDelta() {
  unsupported("getTemperatureSafetyDelta");
}

std::string AbstractHotplate::getSensorType() { unsupported("getSensorType"); }

void AbstractHotplate::setResetMode(int) { unsupported("setResetMode"); }

std::string AbstractHotplate::getResetMode() { unsupported("getResetMode"); }

void AbstractHotplate::setHeatMode(int) { unsupported("setHeatMode"); }

std::string AbstractHotplate::getHeatMode() { unsupported("getHeatMode"); }

void AbstractHotplate::reset() { unsupported("reset"); }

void AbstractHotplate::setConnectionCheckOn() {
  unsupported("setConnectionCheckOn");
}

void AbstractHotplate::setConnectionCheckOff() {
  unsupported("setConnectionCheckOff");
}

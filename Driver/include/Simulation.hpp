#pragma once

#include <LabDevice.hpp>
#include <Logger.hpp>

#include <utility>

// Runs `operation` against the hardware, or hands back `simulated` without
// touching the link when the device was built in simulation mode.
template <typename T, typename Operation>
T inSimulationDeviceReturns(const LabDevice& device, T simulated,
                            Operation&& operation) {
  if (device.simulation()) {
    SPDLOG_DEBUG("SIM :: {} returns canned value", device.name());
    return simulated;
  }
  return std::forward<Operation>(operation)();
}

#pragma once

#include <memory>

#include <yaml-cpp/yaml.h>

#include "ConnectionParameters.hpp"
#include "IDeviceConnection.hpp"

// Overlays the keys present in `linkConfig` on top of the device defaults.
[[nodiscard]] ConnectionParameters parseConnectionParameters(
    const YAML::Node& linkConfig, ConnectionParameters defaults);

// commConfig: {type: serial|tcp, serial: {...}, tcp: {...}}
std::unique_ptr<IDeviceConnection> makeDeviceConnection(
    const YAML::Node& commConfig, const ConnectionParameters& defaults);

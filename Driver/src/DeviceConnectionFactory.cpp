#include "DeviceConnectionFactory.hpp"

#include <YamlExtensions.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <string>

#include "SerialDeviceConnection.hpp"
#include "TcpDeviceConnection.hpp"

namespace {
std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

YAML::Node requireLinkMap(const YAML::Node& commConfig, const char* key) {
  const auto node = commConfig[key];
  if (!node || !node.IsMap()) {
    throw std::runtime_error(std::format(
        "Device comm.type='{}' requires map 'comm.{}'.", key, key));
  }
  return node;
}
}  // namespace

ConnectionParameters parseConnectionParameters(const YAML::Node& linkConfig,
                                               ConnectionParameters defaults) {
  auto read = [&]<typename T>(const char* key, T& target) {
    const auto node = linkConfig[key];
    if (!node || !node.IsDefined() || node.IsNull()) {
      return;
    }
    try {
      target = node.as<T>();
    } catch (const YAML::Exception& e) {
      throw std::runtime_error(
          std::format("Invalid value for comm setting '{}': {}", key, e.what()));
    }
  };

  read("port", defaults.port);
  std::string address;
  read("address", address);
  if (!address.empty()) {
    defaults.address = address;
  }
  read("baudRate", defaults.baudRate);
  read("byteSize", defaults.byteSize);
  read("parity", defaults.parity);
  read("stopBits", defaults.stopBits);
  read("encoding", defaults.encoding);
  read("strict7Bit", defaults.strict7Bit);
  read("readTimeoutMS", defaults.readTimeoutMS);
  return defaults;
}

std::unique_ptr<IDeviceConnection> makeDeviceConnection(
    const YAML::Node& commConfig, const ConnectionParameters& defaults) {
  if (!commConfig || !commConfig.IsMap()) {
    throw std::runtime_error("Device comm config must be a map.");
  }
  const auto transportNode = commConfig["type"];
  if (!transportNode || !transportNode.IsScalar()) {
    throw std::runtime_error("Device comm config must define scalar 'type'.");
  }
  const auto transport = transportNode.as<std::string>();
  const auto normalized = toLower(transport);
  if (normalized == "serial") {
    const auto link = requireLinkMap(commConfig, "serial");
    if (!link["port"]) {
      throw std::runtime_error("Missing required comm.serial.port");
    }
    return std::make_unique<SerialDeviceConnection>(
        parseConnectionParameters(link, defaults));
  }
  if (normalized == "tcp" || normalized == "socket") {
    const auto link = requireLinkMap(commConfig, "tcp");
    if (!link["address"] || !link["port"]) {
      throw std::runtime_error(
          "comm.tcp requires both 'address' and 'port'");
    }
    return std::make_unique<TcpDeviceConnection>(
        parseConnectionParameters(link, defaults));
  }
  throw std::runtime_error(
      std::format("Unsupported device transport '{}'", transport));
}

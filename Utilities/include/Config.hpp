#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "Singleton.hpp"
#include "yaml-cpp/yaml.h"

namespace utl {
// Process-wide YAML configuration. Every configurable class reads its own
// entry below the top-level `classes` map.
class Config : public Singleton<Config> {
 public:
  // Replaces the loaded document. Throws std::runtime_error when the file
  // cannot be read or parsed.
  void setConfigPath(const std::string& configPath);
  [[nodiscard]] const std::string& configPath() const { return _configPath; }

  [[nodiscard]] bool hasClassConfig(std::string_view className) const;
  YAML::Node getClassConfig(std::string_view className) const;

  template <typename T>
  T getRequired(std::string_view className, std::string_view key) const {
    const auto node = entry(className, key);
    if (!node) {
      throw std::runtime_error(
          std::format("Missing required key '{}.{}' in config file '{}'",
                      className, key, _configPath));
    }
    return convertEntry<T>(node, className, key);
  }

  template <typename T>
  T getOptional(std::string_view className, std::string_view key,
                T defaultValue) const {
    const auto node = entry(className, key);
    return node ? convertEntry<T>(node, className, key) : defaultValue;
  }

 private:
  Config() = default;
  ~Config() = default;

  // Invalid node when `key` is absent from the class entry.
  [[nodiscard]] YAML::Node entry(std::string_view className,
                                 std::string_view key) const;

  template <typename T>
  T convertEntry(const YAML::Node& node, std::string_view className,
                 std::string_view key) const {
    try {
      return node.as<T>();
    } catch (const YAML::Exception& e) {
      throw std::runtime_error(
          std::format("Invalid value for '{}.{}' in config file '{}': {}",
                      className, key, _configPath, e.what()));
    }
  }

  std::string _configPath{};
  YAML::Node _topNode;
  friend class Singleton;
};
}  // namespace utl

#include "Config.hpp"

#include <Logger.hpp>

namespace utl {

void Config::setConfigPath(const std::string& configPath) {
  try {
    _topNode = YAML::LoadFile(configPath);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::format("Failed to load config file '{}': {}",
                                         configPath, e.what()));
  }
  _configPath = configPath;
  SPDLOG_DEBUG("Loaded configuration from '{}'", configPath);
}

bool Config::hasClassConfig(std::string_view className) const {
  if (!_topNode || !_topNode["classes"]) {
    return false;
  }
  const auto classNode = _topNode["classes"][std::string(className)];
  return classNode && classNode.IsDefined() && !classNode.IsNull();
}

YAML::Node Config::getClassConfig(std::string_view className) const {
  if (!_topNode || !_topNode["classes"]) {
    throw std::runtime_error(std::format(
        "Config file '{}' is missing 'classes' section", _configPath));
  }

  YAML::Node classNode = _topNode["classes"][std::string(className)];
  if (!classNode || !classNode.IsDefined()) {
    throw std::runtime_error(
        std::format("Failed to find entry for '{}' in the config file '{}'",
                    className, _configPath));
  }

  return classNode;
}

YAML::Node Config::entry(std::string_view className,
                         std::string_view key) const {
  const auto classNode = getClassConfig(className);
  if (!classNode.IsMap()) {
    throw std::runtime_error(
        std::format("Entry for '{}' in config file '{}' must be a map",
                    className, _configPath));
  }
  return classNode[std::string(key)];
}

}  // namespace utl

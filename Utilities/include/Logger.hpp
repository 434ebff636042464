#pragma once
#include "spdlog/spdlog.h"

#include <string>

namespace utl {
// To be called in each top level executable
inline void configureLogger() {
  spdlog::set_level(
      static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
}

// Overrides the compile-time default, e.g. from a --log-level flag.
// Unknown names leave the level untouched.
inline void configureLogger(const std::string& levelName) {
  configureLogger();
  const auto level = spdlog::level::from_str(levelName);
  if (level == spdlog::level::off && levelName != "off") {
    SPDLOG_WARN("Unknown log level '{}', keeping default", levelName);
    return;
  }
  spdlog::set_level(level);
}
}  // namespace utl

#include <Config.hpp>
#include <DeviceErrors.hpp>
#include <Logger.hpp>
#include <RadleysCarousel.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>

#include "argparse/argparse.hpp"

namespace fs = std::filesystem;

namespace {
using Value = std::optional<std::string>;
using Action = std::function<void(RadleysCarousel&, const Value&)>;

template <typename T>
T requireNumber(const Value& value, const std::string& command) {
  if (!value.has_value()) {
    throw std::runtime_error(
        std::format("Command '{}' requires --value", command));
  }
  T out{};
  const auto* end = value->data() + value->size();
  const auto [ptr, ec] = std::from_chars(value->data(), end, out);
  if (ec != std::errc{} || ptr != end) {
    throw std::runtime_error(
        std::format("Invalid value '{}' for command '{}'", *value, command));
  }
  return out;
}

const std::map<std::string, Action>& actions() {
  static const std::map<std::string, Action> table{
      {"status",
       [](RadleysCarousel& d, const Value&) { std::println("{}", d.getStatus()); }},
      {"connected",
       [](RadleysCarousel& d, const Value&) {
         std::println("{}", d.isConnected());
       }},
      {"idle",
       [](RadleysCarousel& d, const Value&) { std::println("{}", d.isIdle()); }},
      {"temperature",
       [](RadleysCarousel& d, const Value& v) {
         const int sensor = v ? requireNumber<int>(v, "temperature") : 0;
         std::println("{}", d.getTemperature(sensor));
       }},
      {"set-temperature",
       [](RadleysCarousel& d, const Value& v) {
         d.setTemperature(requireNumber<double>(v, "set-temperature"));
       }},
      {"temperature-setpoint",
       [](RadleysCarousel& d, const Value&) {
         std::println("{}", d.getTemperatureSetpoint());
       }},
      {"safety-delta",
       [](RadleysCarousel& d, const Value&) {
         std::println("{}", d.getTemperatureSafetyDelta());
       }},
      {"speed",
       [](RadleysCarousel& d, const Value&) { std::println("{}", d.getSpeed()); }},
      {"set-speed",
       [](RadleysCarousel& d, const Value& v) {
         d.setSpeed(requireNumber<double>(v, "set-speed"));
       }},
      {"speed-setpoint",
       [](RadleysCarousel& d, const Value&) {
         std::println("{}", d.getSpeedSetpoint());
       }},
      {"start-heating",
       [](RadleysCarousel& d, const Value&) { d.startTemperatureRegulation(); }},
      {"stop-heating",
       [](RadleysCarousel& d, const Value&) { d.stopTemperatureRegulation(); }},
      {"start-stirring",
       [](RadleysCarousel& d, const Value&) { d.startStirring(); }},
      {"stop-stirring",
       [](RadleysCarousel& d, const Value&) { d.stopStirring(); }},
      {"sensor-type",
       [](RadleysCarousel& d, const Value&) {
         std::println("{}", d.getSensorType());
       }},
      {"reset-mode",
       [](RadleysCarousel& d, const Value& v) {
         if (v) {
           d.setResetMode(requireNumber<int>(v, "reset-mode"));
           return;
         }
         std::println("{}", d.getResetMode());
       }},
      {"heat-mode",
       [](RadleysCarousel& d, const Value& v) {
         if (v) {
           d.setHeatMode(requireNumber<int>(v, "heat-mode"));
           return;
         }
         std::println("{}", d.getHeatMode());
       }},
      {"reset", [](RadleysCarousel& d, const Value&) { d.reset(); }},
      {"version",
       [](RadleysCarousel& d, const Value&) {
         std::println("{}", d.getSoftwareVersion());
       }},
  };
  return table;
}

std::string commandList() {
  std::string out;
  for (const auto& [name, action] : actions()) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}
}  // namespace

int main(int argc, char** argv) {
  utl::configureLogger();
  argparse::ArgumentParser program("carouselControl");
  program.add_argument("-c", "--config")
      .help("Path to the config file")
      .default_value(std::string("/etc/carouselControl.yaml"));
  program.add_argument("--simulation")
      .help("Run without hardware, replies are simulated")
      .default_value(false)
      .implicit_value(true);
  program.add_argument("--log-level")
      .help("spdlog level name (trace, debug, info, warn, err)")
      .default_value(std::string("info"));
  program.add_argument("--value").help("Argument of the command, if any");
  program.add_argument("command").help(
      std::format("One of: {}", commandList()));

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    SPDLOG_CRITICAL("{}", err.what());
    std::exit(1);
  }

  utl::configureLogger(program.get<std::string>("--log-level"));

  const auto command = program.get<std::string>("command");
  const auto it = actions().find(command);
  if (it == actions().end()) {
    SPDLOG_CRITICAL("Unknown command '{}'. Use one of: {}", command,
                    commandList());
    std::exit(1);
  }

  const bool simulation = program.get<bool>("--simulation");
  const auto configPath = program.get<std::string>("-c");

  try {
    std::unique_ptr<RadleysCarousel> device;
    if (simulation) {
      device = std::make_unique<RadleysCarousel>(
          std::string(RadleysCarouselCommands::kDefaultName), nullptr, true);
    } else {
      if (!program.is_used("-c")) {
        SPDLOG_WARN("Config path not provided, using default: {}", configPath);
      }
      if (!fs::exists(configPath)) {
        SPDLOG_CRITICAL("Config file '{}' not found! Exiting.", configPath);
        std::exit(1);
      }
      utl::Config::instance().setConfigPath(configPath);
      device = std::make_unique<RadleysCarousel>();
    }

    device->initialize();
    it->second(*device, program.present<std::string>("--value"));
    device->disconnect();
  } catch (const DeviceError& e) {
    SPDLOG_CRITICAL("{} failed: {}", command, e.what());
    return 1;
  } catch (const std::exception& e) {
    SPDLOG_CRITICAL("{}", e.what());
    return 1;
  }

  return 0;
}

#include <RadleysCarousel.hpp>

#include <Config.hpp>
#include <DeviceConnectionFactory.hpp>
#include <Logger.hpp>
#include <Simulation.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {
constexpr auto kConfigClass = "RadleysCarousel";

const utl::Config& deviceConfig() {
  const auto& config = utl::Config::instance();
  if (!config.hasClassConfig(kConfigClass)) {
    throw std::runtime_error(
        std::format("Config file '{}' has no 'classes.{}' entry",
                    config.configPath(), kConfigClass));
  }
  return config;
}

std::string configuredName() {
  return deviceConfig().getOptional<std::string>(
      kConfigClass, "name", std::string(RadleysCarouselCommands::kDefaultName));
}

bool configuredSimulation() {
  return deviceConfig().getOptional<bool>(kConfigClass, "simulation", false);
}

std::unique_ptr<IDeviceConnection> configuredConnection() {
  const auto classCfg = deviceConfig().getClassConfig(kConfigClass);
  const auto commCfg = classCfg["comm"];
  if (!commCfg && configuredSimulation()) {
    return nullptr;
  }
  return makeDeviceConnection(commCfg,
                              RadleysCarousel::defaultConnectionParameters());
}
}  // namespace

RadleysCarousel::RadleysCarousel()
    : RadleysCarousel(configuredName(), configuredConnection(),
                      configuredSimulation()) {}

RadleysCarousel::RadleysCarousel(std::string name,
                                 std::unique_ptr<IDeviceConnection> connection,
                                 const bool simulation)
    : AbstractHotplate(std::move(name), std::move(connection), defaultFraming(),
                       simulation) {}

ConnectionParameters RadleysCarousel::defaultConnectionParameters() {
  return ConnectionParameters{.baudRate = 9600,
                              .byteSize = 8,
                              .parity = utl::EParity::None,
                              .encoding = "utf-8",
                              .strict7Bit = true};
}

ProtocolFraming RadleysCarousel::defaultFraming() {
  return ProtocolFraming{.commandTerminator = "\r\n",
                         .replyTerminator = "\r\n",
                         .argumentDelimiter = " "};
}

void RadleysCarousel::initialize() {
  disconnect();
  try {
    connect();
    (void)send(Commands::kProtocolNew);
  } catch (const ConnectionError& e) {
    SPDLOG_ERROR("{} initialization failed: {}", name(), e.what());
    disconnect();
    throw;
  } catch (const std::exception& e) {
    SPDLOG_ERROR("{} handshake failed: {}", name(), e.what());
    disconnect();
    throw ConnectionError(
        std::format("{} handshake failed: {}", name(), e.what()));
  }
  markInitialized();
  SPDLOG_INFO("{} initialised", name());
}

bool RadleysCarousel::isConnected() {
  const bool simulatedConnected = !Commands::kDefaultName.empty();
  return inSimulationDeviceReturns(*this, simulatedConnected, [this] {
    try {
      const auto code = sendAs<std::int64_t>(Commands::kQueryStatus);
      if (code == Commands::kStatusRemoteBlocked) {
        SPDLOG_ERROR("{} remote interface is blocked", name());
        return false;
      }
      if (code < Commands::kStatusRemoteBlocked) {
        SPDLOG_ERROR("{} reports device error {}", name(), code);
        return false;
      }
    } catch (const ConnectionError& e) {
      SPDLOG_WARN("{} is not reachable: {}", name(), e.what());
      return false;
    } catch (const MalformedReply& e) {
      SPDLOG_WARN("{} sent an unreadable status: {}", name(), e.what());
      return false;
    }
    return true;
  });
}

std::optional<std::int64_t> RadleysCarousel::queryStatusCode() {
  try {
    return sendAs<std::int64_t>(Commands::kQueryStatus);
  } catch (const ConnectionError& e) {
    SPDLOG_WARN("{} status query failed: {}", name(), e.what());
  } catch (const MalformedReply& e) {
    SPDLOG_WARN("{} status reply unreadable: {}", name(), e.what());
  }
  return std::nullopt;
}

bool RadleysCarousel::isIdle() {
  const auto code = queryStatusCode();
  return code.has_value() && *code == Commands::kStatusRemoteStart;
}

std::string RadleysCarousel::getStatus() {
  const auto code = queryStatusCode();
  if (!code.has_value()) {
    return "ERROR";
  }
  const auto status = Commands::statusName(static_cast<int>(
      std::clamp<std::int64_t>(*code, std::numeric_limits<int>::min(),
                               std::numeric_limits<int>::max())));
  if (!status.has_value()) {
    SPDLOG_WARN("{} returned unknown status code {}", name(), *code);
    return "ERROR";
  }
  return std::string(*status);
}

void RadleysCarousel::checkErrors() {
  SPDLOG_DEBUG("{} has no error query, checkErrors is a no-op", name());
}

void RadleysCarousel::clearErrors() {
  SPDLOG_DEBUG("{} has no error reset, clearErrors is a no-op", name());
}

void RadleysCarousel::startTemperatureRegulation() {
  (void)send(Commands::kStartHeat);
  setHeating(true);
  SPDLOG_INFO("{} started heating", name());
}

void RadleysCarousel::stopTemperatureRegulation() {
  (void)send(Commands::kStopHeat);
  setHeating(false);
  SPDLOG_INFO("{} stopped heating", name());
}

void RadleysCarousel::startStirring() {
  (void)send(Commands::kStartStir);
  setStirring(true);
  SPDLOG_INFO("{} started stirring", name());
}

void RadleysCarousel::stopStirring() {
  (void)send(Commands::kStopStir);
  setStirring(false);
  SPDLOG_INFO("{} stopped stirring", name());
}

void RadleysCarousel::setSpeed(const double speed) {
  (void)send(Commands::kSetSpeed, ArgumentValue{speed});
}

double RadleysCarousel::getSpeed() {
  return sendAs<double>(Commands::kGetStirSpeed);
}

double RadleysCarousel::getSpeedSetpoint() {
  return sendAs<double>(Commands::kGetSpeedSetpoint);
}

void RadleysCarousel::setTemperature(const double temperature,
                                     [[maybe_unused]] const int sensor) {
  // Keep the cast defined; the bounds check rejects the value later anyway.
  if (!std::isfinite(temperature) ||
      std::fabs(temperature) >
          static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    throw InvalidArgument(std::format(
        "{}: temperature {} is outside the allowed range", name(), temperature));
  }
  (void)send(Commands::kSetTemperature,
             ArgumentValue{static_cast<std::int64_t>(temperature)});
}

double RadleysCarousel::getTemperature(const int sensor) {
  switch (sensor) {
    case static_cast<int>(utl::ETemperatureSensor::Hotplate):
      return sendAs<double>(Commands::kGetHotplateTemperature);
    case static_cast<int>(utl::ETemperatureSensor::Probe):
      return sendAs<double>(Commands::kGetProbeTemperature);
    default:
      throw InvalidArgument(std::format(
          "Invalid sensor {} provided. Use 0 for hotplate or 1 for external "
          "probe",
          sensor));
  }
}

double RadleysCarousel::getTemperatureSetpoint([[maybe_unused]] const int sensor) {
  return sendAs<double>(Commands::kGetTemperatureSetpoint);
}

double RadleysCarousel::getTemperatureSafetyDelta() {
  return sendAs<double>(Commands::kGetTemperatureSafetyDelta);
}

std::string RadleysCarousel::getSensorType() {
  const auto code = sendAs<std::int64_t>(Commands::kQueryTemperatureSensorType);
  return code == 0 ? "HOTPLATE (0)" : "PROBE (1)";
}

void RadleysCarousel::setResetMode(const int mode) {
  (void)send(Commands::kSetResetMode, ArgumentValue{std::int64_t{mode}});
}

std::string RadleysCarousel::getResetMode() {
  const auto code = sendAs<std::int64_t>(Commands::kQueryResetMode);
  const auto mode =
      Commands::lookup(Commands::kResetMode, static_cast<int>(code));
  if (!mode.has_value()) {
    throw MalformedReply(
        std::format("{}: unknown reset mode {}", name(), code));
  }
  return std::string(*mode);
}

void RadleysCarousel::setHeatMode(const int mode) {
  (void)send(Commands::kSetTemperatureMode, ArgumentValue{std::int64_t{mode}});
}

std::string RadleysCarousel::getHeatMode() {
  const auto code = sendAs<std::int64_t>(Commands::kQueryTemperatureMode);
  const auto mode =
      Commands::lookup(Commands::kTemperatureMode, static_cast<int>(code));
  if (!mode.has_value()) {
    throw MalformedReply(std::format("{}: unknown heat mode {}", name(), code));
  }
  return std::string(*mode);
}

void RadleysCarousel::reset() {
  (void)send(Commands::kReset);
  SPDLOG_INFO("{} reset", name());
}

void RadleysCarousel::setConnectionCheckOn() {
  (void)send(Commands::kCheckConnectionOn);
}

void RadleysCarousel::setConnectionCheckOff() {
  (void)send(Commands::kCheckConnectionOff);
}

double RadleysCarousel::getProbeSafetyTemperature() {
  return sendAs<double>(Commands::kGetProbeSafetyTemperature);
}

double RadleysCarousel::getHotplateSafetyTemperature() {
  return sendAs<double>(Commands::kGetHotplateSafetyTemperature);
}

std::string RadleysCarousel::getSoftwareVersion() {
  return sendAs<std::string>(Commands::kSoftwareVersion);
}

void RadleysCarousel::useLegacyProtocol() {
  (void)send(Commands::kProtocolOld);
  SPDLOG_WARN("{} switched to the legacy protocol", name());
}

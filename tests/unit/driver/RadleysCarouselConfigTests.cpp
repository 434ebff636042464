#include <gtest/gtest.h>

#include <Config.hpp>
#include <RadleysCarousel.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {
class ScopedConfigFile {
 public:
  explicit ScopedConfigFile(const std::string& content) {
    const auto stamp =
        std::chrono::high_resolution_clock::now().time_since_epoch().count();
    _path = std::filesystem::temp_directory_path() /
            ("labctl_carousel_test_" + std::to_string(stamp) + ".yaml");
    std::ofstream out(_path);
    out << content;
    out.close();
    utl::Config::instance().setConfigPath(_path.string());
  }
  ~ScopedConfigFile() { std::filesystem::remove(_path); }

 private:
  std::filesystem::path _path;
};
}  // namespace

TEST(RadleysCarouselConfigTests, SerialDeviceIsBuiltFromConfig) {
  ScopedConfigFile file(R"yaml(
classes:
  RadleysCarousel:
    name: bench carousel
    comm:
      type: serial
      serial:
        port: /dev/ttyUSB0
)yaml");

  RadleysCarousel device;
  EXPECT_EQ(device.name(), "bench carousel");
  EXPECT_FALSE(device.simulation());
  EXPECT_EQ(device.state(), AbstractHotplate::State::Disconnected);
}

TEST(RadleysCarouselConfigTests, NameDefaultsToProductName) {
  ScopedConfigFile file(R"yaml(
classes:
  RadleysCarousel:
    comm:
      type: tcp
      tcp:
        address: 127.0.0.1
        port: 4001
)yaml");

  RadleysCarousel device;
  EXPECT_EQ(device.name(), "Radleys Carousel Connect");
}

TEST(RadleysCarouselConfigTests, SimulationNeedsNoCommSection) {
  ScopedConfigFile file(R"yaml(
classes:
  RadleysCarousel:
    simulation: true
)yaml");

  RadleysCarousel device;
  EXPECT_TRUE(device.simulation());
  EXPECT_NO_THROW(device.initialize());
  EXPECT_TRUE(device.isConnected());
}

TEST(RadleysCarouselConfigTests, MissingCommOutsideSimulationThrows) {
  ScopedConfigFile file(R"yaml(
classes:
  RadleysCarousel:
    name: bench carousel
)yaml");

  EXPECT_THROW(RadleysCarousel{}, std::runtime_error);
}

TEST(RadleysCarouselConfigTests, MissingClassEntryThrows) {
  ScopedConfigFile file(R"yaml(
classes:
  SomethingElse:
    value: 1
)yaml");

  try {
    RadleysCarousel device;
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("classes.RadleysCarousel"),
              std::string::npos);
  }
}

TEST(RadleysCarouselConfigTests, InvalidSimulationFlagThrows) {
  ScopedConfigFile file(R"yaml(
classes:
  RadleysCarousel:
    simulation: maybe
)yaml");

  EXPECT_THROW(RadleysCarousel{}, std::runtime_error);
}

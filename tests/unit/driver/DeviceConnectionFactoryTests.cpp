#include <gtest/gtest.h>

#include <DeviceConnectionFactory.hpp>
#include <RadleysCarousel.hpp>

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace {
ConnectionParameters carouselDefaults() {
  return RadleysCarousel::defaultConnectionParameters();
}
}  // namespace

TEST(DeviceConnectionFactoryTests, SerialTransportCreatesSerialConnection) {
  const auto cfg = YAML::Load(R"yaml(
type: serial
serial:
  port: /dev/ttyUSB0
)yaml");

  auto conn = makeDeviceConnection(cfg, carouselDefaults());
  ASSERT_TRUE(conn);
  EXPECT_EQ(conn->describe(), "serial(/dev/ttyUSB0)");
  EXPECT_FALSE(conn->isOpen());
}

TEST(DeviceConnectionFactoryTests, TransportTypeIsCaseInsensitive) {
  const auto cfg = YAML::Load(R"yaml(
type: SeRiAl
serial:
  port: /dev/ttyS1
)yaml");

  auto conn = makeDeviceConnection(cfg, carouselDefaults());
  ASSERT_TRUE(conn);
  EXPECT_EQ(conn->describe(), "serial(/dev/ttyS1)");
}

TEST(DeviceConnectionFactoryTests, TcpTransportCreatesTcpConnection) {
  const auto cfg = YAML::Load(R"yaml(
type: tcp
tcp:
  address: 192.168.1.40
  port: 4001
)yaml");

  auto conn = makeDeviceConnection(cfg, carouselDefaults());
  ASSERT_TRUE(conn);
  EXPECT_EQ(conn->describe(), "tcp(192.168.1.40:4001)");
}

TEST(DeviceConnectionFactoryTests, SocketIsAnAliasForTcp) {
  const auto cfg = YAML::Load(R"yaml(
type: socket
tcp:
  address: localhost
  port: 23
)yaml");

  auto conn = makeDeviceConnection(cfg, carouselDefaults());
  ASSERT_TRUE(conn);
  EXPECT_EQ(conn->describe(), "tcp(localhost:23)");
}

TEST(DeviceConnectionFactoryTests, MissingTypeThrows) {
  const auto cfg = YAML::Load(R"yaml(
serial:
  port: /dev/ttyS0
)yaml");

  EXPECT_THROW((void)makeDeviceConnection(cfg, carouselDefaults()),
               std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, NonScalarTypeThrows) {
  const auto cfg = YAML::Load(R"yaml(
type:
  nested: invalid
serial:
  port: /dev/ttyS0
)yaml");

  EXPECT_THROW((void)makeDeviceConnection(cfg, carouselDefaults()),
               std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, NonMapConfigThrows) {
  EXPECT_THROW((void)makeDeviceConnection(YAML::Node{}, carouselDefaults()),
               std::runtime_error);
  EXPECT_THROW(
      (void)makeDeviceConnection(YAML::Load("serial"), carouselDefaults()),
      std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, SerialWithoutSerialMapThrows) {
  const auto cfg = YAML::Load(R"yaml(
type: serial
)yaml");

  EXPECT_THROW((void)makeDeviceConnection(cfg, carouselDefaults()),
               std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, SerialWithoutPortThrows) {
  const auto cfg = YAML::Load(R"yaml(
type: serial
serial:
  baudRate: 9600
)yaml");

  EXPECT_THROW((void)makeDeviceConnection(cfg, carouselDefaults()),
               std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, TcpWithoutAddressThrows) {
  const auto cfg = YAML::Load(R"yaml(
type: tcp
tcp:
  port: 4001
)yaml");

  EXPECT_THROW((void)makeDeviceConnection(cfg, carouselDefaults()),
               std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, UnsupportedTransportThrows) {
  const auto cfg = YAML::Load(R"yaml(
type: udp
)yaml");

  EXPECT_THROW((void)makeDeviceConnection(cfg, carouselDefaults()),
               std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, UnsupportedBaudRateThrows) {
  const auto cfg = YAML::Load(R"yaml(
type: serial
serial:
  port: /dev/ttyS0
  baudRate: 12345
)yaml");

  EXPECT_THROW((void)makeDeviceConnection(cfg, carouselDefaults()),
               std::runtime_error);
}

TEST(DeviceConnectionFactoryTests, OverridesReplaceOnlyGivenKeys) {
  const auto link = YAML::Load(R"yaml(
port: /dev/ttyACM0
baudRate: 19200
parity: Even
stopBits: Two
readTimeoutMS: 250
)yaml");

  const auto params = parseConnectionParameters(link, carouselDefaults());
  EXPECT_EQ(params.port, "/dev/ttyACM0");
  EXPECT_EQ(params.baudRate, 19200);
  EXPECT_EQ(params.parity, utl::EParity::Even);
  EXPECT_EQ(params.stopBits, utl::EStopBits::Two);
  EXPECT_EQ(params.readTimeoutMS, 250u);
  EXPECT_EQ(params.byteSize, 8);
  EXPECT_EQ(params.encoding, "utf-8");
  EXPECT_TRUE(params.strict7Bit);
  EXPECT_FALSE(params.address.has_value());
}

TEST(DeviceConnectionFactoryTests, InvalidEnumValueThrows) {
  const auto link = YAML::Load(R"yaml(
port: /dev/ttyS0
parity: Mark
)yaml");

  EXPECT_THROW((void)parseConnectionParameters(link, carouselDefaults()),
               std::runtime_error);
}

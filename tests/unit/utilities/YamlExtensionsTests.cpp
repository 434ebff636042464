#include <gtest/gtest.h>

#include <CommonDefinitions.hpp>
#include <YamlExtensions.hpp>
#include <yaml-cpp/yaml.h>

TEST(YamlExtensionsTests, EnumIsSpelledByName) {
  const auto node = YAML::convert<utl::EParity>::encode(utl::EParity::Odd);
  ASSERT_TRUE(node.IsScalar());
  EXPECT_EQ(node.as<std::string>(), "Odd");
  EXPECT_EQ(node.as<utl::EParity>(), utl::EParity::Odd);
}

TEST(YamlExtensionsTests, EnumDecodesFromConfigText) {
  const auto node = YAML::Load(R"yaml(
parity: Even
stopBits: Two
)yaml");

  EXPECT_EQ(node["parity"].as<utl::EParity>(), utl::EParity::Even);
  EXPECT_EQ(node["stopBits"].as<utl::EStopBits>(), utl::EStopBits::Two);
}

TEST(YamlExtensionsTests, UnknownEnumeratorThrows) {
  const auto node = YAML::Load("Mark");
  EXPECT_THROW((void)node.as<utl::EParity>(), YAML::Exception);
}

TEST(YamlExtensionsTests, NonScalarEnumThrows) {
  const auto node = YAML::Load("[None, Odd]");
  EXPECT_THROW((void)node.as<utl::EParity>(), YAML::Exception);
}

TEST(YamlExtensionsTests, EnumNamesIgnoreCase) {
  EXPECT_EQ(YAML::Load("even").as<utl::EParity>(), utl::EParity::Even);
  EXPECT_EQ(YAML::Load("TWO").as<utl::EStopBits>(), utl::EStopBits::Two);
}

#pragma once

#include <yaml-cpp/yaml.h>

#include <magic_enum/magic_enum.hpp>
#include <string>
#include <type_traits>

#include "CommonDefinitions.hpp"

namespace YAML {

// Link settings are written by hand, so enumerator names are matched
// ignoring case ("even" == "Even"). Encoding always uses the declared name.
template <typename T>
struct convert_enum {
  static_assert(std::is_enum_v<T>, "convert_enum<T> requires an enum type");

  static Node encode(const T& rhs) {
    return Node(std::string(magic_enum::enum_name(rhs)));
  }

  static bool decode(const Node& node, T& rhs) {
    if (!node.IsScalar()) {
      return false;
    }
    const auto parsed =
        magic_enum::enum_cast<T>(node.Scalar(), magic_enum::case_insensitive);
    if (!parsed) {
      return false;
    }
    rhs = *parsed;
    return true;
  }
};

template <>
struct convert<utl::EParity> : convert_enum<utl::EParity> {};

template <>
struct convert<utl::EStopBits> : convert_enum<utl::EStopBits> {};

}  // namespace YAML

#pragma once

#include <CommandDescriptor.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Command set of the Radleys Carousel Connect hotplate/stirrer ("new"
// IKA-compatible protocol, selected with PA_NEW). Reply slices skip the
// echoed command name in front of the value.
struct RadleysCarouselCommands {
  static constexpr std::string_view kDefaultName{"Radleys Carousel Connect"};

  using CodeTable = std::array<std::pair<int, std::string_view>, 2>;
  static constexpr CodeTable kTemperatureMode{{{0, "PRECISE"}, {1, "FAST"}}};
  // Whether heater and motor come back on after a power loss.
  static constexpr CodeTable kResetMode{{{0, "ALL OFF"}, {1, "ALL ON"}}};
  static constexpr std::array<std::pair<int, std::string_view>, 4> kStatus{{
      {-1, "REMOTE BLOCKED"},
      {0, "MANUAL"},
      {1, "REMOTE START"},
      {2, "REMOTE STOP"},
  }};
  static constexpr int kStatusRemoteBlocked{-1};
  static constexpr int kStatusRemoteStart{1};

  // Control
  static constexpr CommandDescriptor kSetTemperature{
      .name = "OUT_SP_1",
      .argumentType = ArgumentType::Integer,
      .bounds = ArgumentBounds{.min = 20, .max = 300},
      .reply = ReplySpec{.type = ReplyType::Real, .slice = ReplySlice{.start = 9}}};
  static constexpr CommandDescriptor kSetSpeed{
      .name = "OUT_SP_3",
      .argumentType = ArgumentType::Real,
      .bounds = ArgumentBounds{.min = 100, .max = 1400},
      .reply = ReplySpec{.type = ReplyType::String, .slice = ReplySlice{.start = 9}}};
  static constexpr CommandDescriptor kSetResetMode{
      .name = "OUT_MODE_2",
      .argumentType = ArgumentType::Integer,
      .bounds = ArgumentBounds{.min = 0, .max = 1},
      .reply = ReplySpec{.type = ReplyType::String, .slice = ReplySlice{.start = 0}}};
  static constexpr CommandDescriptor kSetTemperatureMode{
      .name = "OUT_MODE_4",
      .argumentType = ArgumentType::Integer,
      .bounds = ArgumentBounds{.min = 0, .max = 1},
      .reply = ReplySpec{.type = ReplyType::String, .slice = ReplySlice{.start = 0}}};
  static constexpr CommandDescriptor kStartHeat{
      .name = "START_1", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kStartStir{
      .name = "START_2", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kStopHeat{
      .name = "STOP_1", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kStopStir{
      .name = "STOP_2", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kReset{.name = "RESET"};

  // Readings, "IN_PV_n " precedes the value
  static constexpr ReplySpec kReadingReply{.type = ReplyType::Real,
                                           .slice = ReplySlice{.start = 8}};
  static constexpr CommandDescriptor kGetProbeTemperature{
      .name = "IN_PV_1", .reply = kReadingReply};
  static constexpr CommandDescriptor kGetProbeSafetyTemperature{
      .name = "IN_PV_2", .reply = kReadingReply};
  static constexpr CommandDescriptor kGetHotplateTemperature{
      .name = "IN_PV_3", .reply = kReadingReply};
  static constexpr CommandDescriptor kGetHotplateSafetyTemperature{
      .name = "IN_PV_4", .reply = kReadingReply};
  static constexpr CommandDescriptor kGetStirSpeed{.name = "IN_PV_5",
                                                   .reply = kReadingReply};
  static constexpr CommandDescriptor kGetTemperatureSetpoint{
      .name = "IN_SP_1", .reply = kReadingReply};
  static constexpr CommandDescriptor kGetTemperatureSafetyDelta{
      .name = "IN_SP_2", .reply = kReadingReply};
  static constexpr CommandDescriptor kGetSpeedSetpoint{.name = "IN_SP_3",
                                                       .reply = kReadingReply};

  // Mode queries, "IN_MODE_n " precedes the value
  static constexpr ReplySpec kModeReply{.type = ReplyType::Integer,
                                        .slice = ReplySlice{.start = 10}};
  static constexpr CommandDescriptor kQueryTemperatureSensorType{
      .name = "IN_MODE_1", .argumentType = ArgumentType::Integer,
      .reply = kModeReply};
  static constexpr CommandDescriptor kQueryResetMode{
      .name = "IN_MODE_2", .argumentType = ArgumentType::Integer,
      .reply = kModeReply};
  static constexpr CommandDescriptor kQueryTemperatureMode{
      .name = "IN_MODE_4", .argumentType = ArgumentType::Integer,
      .reply = kModeReply};
  static constexpr CommandDescriptor kQueryStatus{
      .name = "STATUS", .argumentType = ArgumentType::Integer,
      .reply = ReplySpec{.type = ReplyType::Integer,
                         .slice = ReplySlice{.start = 7}}};

  // Configuration
  static constexpr CommandDescriptor kProtocolNew{
      .name = "PA_NEW", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kProtocolOld{
      .name = "PA_OLD", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kSoftwareVersion{
      .name = "SW_VERS", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kCheckConnectionOn{
      .name = "CC_ON", .reply = ReplySpec{.type = ReplyType::String}};
  static constexpr CommandDescriptor kCheckConnectionOff{
      .name = "CC_OFF", .reply = ReplySpec{.type = ReplyType::String}};

  // Status label for `code`, or nullopt outside the known range (-2, 3).
  [[nodiscard]] static std::optional<std::string_view> statusName(int code);
  [[nodiscard]] static std::optional<std::string_view> lookup(
      const CodeTable& table, int code);
};

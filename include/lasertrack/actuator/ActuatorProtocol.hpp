// ActuatorProtocol.hpp
// -----------------------------------------------------------------------------
// Text protocol spoken with the servo/laser controller (version 1).
// Responsibilities:
//   * Describe every request as a tagged ActuatorCommand.
//   * Encode requests and replies as single lines (no trailing '\n'; the
//     transport adds it).
//   * Parse both directions strictly: anything outside the grammar below is
//     rejected, never guessed at.
//
// Grammar (whitespace allowed around tokens, numbers are finite decimals):
//   request := "(" num "," num ")"            absolute angles, degrees
//            | "norm(" num "," num ")"        normalized position
//            | "on" | "off" | "angles" | "limits" | "test" | "stop"
//            | "version" | "quit"
//   ack     := "1" | "0"
//   angles  := "(" num "," num ")"
//   limits  := "((" num "," num "),(" num "," num "))"
//   version := integer

#pragma once

#include "lasertrack/core/Expected.hpp"
#include "lasertrack/core/Geometry.hpp"

#include <string>
#include <string_view>

namespace lasertrack::actuator {

enum class CommandKind {
    SetAngles,
    SetNormalized,
    LaserOn,
    LaserOff,
    QueryAngles,
    QueryLimits,
    SelfTestStart,
    SelfTestStop,
    Version,
    Quit
};

const char* toString(CommandKind kind);

struct ActuatorCommand {
    CommandKind kind = CommandKind::QueryAngles;
    // (h, v) for SetAngles, (x, y) for SetNormalized; unused otherwise.
    double first = 0.0;
    double second = 0.0;

    static ActuatorCommand setAngles(const core::ServoAngles& angles);
    static ActuatorCommand setNormalized(const core::NormalizedPoint& point);
    static ActuatorCommand simple(CommandKind kind);
};

namespace protocol {

std::string encodeCommand(const ActuatorCommand& command);

/// Fails with `std::errc::invalid_argument` for anything outside the request grammar.
expected<ActuatorCommand> parseCommand(std::string_view line);

std::string encodeAck(bool accepted);
std::string encodeAngles(const core::ServoAngles& angles);
std::string encodeLimits(const core::ServoLimits& limits);
std::string encodeVersion(int version);

// Reply parsers fail with `errc::malformed_reply`.
expected<bool> parseAck(std::string_view line);
expected<core::ServoAngles> parseAngles(std::string_view line);
expected<core::ServoLimits> parseLimits(std::string_view line);
expected<int> parseVersion(std::string_view line);

} // namespace protocol

} // namespace lasertrack::actuator

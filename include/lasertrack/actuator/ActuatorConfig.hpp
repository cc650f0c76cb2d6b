#pragma once

#include <chrono>

namespace lasertrack::actuator::config {

/**
 * @brief Constants that define the servo controller link and its simulator.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short ACTUATOR_PORT_DEFAULT = 15555;
constexpr std::chrono::milliseconds ACTUATOR_IO_TIMEOUT{500};
constexpr std::chrono::milliseconds ACTUATOR_CONNECT_TIMEOUT{1000};

// Protocol --------------------------------------------------------------------
constexpr int ACTUATOR_PROTOCOL_VERSION = 1;

// Simulated controller (matches the stock pan-tilt rig) -----------------------
constexpr double SIM_H_MIN = 30.0;
constexpr double SIM_H_MAX = 150.0;
constexpr double SIM_V_MIN = 0.0;
constexpr double SIM_V_MAX = 120.0;
constexpr double SIM_SELF_TEST_STEP_DEG = 1.0;
constexpr std::chrono::milliseconds SIM_SELF_TEST_TICK{50};

} // namespace lasertrack::actuator::config

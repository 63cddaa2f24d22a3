// src/control/control_mode.hpp
#pragma once

#include <string>

namespace control {

// User-selected operating policy
enum class ControlMode {
    ZeroGrid,
    FollowSchedule,
    Hybrid,
    Manual
};

// What the latest plan tells the battery to do right now
enum class EffectiveMode {
    Charging,
    Discharging,
    Idle,
    ZeroGrid,
    Manual
};

// Tactical behaviour of the RealTimeBalancer
enum class BalancerMode {
    ZeroGrid,
    FollowSchedule,
    Idle,
    Manual
};

// Label of an issued setpoint
enum class ActionLabel {
    Charging,
    Discharging,
    Idle
};

const char* to_string(ControlMode m);
const char* to_string(EffectiveMode m);
const char* to_string(BalancerMode m);
const char* to_string(ActionLabel a);

/**
 * Parse "zero_grid", "follow_schedule", "hybrid", "manual" (case-insensitive).
 * @throws model::ConfigurationError for anything else
 */
ControlMode parse_control_mode(const std::string& name);

} // namespace control

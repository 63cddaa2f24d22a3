// src/control/control_mode.cpp
#include "control/control_mode.hpp"
#include "model/errors.hpp"

#include <algorithm>
#include <cctype>

namespace control {

const char* to_string(ControlMode m) {
    switch (m) {
    case ControlMode::ZeroGrid:
        return "zero_grid";
    case ControlMode::FollowSchedule:
        return "follow_schedule";
    case ControlMode::Hybrid:
        return "hybrid";
    case ControlMode::Manual:
        return "manual";
    }
    return "manual";
}

const char* to_string(EffectiveMode m) {
    switch (m) {
    case EffectiveMode::Charging:
        return "charging";
    case EffectiveMode::Discharging:
        return "discharging";
    case EffectiveMode::Idle:
        return "idle";
    case EffectiveMode::ZeroGrid:
        return "zero_grid";
    case EffectiveMode::Manual:
        return "manual";
    }
    return "manual";
}

const char* to_string(BalancerMode m) {
    switch (m) {
    case BalancerMode::ZeroGrid:
        return "zero_grid";
    case BalancerMode::FollowSchedule:
        return "follow_schedule";
    case BalancerMode::Idle:
        return "idle";
    case BalancerMode::Manual:
        return "manual";
    }
    return "manual";
}

const char* to_string(ActionLabel a) {
    switch (a) {
    case ActionLabel::Charging:
        return "charging";
    case ActionLabel::Discharging:
        return "discharging";
    case ActionLabel::Idle:
        return "idle";
    }
    return "idle";
}

ControlMode parse_control_mode(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (v == "zero_grid") return ControlMode::ZeroGrid;
    if (v == "follow_schedule") return ControlMode::FollowSchedule;
    if (v == "hybrid") return ControlMode::Hybrid;
    if (v == "manual") return ControlMode::Manual;

    throw model::ConfigurationError("Unknown control mode: '" + name +
                                    "' (expected zero_grid|follow_schedule|hybrid|manual)");
}

} // namespace control

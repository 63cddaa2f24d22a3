// src/control/real_time_balancer.cpp
#include "control/real_time_balancer.hpp"
#include "model/errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace control {

BalancerSettings BalancerSettings::from_battery(const model::BatteryParams& p,
                                                double deadband_w,
                                                double action_threshold_w) {
    BalancerSettings s;
    s.max_charge_w = p.max_charge_power_w;
    s.max_discharge_w = p.max_discharge_power_w;
    s.soc_min_wh = p.soc_min_wh;
    s.soc_max_wh = p.soc_max_wh;
    s.deadband_w = deadband_w;
    s.action_threshold_w = action_threshold_w;
    return s;
}

RealTimeBalancer::RealTimeBalancer(const BalancerSettings& settings)
    : settings_(settings) {
    if (settings_.deadband_w < 0.0) {
        throw model::ConfigurationError("Balancer deadband must be >= 0 W");
    }
    if (!(settings_.max_charge_w > 0.0) || !(settings_.max_discharge_w > 0.0)) {
        throw model::ConfigurationError("Balancer power limits must be > 0 W");
    }
}

double RealTimeBalancer::clamp_power(double target_w) const {
    return std::clamp(target_w, -settings_.max_discharge_w, settings_.max_charge_w);
}

double RealTimeBalancer::apply_soc_limits(double target_w, std::optional<double> soc_wh) const {
    if (!soc_wh) {
        return target_w;
    }
    if (*soc_wh <= settings_.soc_min_wh && target_w < 0.0) {
        return 0.0;
    }
    if (*soc_wh >= settings_.soc_max_wh && target_w > 0.0) {
        return 0.0;
    }
    return target_w;
}

double RealTimeBalancer::apply_deadband(double target_w) const {
    if (std::abs(target_w - previous_target_w_) < settings_.deadband_w) {
        return previous_target_w_;
    }
    return target_w;
}

ActionLabel RealTimeBalancer::label_for(double target_w) const {
    if (target_w > settings_.action_threshold_w) {
        return ActionLabel::Charging;
    }
    if (target_w < -settings_.action_threshold_w) {
        return ActionLabel::Discharging;
    }
    return ActionLabel::Idle;
}

ControlAction RealTimeBalancer::step(const LiveMeasurement& m, BalancerMode mode, double scheduled_w) {
    ControlAction action;
    action.mode = mode;

    switch (mode) {
    case BalancerMode::ZeroGrid: {
        if (!m.grid_w) {
            LOG_DEBUG("[Balancer] No grid telemetry, inert");
            action.inert = true;
            return action;
        }
        const double battery_w = m.battery_w.value_or(previous_target_w_);
        action.raw_target_w = apply_soc_limits(clamp_power(battery_w - *m.grid_w), m.soc_wh);
        action.target_w = apply_deadband(action.raw_target_w);
        break;
    }
    case BalancerMode::FollowSchedule:
        action.raw_target_w = apply_soc_limits(clamp_power(scheduled_w), m.soc_wh);
        action.target_w = apply_deadband(action.raw_target_w);
        break;
    case BalancerMode::Idle:
    case BalancerMode::Manual:
        // Exactly zero, deadband bypassed
        action.raw_target_w = 0.0;
        action.target_w = 0.0;
        break;
    }

    // Held targets still obey the SoC window
    action.target_w = apply_soc_limits(action.target_w, m.soc_wh);
    action.label = label_for(action.target_w);
    previous_target_w_ = action.target_w;

    LOG_TRACE("[Balancer] mode=%s grid=%.0f bat=%.0f raw=%.0f -> %.0f W (%s)",
              to_string(mode), m.grid_w.value_or(NAN), m.battery_w.value_or(NAN),
              action.raw_target_w, action.target_w, to_string(action.label));
    return action;
}

} // namespace control

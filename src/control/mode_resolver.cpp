// src/control/mode_resolver.cpp
#include "control/mode_resolver.hpp"

namespace control {

EffectiveMode ModeResolver::from_step(optim::StepMode m) {
    switch (m) {
    case optim::StepMode::Charging:
        return EffectiveMode::Charging;
    case optim::StepMode::Discharging:
        return EffectiveMode::Discharging;
    case optim::StepMode::Idle:
        return EffectiveMode::Idle;
    }
    return EffectiveMode::Idle;
}

EffectiveMode ModeResolver::resolve_effective(ControlMode mode,
                                              const optim::Schedule& schedule,
                                              const StepPrices& prices,
                                              double current_grid_w) {
    switch (mode) {
    case ControlMode::ZeroGrid:
        return EffectiveMode::ZeroGrid;
    case ControlMode::Manual:
        return EffectiveMode::Manual;
    case ControlMode::FollowSchedule:
        return schedule.empty() ? EffectiveMode::Idle : from_step(schedule.steps.front().mode);
    case ControlMode::Hybrid:
        break;
    }

    if (schedule.empty()) {
        return EffectiveMode::ZeroGrid;
    }

    const optim::StepMode first = schedule.steps.front().mode;
    switch (first) {
    case optim::StepMode::Idle: {
        bool discharge_ahead = false;
        for (std::size_t t = 1; t < schedule.size(); ++t) {
            if (schedule.steps[t].mode == optim::StepMode::Discharging) {
                discharge_ahead = true;
                break;
            }
        }
        // Preserve capacity for a planned discharge unless PV is being exported
        if (discharge_ahead && current_grid_w >= 0.0) {
            return EffectiveMode::Idle;
        }
        return EffectiveMode::ZeroGrid;
    }
    case optim::StepMode::Discharging:
        if (prices.buy > 0.0 && prices.feed_in >= prices.buy) {
            return EffectiveMode::Discharging;
        }
        return EffectiveMode::ZeroGrid;
    case optim::StepMode::Charging:
        if (current_grid_w < 0.0) {
            // Negative feed-in: keep charging at the planned rate instead of tracking zero
            return prices.feed_in < 0.0 ? EffectiveMode::Charging : EffectiveMode::ZeroGrid;
        }
        return EffectiveMode::Charging;
    }
    return EffectiveMode::ZeroGrid;
}

EffectiveMode ModeResolver::without_plan(ControlMode mode) {
    switch (mode) {
    case ControlMode::ZeroGrid:
    case ControlMode::Hybrid:
        return EffectiveMode::ZeroGrid;
    case ControlMode::FollowSchedule:
        return EffectiveMode::Idle;
    case ControlMode::Manual:
        return EffectiveMode::Manual;
    }
    return EffectiveMode::Manual;
}

BalancerMode ModeResolver::balancer_mode(EffectiveMode effective,
                                         double current_grid_w,
                                         bool has_grid_telemetry) {
    switch (effective) {
    case EffectiveMode::ZeroGrid:
        return BalancerMode::ZeroGrid;
    case EffectiveMode::Idle:
        if (has_grid_telemetry && current_grid_w < 0.0) {
            return BalancerMode::ZeroGrid;
        }
        return BalancerMode::Idle;
    case EffectiveMode::Charging:
    case EffectiveMode::Discharging:
        return BalancerMode::FollowSchedule;
    case EffectiveMode::Manual:
        return BalancerMode::Manual;
    }
    return BalancerMode::Manual;
}

} // namespace control

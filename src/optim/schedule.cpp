// src/optim/schedule.cpp
#include "optim/schedule.hpp"

namespace optim {

const char* to_string(StepMode m) {
    switch (m) {
    case StepMode::Charging:
        return "charging";
    case StepMode::Discharging:
        return "discharging";
    case StepMode::Idle:
        return "idle";
    }
    return "idle";
}

StepMode mode_for_power(double power_w) {
    if (power_w > 0.0) {
        return StepMode::Charging;
    }
    if (power_w < 0.0) {
        return StepMode::Discharging;
    }
    return StepMode::Idle;
}

Diagnostics compute_diagnostics(const Schedule& schedule, double terminal_feed_in_price) {
    Diagnostics d;
    for (const auto& s : schedule.steps) {
        d.total_cost += s.cost;
        d.baseline_cost += s.baseline_cost;
        switch (s.mode) {
        case StepMode::Charging:
            ++d.charge_steps;
            break;
        case StepMode::Discharging:
            ++d.discharge_steps;
            break;
        case StepMode::Idle:
            ++d.idle_steps;
            break;
        }
    }

    d.stored_energy_value = (schedule.end_soc_wh() - schedule.start_soc_wh) / 1000.0 *
                            terminal_feed_in_price;
    d.savings = d.baseline_cost - d.total_cost + d.stored_energy_value;
    return d;
}

} // namespace optim

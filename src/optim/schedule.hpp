// src/optim/schedule.hpp
#pragma once

#include <vector>

namespace optim {

enum class StepMode {
    Charging,
    Discharging,
    Idle
};

const char* to_string(StepMode m);

StepMode mode_for_power(double power_w);

/**
 * One planned step. soc_wh is the stored energy at the END of the step.
 */
struct ScheduleStep {
    double power_w = 0.0;
    StepMode mode = StepMode::Idle;
    int soc_index = 0;
    double soc_wh = 0.0;
    double stored_delta_wh = 0.0;
    double battery_grid_wh = 0.0;
    double cost = 0.0;
    double baseline_cost = 0.0;
    double profit_loss = 0.0;       // baseline_cost - cost
};

struct Schedule {
    double step_hours = 0.25;
    int start_index = 0;
    double start_soc_wh = 0.0;
    std::vector<ScheduleStep> steps;

    std::size_t size() const { return steps.size(); }
    bool empty() const { return steps.empty(); }

    double end_soc_wh() const { return steps.empty() ? start_soc_wh : steps.back().soc_wh; }
};

struct Diagnostics {
    double total_cost = 0.0;
    double baseline_cost = 0.0;
    double stored_energy_value = 0.0;
    double savings = 0.0;
    int charge_steps = 0;
    int discharge_steps = 0;
    int idle_steps = 0;
};

/**
 * Totals over a schedule. Energy left in the battery at the end of the
 * horizon (relative to the start) is credited at terminal_feed_in_price.
 */
Diagnostics compute_diagnostics(const Schedule& schedule, double terminal_feed_in_price);

} // namespace optim

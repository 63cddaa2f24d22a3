// src/optim/schedule_optimizer.hpp
#pragma once

#include "model/action_set.hpp"
#include "model/battery_model.hpp"
#include "model/cost_model.hpp"
#include "model/forecast.hpp"
#include "model/soc_lattice.hpp"
#include "optim/schedule.hpp"

#include <optional>
#include <vector>

namespace optim {

struct OptimizerSettings {
    double soc_resolution_wh = 100.0;
    double power_step_w = 500.0;
    double tie_tolerance = 1e-9;      // relative
};

/**
 * ValueTable - V[t][s] for t in [0, T] and the policy for t in [0, T-1].
 * Flat row-major storage, one row per time step.
 */
class ValueTable {
public:
    ValueTable() = default;
    ValueTable(std::size_t steps, int states);

    std::size_t steps() const { return steps_; }
    int states() const { return states_; }
    bool empty() const { return values_.empty(); }

    double& value(std::size_t t, int s) { return values_[t * states_ + s]; }
    double value(std::size_t t, int s) const { return values_[t * states_ + s]; }

    int& policy(std::size_t t, int s) { return policy_[t * states_ + s]; }
    int policy(std::size_t t, int s) const { return policy_[t * states_ + s]; }

private:
    std::size_t steps_ = 0;
    int states_ = 0;
    std::vector<double> values_;   // (steps + 1) * states
    std::vector<int> policy_;      // steps * states, index into ActionSet
};

struct OptimizationResult {
    Schedule schedule;
    ValueTable values;
};

/**
 * ScheduleOptimizer - backward-induction dynamic program over the SoC
 * lattice, followed by a forward walk of the resulting policy.
 *
 * Terminal value: V[T][s] = -(energy_at(s) / 1000 * feed_in_price[T-1]).
 * Backward pass: V[t][s] = min_a cost(t, s, a) + V[t+1][s'], infeasible
 * actions excluded, ties resolved toward idle.
 *
 * Pure computation, no I/O; a single instance may be used from one thread
 * at a time.
 */
class ScheduleOptimizer {
public:
    ScheduleOptimizer(const model::BatteryModel& battery, const OptimizerSettings& settings);

    // cost_ refers to battery_
    ScheduleOptimizer(const ScheduleOptimizer&) = delete;
    ScheduleOptimizer& operator=(const ScheduleOptimizer&) = delete;

    const model::BatteryModel& battery() const { return battery_; }
    const model::SocLattice& lattice() const { return lattice_; }
    const model::ActionSet& actions() const { return actions_; }
    const model::CostModel& cost_model() const { return cost_; }
    const OptimizerSettings& settings() const { return settings_; }

    /**
     * Starting lattice index from a live SoC reading, else the fallback.
     * @throws model::SensorUnavailable when neither is present
     */
    int resolve_start_index(std::optional<double> current_soc_wh,
                            std::optional<double> fallback_soc_wh) const;

    /**
     * @throws model::MissingInputError for incomplete forecasts
     * @throws model::InvariantViolation if a state has no feasible action
     */
    ValueTable backward_pass(const model::HorizonForecast& fc) const;

    Schedule forward_pass(const model::HorizonForecast& fc,
                          const ValueTable& values,
                          int start_index) const;

    /**
     * Full cycle: validate, backward pass, forward pass.
     */
    OptimizationResult optimize(const model::HorizonForecast& fc,
                                std::optional<double> current_soc_wh,
                                std::optional<double> fallback_soc_wh = std::nullopt) const;

    /**
     * Fill one schedule step for a transition already known to be feasible.
     * power_w is the battery's AC-side power for the realized delta, so
     * power_w * dt always equals battery_grid_wh. Direct DC-coupled PV
     * charging is not part of it.
     */
    ScheduleStep make_step(const model::HorizonForecast& fc, std::size_t t,
                           const model::Transition& tr) const;

private:
    model::BatteryModel battery_;
    OptimizerSettings settings_;
    model::SocLattice lattice_;
    model::ActionSet actions_;
    model::CostModel cost_;
};

} // namespace optim

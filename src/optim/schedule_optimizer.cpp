// src/optim/schedule_optimizer.cpp
#include "optim/schedule_optimizer.hpp"
#include "model/errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <string>

namespace optim {

ValueTable::ValueTable(std::size_t steps, int states)
    : steps_(steps),
      states_(states),
      values_((steps + 1) * static_cast<std::size_t>(states), 0.0),
      policy_(steps * static_cast<std::size_t>(states), model::ActionSet::kIdleIndex) {}

ScheduleOptimizer::ScheduleOptimizer(const model::BatteryModel& battery, const OptimizerSettings& settings)
    : battery_(battery),
      settings_(settings),
      lattice_(battery.params().soc_min_wh, battery.params().soc_max_wh, settings.soc_resolution_wh),
      actions_(battery.params().max_discharge_power_w, battery.params().max_charge_power_w,
               settings.power_step_w),
      cost_(battery_) {
    if (settings_.tie_tolerance < 0.0) {
        throw model::ConfigurationError("tie_tolerance must be >= 0");
    }
    LOG_DEBUG("[Optimizer] lattice: %d states @ %.0f Wh, %zu actions @ %.0f W",
              lattice_.size(), lattice_.resolution_wh(), actions_.size(), settings_.power_step_w);
}

int ScheduleOptimizer::resolve_start_index(std::optional<double> current_soc_wh,
                                           std::optional<double> fallback_soc_wh) const {
    if (current_soc_wh && std::isfinite(*current_soc_wh)) {
        return lattice_.snap(*current_soc_wh);
    }
    if (fallback_soc_wh && std::isfinite(*fallback_soc_wh)) {
        LOG_WARN("[Optimizer] Live SoC unavailable, using last known %.0f Wh", *fallback_soc_wh);
        return lattice_.snap(*fallback_soc_wh);
    }
    throw model::SensorUnavailable("No current SoC reading and no persisted fallback");
}

ValueTable ScheduleOptimizer::backward_pass(const model::HorizonForecast& fc) const {
    fc.validate();

    const std::size_t T = fc.steps();
    const int N = lattice_.size();
    const double dt_h = fc.step_hours;
    const double tol = settings_.tie_tolerance;

    ValueTable vt(T, N);

    // Stored energy is worth what it would fetch at the last known feed-in price
    const double terminal_price = fc.feed_in_price[T - 1];
    for (int s = 0; s < N; ++s) {
        vt.value(T, s) = -(lattice_.energy_at(s) / 1000.0 * terminal_price);
    }

    // Transitions depend only on (s, a); precompute once per cycle
    const std::size_t A = actions_.size();
    std::vector<model::Transition> transitions(static_cast<std::size_t>(N) * A);
    for (int s = 0; s < N; ++s) {
        for (std::size_t a = 0; a < A; ++a) {
            transitions[s * A + a] = battery_.apply(lattice_, s, actions_[a], dt_h);
        }
    }

    for (std::size_t t = T; t-- > 0;) {
        for (int s = 0; s < N; ++s) {
            double best = std::numeric_limits<double>::infinity();
            int best_a = -1;

            for (std::size_t a = 0; a < A; ++a) {
                const model::Transition& tr = transitions[s * A + a];
                if (!tr.feasible) {
                    continue;
                }

                const double candidate = cost_.cost(fc, t, tr.stored_delta_wh) +
                                         vt.value(t + 1, tr.next_index);

                // Levels run outward from idle; only a clear improvement moves away from it
                if (best_a < 0 || candidate < best - tol * std::max(1.0, std::abs(best))) {
                    best = candidate;
                    best_a = static_cast<int>(a);
                }
            }

            if (best_a < 0) {
                LOG_ERROR("[Optimizer] No feasible action: t=%zu s=%d soc=%.1f Wh actions=%zu "
                          "buy=%.4f feed_in=%.4f load=%.0f W pv=%.0f W",
                          t, s, lattice_.energy_at(s), A, fc.buy_price[t], fc.feed_in_price[t],
                          fc.consumption_w[t], fc.total_pv_w(t));
                throw model::InvariantViolation("No feasible action at t=" + std::to_string(t) +
                                                " soc_index=" + std::to_string(s));
            }

            vt.value(t, s) = best;
            vt.policy(t, s) = best_a;
        }
    }

    return vt;
}

ScheduleStep ScheduleOptimizer::make_step(const model::HorizonForecast& fc, std::size_t t,
                                          const model::Transition& tr) const {
    const model::StepCost c = cost_.evaluate(fc, t, tr.stored_delta_wh);

    ScheduleStep step;
    step.power_w = c.battery_grid_wh / fc.step_hours;
    step.mode = mode_for_power(tr.stored_delta_wh);
    step.soc_index = tr.next_index;
    step.soc_wh = lattice_.energy_at(tr.next_index);
    step.stored_delta_wh = tr.stored_delta_wh;
    step.battery_grid_wh = c.battery_grid_wh;
    step.cost = c.total();
    step.baseline_cost = cost_.baseline(fc, t);
    step.profit_loss = step.baseline_cost - step.cost;
    return step;
}

Schedule ScheduleOptimizer::forward_pass(const model::HorizonForecast& fc,
                                         const ValueTable& values,
                                         int start_index) const {
    if (values.steps() != fc.steps() || values.states() != lattice_.size()) {
        throw model::InvariantViolation("Value table does not match forecast/lattice dimensions");
    }
    if (!lattice_.contains(start_index)) {
        throw model::InvariantViolation("Start SoC index " + std::to_string(start_index) +
                                        " outside lattice");
    }

    Schedule sched;
    sched.step_hours = fc.step_hours;
    sched.start_index = start_index;
    sched.start_soc_wh = lattice_.energy_at(start_index);
    sched.steps.reserve(fc.steps());

    int s = start_index;
    for (std::size_t t = 0; t < fc.steps(); ++t) {
        const double power_w = actions_[static_cast<std::size_t>(values.policy(t, s))];
        const model::Transition tr = battery_.apply(lattice_, s, power_w, fc.step_hours);
        if (!tr.feasible) {
            LOG_ERROR("[Optimizer] Policy picked infeasible action: t=%zu s=%d P=%.0f W", t, s, power_w);
            throw model::InvariantViolation("Policy action infeasible at t=" + std::to_string(t));
        }

        sched.steps.push_back(make_step(fc, t, tr));
        s = tr.next_index;
    }

    return sched;
}

OptimizationResult ScheduleOptimizer::optimize(const model::HorizonForecast& fc,
                                               std::optional<double> current_soc_wh,
                                               std::optional<double> fallback_soc_wh) const {
    const int start = resolve_start_index(current_soc_wh, fallback_soc_wh);

    const auto t0 = std::chrono::steady_clock::now();

    OptimizationResult result;
    result.values = backward_pass(fc);
    result.schedule = forward_pass(fc, result.values, start);

    const double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    LOG_INFO("[Optimizer] %zu steps x %d states x %zu actions in %.1f ms (start %.0f Wh)",
             fc.steps(), lattice_.size(), actions_.size(), ms, result.schedule.start_soc_wh);

    if (result.schedule.size() != fc.steps()) {
        throw model::InvariantViolation("Schedule length differs from forecast length");
    }
    return result;
}

} // namespace optim

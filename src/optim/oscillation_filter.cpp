// src/optim/oscillation_filter.cpp
#include "optim/oscillation_filter.hpp"
#include "model/errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <string>

namespace optim {

OscillationFilter::OscillationFilter(const ScheduleOptimizer& optimizer, const OscillationSettings& settings)
    : optimizer_(optimizer),
      settings_(settings) {
    if (settings_.lookahead_steps < 1) {
        throw model::ConfigurationError("Oscillation lookahead must be >= 1 step");
    }
}

double OscillationFilter::threshold() const {
    const auto& p = optimizer_.battery().params();
    return (2.0 * p.degradation_cost_per_kwh + settings_.min_price_spread) /
           std::sqrt(p.round_trip_efficiency);
}

double OscillationFilter::charge_price(const model::HorizonForecast& fc, std::size_t t) const {
    const double surplus_w = fc.total_pv_w(t) - fc.consumption_w[t];
    if (surplus_w > settings_.pv_surplus_threshold_w) {
        return fc.feed_in_price[t];
    }
    return fc.buy_price[t];
}

Schedule OscillationFilter::apply(const Schedule& schedule, const model::HorizonForecast& fc,
                                  int* pairs_removed) const {
    const std::size_t n = schedule.size();
    if (n != fc.steps()) {
        throw model::InvariantViolation("Oscillation filter: schedule has " + std::to_string(n) +
                                        " steps, forecast " + std::to_string(fc.steps()));
    }

    const double rte = optimizer_.battery().round_trip_efficiency();
    const double min_spread = threshold();

    Schedule out = schedule;
    int removed = 0;

    for (std::size_t i = 0; i < n; ++i) {
        const StepMode mi = out.steps[i].mode;
        if (mi == StepMode::Idle) {
            continue;
        }
        const StepMode opposite = (mi == StepMode::Charging) ? StepMode::Discharging : StepMode::Charging;
        const std::size_t end = std::min(n, i + static_cast<std::size_t>(settings_.lookahead_steps));

        for (std::size_t j = i + 1; j < end; ++j) {
            if (out.steps[j].mode != opposite) {
                continue;
            }

            const std::size_t charge_t = (mi == StepMode::Charging) ? i : j;
            const std::size_t discharge_t = (mi == StepMode::Charging) ? j : i;
            const double spread = fc.buy_price[discharge_t] - charge_price(fc, charge_t) / rte;

            if (spread < min_spread) {
                LOG_DEBUG("[OscFilter] idle pair %zu/%zu: spread %.4f < %.4f",
                          charge_t, discharge_t, spread, min_spread);
                for (std::size_t k : {i, j}) {
                    out.steps[k].power_w = 0.0;
                    out.steps[k].stored_delta_wh = 0.0;
                    out.steps[k].mode = StepMode::Idle;
                }
                ++removed;
                break;
            }
        }
    }

    if (pairs_removed) {
        *pairs_removed = removed;
    }
    if (removed == 0) {
        return out;
    }

    LOG_INFO("[OscFilter] Removed %d unprofitable charge/discharge pair(s)", removed);
    return rewalk(out, fc);
}

Schedule OscillationFilter::rewalk(const Schedule& in, const model::HorizonForecast& fc) const {
    const auto& battery = optimizer_.battery();
    const auto& lattice = optimizer_.lattice();

    Schedule out;
    out.step_hours = in.step_hours;
    out.start_index = in.start_index;
    out.start_soc_wh = in.start_soc_wh;
    out.steps.reserve(in.size());

    int s = in.start_index;
    for (std::size_t t = 0; t < in.size(); ++t) {
        model::Transition tr = battery.shift(lattice, s, in.steps[t].stored_delta_wh, fc.step_hours);
        if (!tr.feasible) {
            LOG_DEBUG("[OscFilter] step %zu no longer feasible after filtering, idling", t);
            tr = battery.shift(lattice, s, 0.0, fc.step_hours);
        }
        out.steps.push_back(optimizer_.make_step(fc, t, tr));
        s = tr.next_index;
    }
    return out;
}

} // namespace optim

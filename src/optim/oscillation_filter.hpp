// src/optim/oscillation_filter.hpp
#pragma once

#include "model/forecast.hpp"
#include "optim/schedule.hpp"
#include "optim/schedule_optimizer.hpp"

namespace optim {

struct OscillationSettings {
    int lookahead_steps = 8;              // window length including the first step; 2 h at 15 min
    double min_price_spread = 0.05;       // currency/kWh
    double pv_surplus_threshold_w = 50.0; // above this, charging costs the feed-in price
};

/**
 * OscillationFilter - drops charge/discharge pairs that do not clear the
 * minimum arbitrage margin.
 *
 * For a charge at i and a discharge at j (or the reverse) with
 * 0 < |j - i| < lookahead_steps:
 *
 *   spread    = buy[discharge] - charge_price[charge] / rte
 *   threshold = (2 * degradation + min_price_spread) / sqrt(rte)
 *
 * where charge_price is the feed-in price when the charge step has a PV
 * surplus, else the buy price. Pairs with spread < threshold become idle.
 * The SoC trajectory is then re-walked from the start, each kept step
 * repeating its stored energy change; any step that would leave the
 * lattice becomes idle too.
 */
class OscillationFilter {
public:
    OscillationFilter(const ScheduleOptimizer& optimizer, const OscillationSettings& settings);

    /**
     * @param pairs_removed optional, receives the number of neutralized pairs
     * @throws model::InvariantViolation if schedule and forecast lengths differ
     */
    Schedule apply(const Schedule& schedule, const model::HorizonForecast& fc,
                   int* pairs_removed = nullptr) const;

    double threshold() const;

    double charge_price(const model::HorizonForecast& fc, std::size_t t) const;

private:
    Schedule rewalk(const Schedule& in, const model::HorizonForecast& fc) const;

    const ScheduleOptimizer& optimizer_;
    OscillationSettings settings_;
};

} // namespace optim

// src/model/cost_model.cpp
#include "model/cost_model.hpp"

#include <algorithm>
#include <cmath>

namespace model {

StepCost CostModel::evaluate(const HorizonForecast& fc, std::size_t t, double stored_delta_wh) const {
    const BatteryParams& p = battery_.params();
    const double dt_h = fc.step_hours;

    const double consumption_wh = fc.consumption_w[t] * dt_h;
    const double ac_pv_wh = fc.ac_pv_w(t) * dt_h;
    const double dc_pv_raw_wh = fc.dc_pv_w(t) * dt_h;

    StepCost c;

    // DC PV into the battery first, the rest of a charge from the AC bus
    double dc_stored_wh = 0.0;
    if (stored_delta_wh > 0.0) {
        dc_stored_wh = std::min(stored_delta_wh, dc_pv_raw_wh * p.pv_dc_efficiency);
    }
    const double dc_left_raw_wh = dc_pv_raw_wh - dc_stored_wh / p.pv_dc_efficiency;
    c.dc_to_ac_wh = std::max(0.0, dc_left_raw_wh) * p.dc_inverter_efficiency;

    c.battery_grid_wh = battery_.grid_energy_wh(stored_delta_wh - dc_stored_wh);
    c.net_grid_wh = consumption_wh - ac_pv_wh - c.dc_to_ac_wh + c.battery_grid_wh;

    if (c.net_grid_wh > 0.0) {
        c.grid_cost = fc.buy_price[t] * c.net_grid_wh / 1000.0;
    } else if (c.net_grid_wh < 0.0) {
        c.feed_in_revenue = fc.feed_in_price[t] * (-c.net_grid_wh) / 1000.0;
    }

    c.degradation_cost = p.degradation_cost_per_kwh * std::abs(stored_delta_wh) / 1000.0;
    return c;
}

} // namespace model

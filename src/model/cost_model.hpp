// src/model/cost_model.hpp
#pragma once

#include "model/battery_model.hpp"
#include "model/forecast.hpp"

namespace model {

/**
 * Economic breakdown of one step. Energies in Wh, money in currency.
 * net_grid_wh > 0 is import, < 0 is export.
 */
struct StepCost {
    double net_grid_wh = 0.0;
    double battery_grid_wh = 0.0;     // AC-side energy drawn (+) or supplied (-) by the battery
    double dc_to_ac_wh = 0.0;         // DC-coupled PV reaching the AC bus
    double grid_cost = 0.0;
    double feed_in_revenue = 0.0;
    double degradation_cost = 0.0;

    double total() const { return grid_cost + degradation_cost - feed_in_revenue; }
};

/**
 * CostModel - cost(t, action) = grid_cost + degradation - feed_in_revenue.
 *
 * The action is given as the realized change of stored energy so that
 * lattice snapping never creates or destroys energy on the grid side.
 * DC-coupled PV charges the battery first at pv_dc_efficiency; whatever
 * the battery does not absorb crosses the inverter at dc_inverter_efficiency.
 */
class CostModel {
public:
    explicit CostModel(const BatteryModel& battery) : battery_(battery) {}

    StepCost evaluate(const HorizonForecast& fc, std::size_t t, double stored_delta_wh) const;

    double cost(const HorizonForecast& fc, std::size_t t, double stored_delta_wh) const {
        return evaluate(fc, t, stored_delta_wh).total();
    }

    // No battery action at all
    double baseline(const HorizonForecast& fc, std::size_t t) const {
        return cost(fc, t, 0.0);
    }

private:
    const BatteryModel& battery_;
};

} // namespace model

// src/model/battery_model.hpp
#pragma once

namespace model {

class SocLattice;

/**
 * Physical battery parameters, all in SI-ish household units (Wh, W).
 * SoC bounds are absolute energies, not percentages.
 */
struct BatteryParams {
    double capacity_wh = 10000.0;
    double soc_min_wh = 1000.0;
    double soc_max_wh = 9000.0;
    double max_charge_power_w = 5000.0;
    double max_discharge_power_w = 5000.0;
    double round_trip_efficiency = 0.90;
    double degradation_cost_per_kwh = 0.03;   // currency per kWh throughput
    double pv_dc_efficiency = 0.97;           // DC-coupled PV -> battery
    double dc_inverter_efficiency = 0.96;     // DC surplus -> AC bus
};

/**
 * Result of applying one action to a lattice state.
 * next_index is only meaningful when feasible == true.
 */
struct Transition {
    bool feasible = false;
    int next_index = 0;
    double stored_delta_wh = 0.0;   // realized change of stored energy (lattice-snapped)
    double power_w = 0.0;           // AC-side power that realizes stored_delta_wh
};

/**
 * BatteryModel - efficiency conversion and feasibility of SoC transitions.
 *
 * Power convention: positive = charge, negative = discharge, measured on
 * the AC side of the battery inverter.
 *
 * Charge:    delta_soc = P * dt * eta_c
 * Discharge: delta_soc = P * dt / eta_d      (P < 0)
 *
 * with eta_c = eta_d = sqrt(round_trip_efficiency).
 */
class BatteryModel {
public:
    /**
     * @throws model::ConfigurationError on invalid parameters
     */
    explicit BatteryModel(const BatteryParams& params);

    const BatteryParams& params() const { return params_; }

    double charge_efficiency() const { return eta_; }
    double discharge_efficiency() const { return eta_; }
    double round_trip_efficiency() const { return params_.round_trip_efficiency; }

    double usable_capacity_wh() const { return params_.soc_max_wh - params_.soc_min_wh; }

    double soc_percent(double soc_wh) const;
    double soc_wh_from_percent(double percent) const;

    /**
     * Change of stored energy (Wh) for an AC-side power held for dt_h hours.
     */
    double soc_delta_wh(double power_w, double dt_h) const;

    /**
     * Grid-side energy (Wh) needed to realize a given change of stored
     * energy. Positive when drawing from the bus, negative when supplying it.
     */
    double grid_energy_wh(double stored_delta_wh) const;

    /**
     * AC-side power (W) that moves stored_delta_wh in dt_h hours.
     */
    double power_for_delta_w(double stored_delta_wh, double dt_h) const;

    /**
     * Largest charge power (W) that keeps the battery at or below soc_max.
     */
    double max_charge_power(double soc_wh, double dt_h) const;

    /**
     * Largest discharge power (W, positive) that keeps the battery at or
     * above soc_min.
     */
    double max_discharge_power(double soc_wh, double dt_h) const;

    bool within_power_limits(double power_w) const;

    /**
     * Feasibility of holding power_w for dt_h starting at lattice index s.
     * The resulting energy is snapped to the nearest lattice point, one
     * point closer to s when the nearest one would need more than the
     * power limit. The transition is infeasible when the point lies outside
     * the lattice or power_w exceeds its limit. Transition::power_w is the
     * power that realizes the snapped delta, not power_w.
     */
    Transition apply(const SocLattice& lattice, int s, double power_w, double dt_h) const;

    /**
     * Same as apply() for a requested change of stored energy.
     */
    Transition shift(const SocLattice& lattice, int s, double stored_delta_wh, double dt_h) const;

    /**
     * Whether buying at buy_price and later selling at sell_price covers
     * conversion losses and wear on both legs.
     */
    bool should_cycle(double buy_price, double sell_price) const;

    /**
     * Wear cost per kWh throughput from the replacement cost per kWh of
     * capacity, the rated cycle life and the depth of discharge at which
     * that life is rated. Each cycle moves 2 * dod kWh per kWh of capacity.
     */
    static double degradation_cost_per_kwh(double replacement_cost_per_kwh,
                                           double cycle_life,
                                           double depth_of_discharge);

    static void validate(const BatteryParams& params);

private:
    BatteryParams params_;
    double eta_;
};

} // namespace model

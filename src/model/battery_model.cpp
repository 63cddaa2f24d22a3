// src/model/battery_model.cpp
#include "model/battery_model.hpp"
#include "model/errors.hpp"
#include "model/soc_lattice.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace model {

namespace {
constexpr double kPowerTolW = 1e-6;
}

BatteryModel::BatteryModel(const BatteryParams& params)
    : params_(params),
      eta_(0.0) {
    validate(params_);
    eta_ = std::sqrt(params_.round_trip_efficiency);

    LOG_DEBUG("[BatteryModel] capacity=%.0f Wh, soc=[%.0f, %.0f] Wh, P=+%.0f/-%.0f W, eta=%.4f",
              params_.capacity_wh, params_.soc_min_wh, params_.soc_max_wh,
              params_.max_charge_power_w, params_.max_discharge_power_w, eta_);
}

void BatteryModel::validate(const BatteryParams& p) {
    if (!(p.capacity_wh > 0.0)) {
        throw ConfigurationError("Invalid battery capacity: must be > 0 Wh");
    }
    if (!(p.round_trip_efficiency > 0.0 && p.round_trip_efficiency <= 1.0)) {
        throw ConfigurationError("Invalid round_trip_efficiency: must be 0 < rte <= 1 (got " +
                                 std::to_string(p.round_trip_efficiency) + ")");
    }
    if (p.soc_min_wh < 0.0 || p.soc_min_wh >= p.soc_max_wh || p.soc_max_wh > p.capacity_wh) {
        throw ConfigurationError("Invalid SoC range: 0 <= soc_min < soc_max <= capacity");
    }
    if (!(p.max_charge_power_w > 0.0) || !(p.max_discharge_power_w > 0.0)) {
        throw ConfigurationError("Invalid power limits: must be > 0 W");
    }
    if (p.degradation_cost_per_kwh < 0.0) {
        throw ConfigurationError("Invalid degradation_cost_per_kwh: must be >= 0");
    }
    if (!(p.pv_dc_efficiency > 0.0 && p.pv_dc_efficiency <= 1.0)) {
        throw ConfigurationError("Invalid pv_dc_efficiency: must be 0 < eff <= 1");
    }
    if (!(p.dc_inverter_efficiency > 0.0 && p.dc_inverter_efficiency <= 1.0)) {
        throw ConfigurationError("Invalid dc_inverter_efficiency: must be 0 < eff <= 1");
    }
}

double BatteryModel::soc_percent(double soc_wh) const {
    return soc_wh / params_.capacity_wh * 100.0;
}

double BatteryModel::soc_wh_from_percent(double percent) const {
    return percent / 100.0 * params_.capacity_wh;
}

double BatteryModel::soc_delta_wh(double power_w, double dt_h) const {
    if (power_w > 0.0) {
        return power_w * dt_h * eta_;
    }
    if (power_w < 0.0) {
        return power_w * dt_h / eta_;
    }
    return 0.0;
}

double BatteryModel::grid_energy_wh(double stored_delta_wh) const {
    if (stored_delta_wh > 0.0) {
        return stored_delta_wh / eta_;
    }
    return stored_delta_wh * eta_;
}

double BatteryModel::power_for_delta_w(double stored_delta_wh, double dt_h) const {
    if (stored_delta_wh == 0.0 || !(dt_h > 0.0)) {
        return 0.0;
    }
    return grid_energy_wh(stored_delta_wh) / dt_h;
}

double BatteryModel::max_charge_power(double soc_wh, double dt_h) const {
    const double headroom_wh = params_.soc_max_wh - soc_wh;
    if (headroom_wh <= 0.0 || dt_h <= 0.0) {
        return 0.0;
    }
    return std::min(headroom_wh / (dt_h * eta_), params_.max_charge_power_w);
}

double BatteryModel::max_discharge_power(double soc_wh, double dt_h) const {
    const double available_wh = soc_wh - params_.soc_min_wh;
    if (available_wh <= 0.0 || dt_h <= 0.0) {
        return 0.0;
    }
    return std::min(available_wh * eta_ / dt_h, params_.max_discharge_power_w);
}

bool BatteryModel::within_power_limits(double power_w) const {
    return power_w <= params_.max_charge_power_w + kPowerTolW &&
           -power_w <= params_.max_discharge_power_w + kPowerTolW;
}

Transition BatteryModel::apply(const SocLattice& lattice, int s, double power_w, double dt_h) const {
    if (!within_power_limits(power_w)) {
        return Transition{};
    }
    return shift(lattice, s, soc_delta_wh(power_w, dt_h), dt_h);
}

Transition BatteryModel::shift(const SocLattice& lattice, int s, double stored_delta_wh, double dt_h) const {
    Transition tr;
    if (!lattice.contains(s) || !(dt_h > 0.0)) {
        return tr;
    }

    const double start_wh = lattice.energy_at(s);
    int next = lattice.nearest_unclamped(start_wh + stored_delta_wh);
    if (next != s && !within_power_limits(power_for_delta_w(lattice.energy_at(next) - start_wh, dt_h))) {
        next += (next > s) ? -1 : 1;
    }
    if (!lattice.contains(next)) {
        return tr;
    }

    tr.feasible = true;
    tr.next_index = next;
    tr.stored_delta_wh = lattice.energy_at(next) - start_wh;
    tr.power_w = power_for_delta_w(tr.stored_delta_wh, dt_h);
    return tr;
}

bool BatteryModel::should_cycle(double buy_price, double sell_price) const {
    const double min_sell = buy_price / params_.round_trip_efficiency +
                            2.0 * params_.degradation_cost_per_kwh;
    return sell_price > min_sell;
}

double BatteryModel::degradation_cost_per_kwh(double replacement_cost_per_kwh,
                                              double cycle_life,
                                              double depth_of_discharge) {
    if (!(cycle_life > 0.0) || !(depth_of_discharge > 0.0 && depth_of_discharge <= 1.0)) {
        throw ConfigurationError("Invalid degradation inputs: cycles > 0 and 0 < dod <= 1 required");
    }
    const double cost_per_cycle = replacement_cost_per_kwh / cycle_life;
    return cost_per_cycle / (2.0 * depth_of_discharge);
}

} // namespace model

// src/control/real_time_balancer.hpp
#pragma once

#include "control/control_mode.hpp"
#include "model/battery_model.hpp"

#include <optional>

namespace control {

/**
 * One tactical sample. Grid power positive = import; battery power
 * positive = charging. Any field may be missing.
 */
struct LiveMeasurement {
    std::optional<double> grid_w;
    std::optional<double> battery_w;
    std::optional<double> soc_wh;
};

struct BalancerSettings {
    double max_charge_w = 5000.0;
    double max_discharge_w = 5000.0;
    double soc_min_wh = 1000.0;
    double soc_max_wh = 9000.0;
    double deadband_w = 50.0;
    double action_threshold_w = 50.0;

    static BalancerSettings from_battery(const model::BatteryParams& p,
                                         double deadband_w,
                                         double action_threshold_w);
};

struct ControlAction {
    double target_w = 0.0;       // issued setpoint, positive = charge
    double raw_target_w = 0.0;   // before deadband
    BalancerMode mode = BalancerMode::Idle;
    ActionLabel label = ActionLabel::Idle;
    bool inert = false;          // no grid telemetry in zero-grid mode
};

/**
 * RealTimeBalancer - short-cadence setpoint computation.
 *
 * Zero-grid: target = battery_w - grid_w, i.e. the battery power that
 * would bring the grid exchange to zero. When the battery reading is
 * missing the previous target stands in for it. Without grid telemetry
 * the balancer is inert and reports 0.
 *
 * The only state carried between ticks is previous_target.
 */
class RealTimeBalancer {
public:
    explicit RealTimeBalancer(const BalancerSettings& settings);

    ControlAction step(const LiveMeasurement& m, BalancerMode mode, double scheduled_w);

    double previous_target() const { return previous_target_w_; }
    const BalancerSettings& settings() const { return settings_; }

    void reset() { previous_target_w_ = 0.0; }

private:
    double clamp_power(double target_w) const;
    double apply_soc_limits(double target_w, std::optional<double> soc_wh) const;
    double apply_deadband(double target_w) const;
    ActionLabel label_for(double target_w) const;

    BalancerSettings settings_;
    double previous_target_w_ = 0.0;
};

} // namespace control

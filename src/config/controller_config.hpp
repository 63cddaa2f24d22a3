// src/config/controller_config.hpp
#pragma once

#include <string>

#include "control/control_mode.hpp"
#include "model/battery_model.hpp"
#include "optim/oscillation_filter.hpp"
#include "optim/schedule_optimizer.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"

namespace config {

struct ControlSettings {
    control::ControlMode mode = control::ControlMode::Hybrid;
    double deadband_w = 50.0;
    double tick_s = 5.0;
    double planning_interval_minutes = 15.0;
    double action_threshold_w = 50.0;
};

/**
 * ControllerConfig - Loads battery and planner parameters from YAML files
 *
 * Usage:
 *   auto cfg = ControllerConfig::load("config/battery.yaml");
 *   model::BatteryModel battery(cfg.battery);
 *
 * Falls back to defaults if the file is not found.
 */
class ControllerConfig {
public:
    std::string name;

    model::BatteryParams battery;
    optim::OptimizerSettings optimizer;
    optim::OscillationSettings oscillation;
    ControlSettings control;

    double time_step_minutes = 15.0;
    double horizon_hours = 24.0;         // steps planned per cycle
    double min_horizon_hours = 1.0;      // shorter forecasts fail the cycle
    double fixed_feed_in_price = 0.07;   // explicit fallback for missing feed-in prices

    std::string state_path = "bess_state.yaml";

    utils::LogLevel log_level = utils::LogLevel::Info;
    std::string log_file;

    utils::InfluxConfig influx;

    double step_hours() const { return time_step_minutes / 60.0; }
    std::size_t horizon_steps() const;
    std::size_t min_horizon_steps() const;

    /**
     * Load controller config from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/battery.yaml")
     * @return ControllerConfig with loaded parameters
     * @throws std::runtime_error if file exists but cannot be parsed
     * @throws model::ConfigurationError if a parameter is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static ControllerConfig load(const std::string& yaml_path);

    /**
     * 10 kWh battery, 5 kW both ways, 90 % round trip, 15 min steps.
     */
    static ControllerConfig get_default();

    /**
     * @throws model::ConfigurationError if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    ControllerConfig() = default;
};

} // namespace config

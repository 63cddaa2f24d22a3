// src/config/controller_config.cpp
#include "config/controller_config.hpp"
#include "model/errors.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace config {

namespace {

int lookahead_steps(double lookahead_minutes, double step_minutes) {
    if (step_minutes <= 0.0) {
        return 1;
    }
    return std::max(1, static_cast<int>(std::lround(lookahead_minutes / step_minutes)));
}

} // namespace

std::size_t ControllerConfig::horizon_steps() const {
    return static_cast<std::size_t>(std::max(1L, std::lround(horizon_hours * 60.0 / time_step_minutes)));
}

std::size_t ControllerConfig::min_horizon_steps() const {
    return static_cast<std::size_t>(std::max(1L, std::lround(min_horizon_hours * 60.0 / time_step_minutes)));
}

ControllerConfig ControllerConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[ControllerConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[ControllerConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[ControllerConfig] Loading controller config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        ControllerConfig cfg = get_default();

        if (root["controller"]) {
            cfg.name = root["controller"]["name"].as<std::string>(cfg.name);
        }

        // ====================================================================
        // Parse battery
        // ====================================================================
        if (root["battery"]) {
            auto bat = root["battery"];
            const double capacity_kwh = bat["capacity_kwh"].as<double>(10.0);
            const double min_pct = bat["min_soc_percent"].as<double>(10.0);
            const double max_pct = bat["max_soc_percent"].as<double>(90.0);

            cfg.battery.capacity_wh = capacity_kwh * 1000.0;
            cfg.battery.soc_min_wh = cfg.battery.capacity_wh * min_pct / 100.0;
            cfg.battery.soc_max_wh = cfg.battery.capacity_wh * max_pct / 100.0;
            cfg.battery.max_charge_power_w = bat["max_charge_power_kw"].as<double>(5.0) * 1000.0;
            cfg.battery.max_discharge_power_w = bat["max_discharge_power_kw"].as<double>(5.0) * 1000.0;
            cfg.battery.round_trip_efficiency = bat["round_trip_efficiency"].as<double>(0.90);
            cfg.battery.degradation_cost_per_kwh = bat["degradation_cost_per_kwh"].as<double>(0.03);
            cfg.battery.pv_dc_efficiency = bat["pv_dc_efficiency"].as<double>(0.97);
            cfg.battery.dc_inverter_efficiency = bat["dc_inverter_efficiency"].as<double>(0.96);
        }

        // ====================================================================
        // Parse optimizer
        // ====================================================================
        double lookahead_minutes = 120.0;
        if (root["optimizer"]) {
            auto opt = root["optimizer"];
            cfg.optimizer.soc_resolution_wh = opt["soc_resolution_wh"].as<double>(100.0);
            cfg.optimizer.power_step_w = opt["power_step_w"].as<double>(500.0);
            cfg.optimizer.tie_tolerance = opt["tie_tolerance"].as<double>(1e-9);
            cfg.time_step_minutes = opt["time_step_minutes"].as<double>(15.0);
            cfg.horizon_hours = opt["horizon_hours"].as<double>(24.0);
            cfg.min_horizon_hours = opt["min_horizon_hours"].as<double>(1.0);
            cfg.oscillation.min_price_spread = opt["min_price_spread"].as<double>(0.05);
            lookahead_minutes = opt["oscillation_lookahead_minutes"].as<double>(120.0);
            cfg.fixed_feed_in_price = opt["fixed_feed_in_price"].as<double>(0.07);
        }
        cfg.oscillation.lookahead_steps = lookahead_steps(lookahead_minutes, cfg.time_step_minutes);

        // ====================================================================
        // Parse control
        // ====================================================================
        if (root["control"]) {
            auto ctl = root["control"];
            cfg.control.mode = control::parse_control_mode(ctl["mode"].as<std::string>("hybrid"));
            cfg.control.deadband_w = ctl["deadband_w"].as<double>(50.0);
            cfg.control.tick_s = ctl["tick_s"].as<double>(5.0);
            cfg.control.planning_interval_minutes = ctl["planning_interval_minutes"].as<double>(15.0);
            cfg.control.action_threshold_w = ctl["action_threshold_w"].as<double>(50.0);
        }

        if (root["state"]) {
            cfg.state_path = root["state"]["path"].as<std::string>(cfg.state_path);
        }

        // ====================================================================
        // Parse logging
        // ====================================================================
        if (root["logging"]) {
            auto lg = root["logging"];
            const std::string level = lg["level"].as<std::string>("info");
            if (!utils::parse_level(level, cfg.log_level)) {
                LOG_WARN("[ControllerConfig] Unknown log level '%s', using info", level.c_str());
                cfg.log_level = utils::LogLevel::Info;
            }
            cfg.log_file = lg["file"].as<std::string>("");
        }

        // ====================================================================
        // Parse influx
        // ====================================================================
        if (root["influx"]) {
            auto ix = root["influx"];
            cfg.influx.enabled = ix["enabled"].as<bool>(false);
            cfg.influx.url = ix["url"].as<std::string>(cfg.influx.url);
            cfg.influx.token = ix["token"].as<std::string>("");
            cfg.influx.org = ix["org"].as<std::string>(cfg.influx.org);
            cfg.influx.bucket = ix["bucket"].as<std::string>(cfg.influx.bucket);
            cfg.influx.write_interval_s = ix["write_interval_s"].as<double>(cfg.control.tick_s);
        }

        cfg.validate();

        LOG_INFO("[ControllerConfig] Successfully loaded: %s", cfg.name.c_str());
        cfg.print_summary();

        return cfg;

    } catch (const model::ConfigurationError&) {
        throw;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[ControllerConfig] YAML parse error: ") + e.what()
        );
    }
}

ControllerConfig ControllerConfig::get_default() {
    ControllerConfig cfg;

    cfg.name = "Home battery (Default)";

    cfg.battery.capacity_wh = 10000.0;
    cfg.battery.soc_min_wh = 1000.0;
    cfg.battery.soc_max_wh = 9000.0;
    cfg.battery.max_charge_power_w = 5000.0;
    cfg.battery.max_discharge_power_w = 5000.0;
    cfg.battery.round_trip_efficiency = 0.90;
    cfg.battery.degradation_cost_per_kwh = 0.03;
    cfg.battery.pv_dc_efficiency = 0.97;
    cfg.battery.dc_inverter_efficiency = 0.96;

    cfg.optimizer.soc_resolution_wh = 100.0;
    cfg.optimizer.power_step_w = 500.0;
    cfg.optimizer.tie_tolerance = 1e-9;
    cfg.time_step_minutes = 15.0;
    cfg.horizon_hours = 24.0;
    cfg.min_horizon_hours = 1.0;
    cfg.fixed_feed_in_price = 0.07;

    cfg.oscillation.min_price_spread = 0.05;
    cfg.oscillation.lookahead_steps = 8;

    cfg.control.mode = control::ControlMode::Hybrid;
    cfg.control.deadband_w = 50.0;
    cfg.control.tick_s = 5.0;
    cfg.control.planning_interval_minutes = 15.0;
    cfg.control.action_threshold_w = 50.0;

    cfg.influx.write_interval_s = cfg.control.tick_s;

    return cfg;
}

void ControllerConfig::validate() const {
    // Battery validation (capacity, efficiency, SoC window, power limits)
    model::BatteryModel::validate(battery);

    // Planner validation
    if (optimizer.soc_resolution_wh <= 0.0) {
        throw model::ConfigurationError("Invalid soc_resolution_wh: must be > 0");
    }
    if (optimizer.soc_resolution_wh > battery.soc_max_wh - battery.soc_min_wh) {
        throw model::ConfigurationError("Invalid soc_resolution_wh: larger than the usable SoC window");
    }
    if (optimizer.power_step_w <= 0.0) {
        throw model::ConfigurationError("Invalid power_step_w: must be > 0");
    }
    if (optimizer.tie_tolerance < 0.0) {
        throw model::ConfigurationError("Invalid tie_tolerance: must be >= 0");
    }
    if (time_step_minutes <= 0.0) {
        throw model::ConfigurationError("Invalid time_step_minutes: must be > 0");
    }
    if (horizon_hours <= 0.0 || min_horizon_hours <= 0.0 || min_horizon_hours > horizon_hours) {
        throw model::ConfigurationError("Invalid horizon: 0 < min_horizon_hours <= horizon_hours");
    }
    if (oscillation.min_price_spread < 0.0) {
        throw model::ConfigurationError("Invalid min_price_spread: must be >= 0");
    }
    if (!std::isfinite(fixed_feed_in_price)) {
        throw model::ConfigurationError("Invalid fixed_feed_in_price: must be a number");
    }

    // Control validation
    if (control.deadband_w < 0.0) {
        throw model::ConfigurationError("Invalid deadband_w: must be >= 0");
    }
    if (control.tick_s <= 0.0) {
        throw model::ConfigurationError("Invalid tick_s: must be > 0");
    }
    if (control.planning_interval_minutes <= 0.0) {
        throw model::ConfigurationError("Invalid planning_interval_minutes: must be > 0");
    }
    if (control.action_threshold_w < 0.0) {
        throw model::ConfigurationError("Invalid action_threshold_w: must be >= 0");
    }

    LOG_DEBUG("[ControllerConfig] Validation passed");
}

void ControllerConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Battery Controller Configuration");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    LOG_INFO("----------------------------------------");
    LOG_INFO("Capacity: %.1f kWh (usable %.1f - %.1f kWh)",
             battery.capacity_wh / 1000.0, battery.soc_min_wh / 1000.0, battery.soc_max_wh / 1000.0);
    LOG_INFO("Power: +%.1f / -%.1f kW", battery.max_charge_power_w / 1000.0,
             battery.max_discharge_power_w / 1000.0);
    LOG_INFO("Round trip: %.0f %%, wear %.3f /kWh", battery.round_trip_efficiency * 100.0,
             battery.degradation_cost_per_kwh);
    LOG_INFO("Planner: %zu x %.0f min steps, %.0f Wh x %.0f W lattice",
             horizon_steps(), time_step_minutes, optimizer.soc_resolution_wh, optimizer.power_step_w);
    LOG_INFO("Control: %s, deadband %.0f W, tick %.1f s",
             control::to_string(control.mode), control.deadband_w, control.tick_s);
    LOG_INFO("========================================");
}

} // namespace config

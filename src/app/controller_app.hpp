// src/app/controller_app.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "app/lua_scenario.hpp"
#include "app/plan_publisher.hpp"
#include "app/planning_service.hpp"
#include "app/state_store.hpp"
#include "config/controller_config.hpp"
#include "control/real_time_balancer.hpp"
#include "model/battery_model.hpp"
#include "model/forecast.hpp"
#include "utils/influx.hpp"

namespace app {

struct ControllerAppConfig {
    // Forecast source: CSV file, else the Lua scenario's scenario_forecast()
    std::string forecast_csv_path;

    // Site behaviour: Lua scenario_site(), else the forecast values themselves
    std::string lua_script_path;

    // Simulated battery at start; falls back to the persisted SoC, then mid-window
    std::optional<double> initial_soc_percent;

    double duration_s = 86400.0;
    bool real_time_mode = false;
    bool enable_influx = false;

    std::string csv_log_path = "bess_ticks.csv";
};

/**
 * ControllerApp - wires the planning loop and the tactical loop around a
 * simulated battery and site.
 *
 * Fast mode steps a simulated clock: a planning cycle whenever the planning
 * interval has elapsed, then one tactical tick. Real-time mode runs the
 * planner on its own thread and paces the tactical loop on the main thread;
 * the two share only the plan publisher, the state store and a small
 * mutex-guarded live measurement.
 */
class ControllerApp {
public:
    ControllerApp(ControllerAppConfig app_cfg, config::ControllerConfig cfg);
    ~ControllerApp();

    int run();

    // Only stores an atomic flag; safe from a signal handler
    void request_stop() { stop_.store(true); }

private:
    int run_fast();
    int run_real_time();

    bool open_csv();
    bool init_scenario(LuaScenario& lua);

    bool build_forecast(LuaScenario* lua, double now_s, model::HorizonForecast& out);
    SiteSample site_at(LuaScenario* lua, double now_s, double setpoint_w);

    void planning_cycle(LuaScenario* lua, double now_s);
    void tactical_tick(LuaScenario* lua, double now_s);

    void apply_to_battery(double setpoint_w, double dt_s);
    void print_summary();

    ControllerAppConfig app_cfg_;
    config::ControllerConfig cfg_;

    model::BatteryModel battery_;
    StateStore store_;
    PlanPublisher publisher_;
    PlanningService planner_;
    control::RealTimeBalancer balancer_;
    std::unique_ptr<utils::InfluxClient> influx_;
    std::mutex influx_mu_;

    std::optional<model::HorizonForecast> csv_forecast_;

    // Simulated battery, touched by the tactical loop only
    double sim_soc_wh_ = 0.0;
    double sim_power_w_ = 0.0;

    // Latest tactical measurement, read by the planner
    std::mutex live_mu_;
    control::LiveMeasurement live_;

    std::ofstream csv_;

    std::atomic<bool> stop_{false};
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;

    // Totals for the summary
    double import_wh_ = 0.0;
    double export_wh_ = 0.0;
    double charged_wh_ = 0.0;
    double discharged_wh_ = 0.0;
    std::size_t ticks_ = 0;
    std::size_t inert_ticks_ = 0;
    std::atomic<std::size_t> cycles_ok_{0};
    std::atomic<std::size_t> cycles_failed_{0};
};

} // namespace app

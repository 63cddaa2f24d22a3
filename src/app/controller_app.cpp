// src/app/controller_app.cpp
#include "app/controller_app.hpp"
#include "app/forecast_csv.hpp"
#include "app/timing_controller.hpp"
#include "control/mode_resolver.hpp"
#include "model/errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <thread>
#include <utility>

namespace app {

ControllerApp::ControllerApp(ControllerAppConfig app_cfg, config::ControllerConfig cfg)
    : app_cfg_(std::move(app_cfg)),
      cfg_(std::move(cfg)),
      battery_(cfg_.battery),
      store_(cfg_.state_path),
      publisher_(),
      planner_(cfg_, publisher_, store_),
      balancer_(control::BalancerSettings::from_battery(cfg_.battery, cfg_.control.deadband_w,
                                                         cfg_.control.action_threshold_w)) {
    if (!cfg_.log_file.empty()) {
        utils::open_log_file(cfg_.log_file);
    }

    utils::InfluxConfig icfg = cfg_.influx;
    icfg.enabled = icfg.enabled || app_cfg_.enable_influx;
    influx_ = std::make_unique<utils::InfluxClient>(icfg);
}

ControllerApp::~ControllerApp() {
    utils::close_log_file();
}

// ============================================================================
// Setup
// ============================================================================

bool ControllerApp::open_csv() {
    csv_.open(app_cfg_.csv_log_path);
    if (!csv_) {
        LOG_ERROR("Failed to open CSV: %s", app_cfg_.csv_log_path.c_str());
        return false;
    }

    csv_ << "t_s,plan_seq,plan_status,effective_mode,balancer_mode,"
         << "load_w,pv_w,grid_w,battery_w,soc_wh,soc_pct,"
         << "scheduled_w,raw_target_w,target_w,action,inert\n";
    csv_ << std::fixed << std::setprecision(3);
    return true;
}

bool ControllerApp::init_scenario(LuaScenario& lua) {
    if (app_cfg_.lua_script_path.empty()) {
        return false;
    }
    if (!lua.init(app_cfg_.lua_script_path)) {
        LOG_WARN("Failed to init Lua scenario: %s", app_cfg_.lua_script_path.c_str());
        return false;
    }
    LOG_INFO("Lua scenario loaded: %s", app_cfg_.lua_script_path.c_str());
    return true;
}

// ============================================================================
// Inputs
// ============================================================================

bool ControllerApp::build_forecast(LuaScenario* lua, double now_s, model::HorizonForecast& out) {
    const double step_s = cfg_.time_step_minutes * 60.0;
    const auto horizon = cfg_.horizon_steps();

    if (csv_forecast_) {
        const auto first = static_cast<std::size_t>(std::floor(now_s / step_s));
        out = csv_forecast_->slice(first, horizon);
        return true;
    }

    if (lua && lua->ready()) {
        if (!lua->get_forecast(now_s, static_cast<int>(horizon), step_s, out)) {
            return false;
        }
        const std::size_t filled = out.apply_feed_in_fallback(cfg_.fixed_feed_in_price);
        if (filled > 0) {
            LOG_WARN("[Forecast] %zu feed-in price(s) missing, using fixed %.4f",
                     filled, cfg_.fixed_feed_in_price);
        }
        return true;
    }

    return false;
}

SiteSample ControllerApp::site_at(LuaScenario* lua, double now_s, double setpoint_w) {
    SiteSample site;

    if (lua && lua->ready()) {
        if (lua->get_site(now_s, setpoint_w, site)) {
            return site;
        }
        LOG_WARN("[t=%.0f] Lua scenario_site failed, using forecast values", now_s);
    }

    if (csv_forecast_ && csv_forecast_->steps() > 0) {
        const double step_s = cfg_.time_step_minutes * 60.0;
        const auto t = std::min(static_cast<std::size_t>(std::floor(now_s / step_s)),
                                csv_forecast_->steps() - 1);
        site.load_w = csv_forecast_->consumption_w[t];
        site.pv_w = csv_forecast_->ac_pv_w(t) +
                    csv_forecast_->dc_pv_w(t) * cfg_.battery.dc_inverter_efficiency;
    }
    return site;
}

// ============================================================================
// Loops
// ============================================================================

void ControllerApp::planning_cycle(LuaScenario* lua, double now_s) {
    PlanningRequest req;
    req.now_s = now_s;

    if (!build_forecast(lua, now_s, req.forecast)) {
        LOG_WARN("[t=%.0f] No forecast available, planning skipped", now_s);
        cycles_failed_++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(live_mu_);
        req.current_soc_wh = live_.soc_wh;
        req.grid_w = live_.grid_w;
    }

    const CycleReport report = planner_.try_run(req);
    switch (report.outcome) {
    case CycleOutcome::Published:
        cycles_ok_++;
        if (influx_->is_enabled() && report.plan) {
            std::lock_guard<std::mutex> lock(influx_mu_);
            influx_->write_plan(report.plan->schedule, report.plan->shadow, report.plan->diagnostics,
                                report.plan->effective, utils::InfluxClient::wall_clock_time_ns());
        }
        break;
    case CycleOutcome::Dropped:
    case CycleOutcome::Superseded:
        break;
    case CycleOutcome::Failed:
        cycles_failed_++;
        break;
    }
}

void ControllerApp::apply_to_battery(double setpoint_w, double dt_s) {
    const double dt_h = dt_s / 3600.0;
    double p = setpoint_w;
    if (p > 0.0) {
        p = std::min(p, battery_.max_charge_power(sim_soc_wh_, dt_h));
    } else if (p < 0.0) {
        p = -std::min(-p, battery_.max_discharge_power(sim_soc_wh_, dt_h));
    }

    const double delta = battery_.soc_delta_wh(p, dt_h);
    sim_soc_wh_ = std::clamp(sim_soc_wh_ + delta, cfg_.battery.soc_min_wh, cfg_.battery.soc_max_wh);
    sim_power_w_ = p;

    if (p > 0.0) {
        charged_wh_ += p * dt_h;
    } else {
        discharged_wh_ += -p * dt_h;
    }
}

void ControllerApp::tactical_tick(LuaScenario* lua, double now_s) {
    const SiteSample site = site_at(lua, now_s, balancer_.previous_target());

    control::LiveMeasurement m;
    const double grid_actual_w = site.load_w - site.pv_w + sim_power_w_;
    if (site.grid_meter_ok) {
        m.grid_w = grid_actual_w;
    }
    m.battery_w = sim_power_w_;
    if (site.soc_sensor_ok) {
        m.soc_wh = sim_soc_wh_;
        store_.record_soc(sim_soc_wh_);
    }

    {
        std::lock_guard<std::mutex> lock(live_mu_);
        live_ = m;
    }

    // Plan snapshot; a plan that has run out counts as no plan
    auto plan = publisher_.snapshot();
    if (plan && plan->step_index_at(now_s) < 0) {
        plan.reset();
    }

    const control::EffectiveMode effective =
        plan ? plan->effective : control::ModeResolver::without_plan(cfg_.control.mode);
    const control::BalancerMode bmode =
        control::ModeResolver::balancer_mode(effective, m.grid_w.value_or(0.0), m.grid_w.has_value());
    const double scheduled_w = plan ? plan->scheduled_power_at(now_s) : 0.0;

    const control::ControlAction action = balancer_.step(m, bmode, scheduled_w);
    if (action.inert) {
        inert_ticks_++;
    }

    const double dt_s = cfg_.control.tick_s;
    const double dt_h = dt_s / 3600.0;
    if (grid_actual_w > 0.0) {
        import_wh_ += grid_actual_w * dt_h;
    } else {
        export_wh_ += -grid_actual_w * dt_h;
    }

    csv_ << now_s << ","
         << (plan ? plan->sequence : 0) << ","
         << to_string(publisher_.status()) << ","
         << control::to_string(effective) << ","
         << control::to_string(bmode) << ","
         << site.load_w << "," << site.pv_w << ","
         << grid_actual_w << "," << sim_power_w_ << ","
         << sim_soc_wh_ << "," << battery_.soc_percent(sim_soc_wh_) << ","
         << scheduled_w << "," << action.raw_target_w << "," << action.target_w << ","
         << control::to_string(action.label) << ","
         << (action.inert ? 1 : 0) << "\n";

    if (influx_->is_enabled()) {
        std::lock_guard<std::mutex> lock(influx_mu_);
        influx_->write_control(action, m, battery_.soc_percent(sim_soc_wh_), now_s);
    }

    apply_to_battery(action.target_w, dt_s);
    ticks_++;
}

int ControllerApp::run() {
    store_.load();

    // Starting SoC for the simulated battery
    if (app_cfg_.initial_soc_percent) {
        sim_soc_wh_ = battery_.soc_wh_from_percent(*app_cfg_.initial_soc_percent);
    } else if (auto last = store_.last_soc()) {
        sim_soc_wh_ = *last;
    } else {
        sim_soc_wh_ = 0.5 * (cfg_.battery.soc_min_wh + cfg_.battery.soc_max_wh);
    }
    sim_soc_wh_ = std::clamp(sim_soc_wh_, cfg_.battery.soc_min_wh, cfg_.battery.soc_max_wh);

    if (!app_cfg_.forecast_csv_path.empty()) {
        try {
            csv_forecast_ = ForecastCsv::load(app_cfg_.forecast_csv_path, cfg_.step_hours(),
                                              cfg_.fixed_feed_in_price);
        } catch (const model::MissingInputError& e) {
            LOG_ERROR("Forecast unusable: %s", e.what());
            return 1;
        }
    } else if (app_cfg_.lua_script_path.empty()) {
        LOG_ERROR("Need a forecast CSV or a Lua scenario");
        return 1;
    }

    if (!open_csv()) {
        return 1;
    }

    LOG_INFO("Starting controller (duration=%.0fs, tick=%.1fs, planning every %.0f min, %s)",
             app_cfg_.duration_s, cfg_.control.tick_s, cfg_.control.planning_interval_minutes,
             app_cfg_.real_time_mode ? "real-time" : "fast");

    const int rc = app_cfg_.real_time_mode ? run_real_time() : run_fast();

    if (!store_.flush()) {
        LOG_WARN("Final state not persisted to %s", store_.path().c_str());
    }
    print_summary();
    csv_.close();
    return rc;
}

int ControllerApp::run_fast() {
    LuaScenario lua;
    LuaScenario* scenario = init_scenario(lua) ? &lua : nullptr;
    if (!scenario && !csv_forecast_) {
        return 1;
    }

    const double tick_s = cfg_.control.tick_s;
    const double plan_every_s = cfg_.control.planning_interval_minutes * 60.0;
    const auto max_ticks = static_cast<std::size_t>(app_cfg_.duration_s / tick_s);

    // The first cycle needs a SoC reading
    {
        std::lock_guard<std::mutex> lock(live_mu_);
        live_.soc_wh = sim_soc_wh_;
    }

    double next_plan_s = 0.0;
    for (std::size_t i = 0; i < max_ticks && !stop_.load(); ++i) {
        const double t = static_cast<double>(i) * tick_s;
        if (t >= next_plan_s) {
            planning_cycle(scenario, t);
            next_plan_s += plan_every_s;
        }
        tactical_tick(scenario, t);
    }
    return 0;
}

int ControllerApp::run_real_time() {
    // lua_State is single-threaded: one scenario per loop
    LuaScenario tactical_lua;
    LuaScenario* tactical = init_scenario(tactical_lua) ? &tactical_lua : nullptr;
    if (!tactical && !csv_forecast_) {
        return 1;
    }

    {
        std::lock_guard<std::mutex> lock(live_mu_);
        live_.soc_wh = sim_soc_wh_;
    }

    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed_s = [t0]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    };

    std::thread planner_thread([this, elapsed_s]() {
        LuaScenario planner_lua;
        LuaScenario* scenario = init_scenario(planner_lua) ? &planner_lua : nullptr;
        const auto interval = std::chrono::duration<double>(cfg_.control.planning_interval_minutes * 60.0);

        while (!stop_.load()) {
            planning_cycle(scenario, elapsed_s());

            const auto wake = std::chrono::steady_clock::now() +
                              std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);
            std::unique_lock<std::mutex> lock(stop_mu_);
            while (!stop_.load() && std::chrono::steady_clock::now() < wake) {
                // Short waits so a flag set from a signal handler is seen
                stop_cv_.wait_for(lock, std::chrono::milliseconds(200));
            }
        }
        LOG_INFO("[Planner] Thread stopped");
    });

    TimingController timer(cfg_.control.tick_s);
    timer.reset();

    while (!stop_.load() && timer.get_tick_time() < app_cfg_.duration_s) {
        timer.mark_loop_start();
        tactical_tick(tactical, timer.get_tick_time());
        timer.update_loop_stats();

        if (!timer.wait_for_next_step(stop_)) {
            const auto& stats = timer.get_stats();
            LOG_WARN("[t=%.1f] Tick deadline missed (total %zu, max lateness %.1f ms)",
                     timer.get_tick_time(), stats.deadline_misses, stats.max_lateness_ms);
        }
    }

    stop_.store(true);
    stop_cv_.notify_all();
    planner_thread.join();

    const auto& stats = timer.get_stats();
    LOG_INFO("Tactical loop: %zu ticks, %zu deadline misses, max loop %.2f ms",
             stats.total_steps, stats.deadline_misses, stats.max_loop_time_ms);
    return 0;
}

void ControllerApp::print_summary() {
    LOG_INFO("========================================");
    LOG_INFO("Controller Summary");
    LOG_INFO("========================================");
    LOG_INFO("Ticks: %zu (%zu inert)", ticks_, inert_ticks_);
    LOG_INFO("Planning cycles: %zu published, %zu failed, status %s",
             cycles_ok_.load(), cycles_failed_.load(), to_string(publisher_.status()));
    LOG_INFO("Grid: %.2f kWh imported, %.2f kWh exported", import_wh_ / 1000.0, export_wh_ / 1000.0);
    LOG_INFO("Battery: %.2f kWh charged, %.2f kWh discharged, final SoC %.1f %%",
             charged_wh_ / 1000.0, discharged_wh_ / 1000.0, battery_.soc_percent(sim_soc_wh_));
    LOG_INFO("========================================");
    LOG_INFO("Tick log written to: %s", app_cfg_.csv_log_path.c_str());
}

} // namespace app

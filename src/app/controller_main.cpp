// src/app/controller_main.cpp
#include "app/controller_app.hpp"
#include "app/stop_signals.hpp"
#include "config/controller_config.hpp"
#include "model/errors.hpp"
#include "utils/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nInputs:\n");
    printf("  --forecast PATH     Forecast CSV (buy_price, consumption_w, optional feed_in_price,\n");
    printf("                      pv_ac_w, pv_dc_w), one row per time step\n");
    printf("  --scenario PATH     Lua scenario (scenario_forecast / scenario_site)\n");
    printf("\nOptions:\n");
    printf("  --config PATH       Controller YAML (default: config/battery.yaml)\n");
    printf("  --soc PCT           Initial SoC in percent (default: persisted, else mid-window)\n");
    printf("  --duration SEC      Run duration in seconds (default: 86400)\n");
    printf("  --real-time         Pace the tactical loop on the wall clock\n");
    printf("  --fast              Step a simulated clock as fast as possible (default)\n");
    printf("  --influx            Enable InfluxDB output regardless of config\n");
    printf("  --csv PATH          Tick log (default: bess_ticks.csv)\n");
    printf("  --log-level LEVEL   trace|debug|info|warn|error|off (default: from config)\n");
    printf("  --help, -h          Show this help\n");
    printf("\nExamples:\n");
    printf("  # Plan one day from a forecast file:\n");
    printf("  %s --forecast config/forecasts/sample_day.csv\n\n", prog_name);
    printf("  # Scenario-driven, real time, with InfluxDB:\n");
    printf("  %s --scenario config/lua/scenario.lua --real-time --influx --duration 3600\n\n", prog_name);
}

int main(int argc, char** argv) {
    // ========================================================================
    // Default configuration
    // ========================================================================
    app::ControllerAppConfig app_cfg{};
    std::string config_path = "config/battery.yaml";
    std::string log_level_arg;

    // ========================================================================
    // Command-line parsing
    // ========================================================================
    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"forecast",  required_argument, 0, 'f'},
        {"scenario",  required_argument, 0, 's'},
        {"soc",       required_argument, 0, 'S'},
        {"duration",  required_argument, 0, 'D'},
        {"real-time", no_argument,       0, 'R'},
        {"fast",      no_argument,       0, 'F'},
        {"influx",    no_argument,       0, 'I'},
        {"csv",       required_argument, 0, 'o'},
        {"log-level", required_argument, 0, 'l'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'f':
                app_cfg.forecast_csv_path = optarg;
                break;
            case 's':
                app_cfg.lua_script_path = optarg;
                break;
            case 'S': {
                double pct = std::atof(optarg);
                if (pct < 0.0 || pct > 100.0) {
                    fprintf(stderr, "Error: Invalid SoC: %s (must be 0..100)\n", optarg);
                    return 1;
                }
                app_cfg.initial_soc_percent = pct;
                break;
            }
            case 'D':
                app_cfg.duration_s = std::atof(optarg);
                if (app_cfg.duration_s <= 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 'R':
                app_cfg.real_time_mode = true;
                break;
            case 'F':
                app_cfg.real_time_mode = false;
                break;
            case 'I':
                app_cfg.enable_influx = true;
                break;
            case 'o':
                app_cfg.csv_log_path = optarg;
                break;
            case 'l':
                log_level_arg = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (app_cfg.forecast_csv_path.empty() && app_cfg.lua_script_path.empty()) {
        fprintf(stderr, "Error: need --forecast or --scenario\n");
        print_usage(argv[0]);
        return 1;
    }

    // ========================================================================
    // Load controller configuration
    // ========================================================================
    config::ControllerConfig cfg;
    try {
        cfg = config::ControllerConfig::load(config_path);
    } catch (const model::ConfigurationError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 2;
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 2;
    }

    utils::set_level(cfg.log_level);
    if (!log_level_arg.empty()) {
        utils::LogLevel lvl;
        if (!utils::parse_level(log_level_arg, lvl)) {
            fprintf(stderr, "Error: Invalid log level: %s\n", log_level_arg.c_str());
            return 1;
        }
        utils::set_level(lvl);
    }

    // ========================================================================
    // Print run summary
    // ========================================================================
    char duration_str[50], tick_str[50];
    snprintf(duration_str, sizeof(duration_str), "%.0f seconds", app_cfg.duration_s);
    snprintf(tick_str, sizeof(tick_str), "%.1f s, plan every %.0f min",
             cfg.control.tick_s, cfg.control.planning_interval_minutes);

    printf("\n");
    printf("╔════════════════════════════════════════════════════════════╗\n");
    printf("║          BATTERY SCHEDULE CONTROLLER CONFIGURATION         ║\n");
    printf("╠════════════════════════════════════════════════════════════╣\n");
    printf("║ Config:     %-48s║\n", config_path.c_str());
    printf("║ Forecast:   %-48s║\n", app_cfg.forecast_csv_path.empty() ? "(Lua scenario)" : app_cfg.forecast_csv_path.c_str());
    printf("║ Scenario:   %-48s║\n", app_cfg.lua_script_path.empty() ? "(forecast replay)" : app_cfg.lua_script_path.c_str());
    printf("║ Mode:       %-48s║\n", control::to_string(cfg.control.mode));
    printf("║ Tick:       %-48s║\n", tick_str);
    printf("║ Duration:   %-48s║\n", duration_str);
    printf("║ Real-time:  %-48s║\n", app_cfg.real_time_mode ? "yes (1:1 wall clock)" : "no (fast-forward)");
    printf("║ InfluxDB:   %-48s║\n", (app_cfg.enable_influx || cfg.influx.enabled) ? "enabled" : "disabled");
    printf("╚════════════════════════════════════════════════════════════╝\n");
    printf("\n");

    // ========================================================================
    // Run controller
    // ========================================================================
    try {
        app::ControllerApp controller(app_cfg, cfg);
        app::StopSignals<app::ControllerApp> signals(controller);
        return controller.run();
    } catch (const model::ConfigurationError& e) {
        LOG_ERROR("Configuration error: %s", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Controller stopped: %s", e.what());
        return 1;
    }
}

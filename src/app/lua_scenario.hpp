// src/app/lua_scenario.hpp
#pragma once

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "model/forecast.hpp"

namespace app {

/**
 * Site conditions reported by a scenario for one tactical tick.
 */
struct SiteSample {
    double load_w = 0.0;
    double pv_w = 0.0;
    bool grid_meter_ok = true;   // false simulates a grid telemetry outage
    bool soc_sensor_ok = true;   // false simulates a missing SoC reading
};

/**
 * LuaScenario - simulation inputs scripted in Lua.
 *
 * The script may define:
 *   scenario_init()                          -> bool (optional)
 *   scenario_forecast(t_s, steps, step_s)    -> { buy = {...}, feed_in = {...},
 *                                                 consumption = {...},
 *                                                 pv_ac = {...}, pv_dc = {...} }
 *   scenario_site(t_s, setpoint_w)           -> { load_w = ..., pv_w = ...,
 *                                                 grid_ok = bool, soc_ok = bool }
 *
 * A lua_State is not thread safe; use one instance per thread.
 */
class LuaScenario {
public:
    LuaScenario() = default;
    ~LuaScenario();

    LuaScenario(const LuaScenario&) = delete;
    LuaScenario& operator=(const LuaScenario&) = delete;

    bool init(const std::string& lua_script_path);

    bool ready() const { return L_ != nullptr; }

    /**
     * Missing feed_in entries stay NaN; the caller applies its fallback.
     */
    bool get_forecast(double t_s, int steps, double step_s, model::HorizonForecast& out);

    bool get_site(double t_s, double setpoint_w, SiteSample& out);

private:
    lua_State* L_{nullptr};

    bool read_series_(int idx, const char* key, int steps, std::vector<double>& out, double missing);
    bool read_site_table_(int idx, SiteSample& out);
};

} // namespace app

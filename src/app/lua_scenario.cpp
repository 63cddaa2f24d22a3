// src/app/lua_scenario.cpp
#include "app/lua_scenario.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace app {

LuaScenario::~LuaScenario() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaScenario::init(const std::string& lua_script_path) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    // Call optional scenario_init() if present
    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_close(L_);
            L_ = nullptr;
            return false;
        }
        const bool ok = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        if (!ok) {
            LOG_WARN("[Lua] scenario_init returned false");
        }
    } else {
        lua_pop(L_, 1);
    }

    return true;
}

bool LuaScenario::read_series_(int idx, const char* key, int steps,
                               std::vector<double>& out, double missing) {
    out.assign(static_cast<std::size_t>(steps), missing);

    lua_getfield(L_, idx, key);
    if (lua_isnil(L_, -1)) {
        lua_pop(L_, 1);
        return false;
    }
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        LOG_WARN("[Lua] forecast field '%s' is not a table", key);
        return false;
    }

    for (int i = 0; i < steps; ++i) {
        lua_rawgeti(L_, -1, i + 1);
        if (lua_isnumber(L_, -1)) {
            out[static_cast<std::size_t>(i)] = lua_tonumber(L_, -1);
        }
        lua_pop(L_, 1);
    }
    lua_pop(L_, 1);
    return true;
}

bool LuaScenario::get_forecast(double t_s, int steps, double step_s, model::HorizonForecast& out) {
    if (!L_) return false;

    lua_getglobal(L_, "scenario_forecast");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_forecast() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);
    lua_pushinteger(L_, steps);
    lua_pushnumber(L_, step_s);

    if (lua_pcall(L_, 3, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_forecast failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }
    if (!lua_istable(L_, -1)) {
        LOG_ERROR("[Lua] scenario_forecast must return a table");
        lua_pop(L_, 1);
        return false;
    }

    const int idx = lua_gettop(L_);
    const double nan = std::numeric_limits<double>::quiet_NaN();

    model::HorizonForecast fc;
    fc.step_hours = step_s / 3600.0;

    read_series_(idx, "buy", steps, fc.buy_price, nan);
    read_series_(idx, "consumption", steps, fc.consumption_w, nan);
    if (!read_series_(idx, "feed_in", steps, fc.feed_in_price, nan)) {
        fc.feed_in_price.clear();
    }

    model::PvArray ac;
    ac.name = "pv_ac";
    ac.coupling = model::PvCoupling::AC;
    if (read_series_(idx, "pv_ac", steps, ac.power_w, 0.0)) {
        fc.pv.push_back(ac);
    }

    model::PvArray dc;
    dc.name = "pv_dc";
    dc.coupling = model::PvCoupling::DC;
    if (read_series_(idx, "pv_dc", steps, dc.power_w, 0.0)) {
        fc.pv.push_back(dc);
    }

    lua_pop(L_, 1);
    out = std::move(fc);
    return true;
}

bool LuaScenario::read_site_table_(int idx, SiteSample& out) {
    if (!lua_istable(L_, idx)) return false;

    auto get_bool = [&](const char* k, bool def) -> bool {
        lua_getfield(L_, idx, k);
        bool v = def;
        if (lua_isboolean(L_, -1)) v = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    auto get_num = [&](const char* k, double def) -> double {
        lua_getfield(L_, idx, k);
        double v = def;
        if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    out.load_w = get_num("load_w", 0.0);
    out.pv_w = get_num("pv_w", 0.0);
    out.grid_meter_ok = get_bool("grid_ok", true);
    out.soc_sensor_ok = get_bool("soc_ok", true);
    return true;
}

bool LuaScenario::get_site(double t_s, double setpoint_w, SiteSample& out) {
    if (!L_) return false;

    lua_getglobal(L_, "scenario_site");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_site() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);
    lua_pushnumber(L_, setpoint_w);

    if (lua_pcall(L_, 2, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_site failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    const bool ok = read_site_table_(lua_gettop(L_), out);
    lua_pop(L_, 1);
    return ok;
}

} // namespace app

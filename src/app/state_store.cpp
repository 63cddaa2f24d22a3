// src/app/state_store.cpp
#include "app/state_store.hpp"
#include "utils/logging.hpp"

#include <yaml-cpp/yaml.h>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <utility>

namespace app {

StateStore::StateStore(std::string path)
    : path_(std::move(path)) {}

bool StateStore::load() {
    std::ifstream file_check(path_);
    if (!file_check.good()) {
        LOG_INFO("[StateStore] No state file at %s, starting fresh", path_.c_str());
        return false;
    }
    file_check.close();

    PersistedState st;
    try {
        YAML::Node root = YAML::LoadFile(path_);

        if (root["last_soc_wh"] && !root["last_soc_wh"].IsNull()) {
            const double soc = root["last_soc_wh"].as<double>();
            if (std::isfinite(soc)) {
                st.last_soc_wh = soc;
            }
        }

        if (root["plan"]) {
            auto plan = root["plan"];
            st.plan_step_hours = plan["step_hours"].as<double>(0.25);
            st.plan_start_soc_wh = plan["start_soc_wh"].as<double>(0.0);
            if (plan["power_w"]) {
                st.plan_power_w = plan["power_w"].as<std::vector<double>>();
            }
            if (plan["soc_wh"]) {
                st.plan_soc_wh = plan["soc_wh"].as<std::vector<double>>();
            }
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("[StateStore] Ignoring unreadable state file %s: %s", path_.c_str(), e.what());
        return false;
    }

    if (st.last_soc_wh) {
        LOG_INFO("[StateStore] Restored last SoC %.0f Wh, plan of %zu steps",
                 *st.last_soc_wh, st.plan_power_w.size());
    }

    std::lock_guard<std::mutex> lock(mu_);
    state_ = std::move(st);
    return true;
}

bool StateStore::flush() const {
    YAML::Emitter out;
    {
        std::lock_guard<std::mutex> lock(mu_);

        out << YAML::BeginMap;
        out << YAML::Key << "last_soc_wh";
        if (state_.last_soc_wh) {
            out << YAML::Value << *state_.last_soc_wh;
        } else {
            out << YAML::Value << YAML::Null;
        }

        out << YAML::Key << "plan" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "step_hours" << YAML::Value << state_.plan_step_hours;
        out << YAML::Key << "start_soc_wh" << YAML::Value << state_.plan_start_soc_wh;
        out << YAML::Key << "power_w" << YAML::Value << YAML::Flow << state_.plan_power_w;
        out << YAML::Key << "soc_wh" << YAML::Value << YAML::Flow << state_.plan_soc_wh;
        out << YAML::EndMap;
        out << YAML::EndMap;
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc);
        if (!f.is_open()) {
            LOG_ERROR("[StateStore] Cannot write %s", tmp.c_str());
            return false;
        }
        f << out.c_str() << "\n";
        if (!f.good()) {
            LOG_ERROR("[StateStore] Write to %s failed", tmp.c_str());
            return false;
        }
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        LOG_ERROR("[StateStore] Cannot replace %s", path_.c_str());
        return false;
    }
    return true;
}

void StateStore::record_soc(double soc_wh) {
    if (!std::isfinite(soc_wh)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    state_.last_soc_wh = soc_wh;
}

void StateStore::record_plan(const optim::Schedule& schedule) {
    std::lock_guard<std::mutex> lock(mu_);
    state_.plan_step_hours = schedule.step_hours;
    state_.plan_start_soc_wh = schedule.start_soc_wh;
    state_.plan_power_w.clear();
    state_.plan_soc_wh.clear();
    for (const auto& s : schedule.steps) {
        state_.plan_power_w.push_back(s.power_w);
        state_.plan_soc_wh.push_back(s.soc_wh);
    }
}

std::optional<double> StateStore::last_soc() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.last_soc_wh;
}

PersistedState StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

} // namespace app

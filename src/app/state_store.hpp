// src/app/state_store.hpp
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "optim/schedule.hpp"

namespace app {

/**
 * What survives a restart: the last observed SoC (fallback seed for the
 * next planning cycle) and the last published schedule.
 */
struct PersistedState {
    std::optional<double> last_soc_wh;
    double plan_step_hours = 0.25;
    double plan_start_soc_wh = 0.0;
    std::vector<double> plan_power_w;
    std::vector<double> plan_soc_wh;
};

/**
 * StateStore - YAML-backed persistence of PersistedState.
 *
 * Thread safe; the planning and tactical loops both record into it.
 * Writes go to "<path>.tmp" and are renamed over the target.
 */
class StateStore {
public:
    explicit StateStore(std::string path);

    /**
     * Read the file into memory. A missing file yields an empty state; an
     * unreadable one is logged and ignored.
     * @return true if a state file was loaded
     */
    bool load();

    /**
     * @return false if the file could not be written
     */
    bool flush() const;

    void record_soc(double soc_wh);
    void record_plan(const optim::Schedule& schedule);

    std::optional<double> last_soc() const;
    PersistedState snapshot() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mu_;
    PersistedState state_;
};

} // namespace app

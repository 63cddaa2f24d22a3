// src/model/action_set.hpp
#pragma once

#include <vector>

namespace model {

/**
 * ActionSet - discrete AC-side power levels for one planning cycle.
 *
 * Levels span [-max_discharge, +max_charge] in fixed steps and always
 * contain 0 (idle) and both limits. levels() is ordered for evaluation:
 * idle first, then increasing magnitude, discharge before charge at equal
 * magnitude. A minimizer that only accepts strictly better candidates in
 * this order resolves ties toward idle.
 */
class ActionSet {
public:
    /**
     * @throws model::ConfigurationError if step <= 0 or a limit <= 0
     */
    ActionSet(double max_discharge_w, double max_charge_w, double step_w);

    const std::vector<double>& levels() const { return levels_; }
    std::size_t size() const { return levels_.size(); }
    double operator[](std::size_t i) const { return levels_[i]; }

    static constexpr int kIdleIndex = 0;

private:
    std::vector<double> levels_;
};

} // namespace model

// src/model/action_set.cpp
#include "model/action_set.hpp"
#include "model/errors.hpp"

#include <algorithm>
#include <cmath>

namespace model {

namespace {

// Multiples of step up to limit, plus the limit itself when it is not one.
std::vector<double> ladder(double limit_w, double step_w) {
    std::vector<double> out;
    const int n = static_cast<int>(std::floor(limit_w / step_w + 1e-9));
    for (int k = 1; k <= n; ++k) {
        out.push_back(k * step_w);
    }
    if (out.empty() || limit_w - out.back() > 1e-6) {
        out.push_back(limit_w);
    }
    return out;
}

} // namespace

ActionSet::ActionSet(double max_discharge_w, double max_charge_w, double step_w) {
    if (!(step_w > 0.0)) {
        throw ConfigurationError("Action power step must be > 0 W");
    }
    if (!(max_discharge_w > 0.0) || !(max_charge_w > 0.0)) {
        throw ConfigurationError("Action set power limits must be > 0 W");
    }

    const std::vector<double> dis = ladder(max_discharge_w, step_w);
    const std::vector<double> chg = ladder(max_charge_w, step_w);

    levels_.reserve(1 + dis.size() + chg.size());
    levels_.push_back(0.0);
    for (double p : dis) {
        levels_.push_back(-p);
    }
    for (double p : chg) {
        levels_.push_back(p);
    }

    // Idle stays first; the rest by magnitude, discharge first on equal magnitude
    std::stable_sort(levels_.begin() + 1, levels_.end(), [](double a, double b) {
        const double ma = std::abs(a);
        const double mb = std::abs(b);
        if (ma != mb) {
            return ma < mb;
        }
        return a < b;
    });
}

} // namespace model

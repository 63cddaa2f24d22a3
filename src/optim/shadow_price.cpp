// src/optim/shadow_price.cpp
#include "optim/shadow_price.hpp"
#include "model/errors.hpp"

#include <cmath>
#include <string>

namespace optim {

ShadowPrice ShadowPriceCalculator::compute(const ValueTable& values,
                                           const model::SocLattice& lattice,
                                           int start_index,
                                           double round_trip_efficiency) {
    if (values.empty() || values.states() != lattice.size()) {
        throw model::InvariantViolation("Shadow price needs a value table matching the lattice");
    }
    if (!lattice.contains(start_index)) {
        throw model::InvariantViolation("Shadow price start index " + std::to_string(start_index) +
                                        " outside lattice");
    }

    ShadowPrice sp;
    const int n = lattice.size();
    if (n < 2) {
        return sp;
    }

    const double res_kwh = lattice.resolution_wh() / 1000.0;
    const int s = start_index;

    if (s > 0 && s < n - 1) {
        sp.price = (values.value(0, s - 1) - values.value(0, s + 1)) / (2.0 * res_kwh);
    } else if (s == 0) {
        sp.price = (values.value(0, 0) - values.value(0, 1)) / res_kwh;
    } else {
        sp.price = (values.value(0, n - 2) - values.value(0, n - 1)) / res_kwh;
    }

    const double eta = std::sqrt(round_trip_efficiency);
    sp.discharge_threshold = sp.price * eta;
    sp.charge_threshold = sp.price / eta;
    return sp;
}

} // namespace optim

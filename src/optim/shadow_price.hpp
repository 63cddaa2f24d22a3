// src/optim/shadow_price.hpp
#pragma once

#include "model/soc_lattice.hpp"
#include "optim/schedule_optimizer.hpp"

namespace optim {

struct ShadowPrice {
    double price = 0.0;                 // currency/kWh of stored energy
    double discharge_threshold = 0.0;   // sell above this
    double charge_threshold = 0.0;      // buy below this
};

/**
 * Marginal value of stored energy at the starting state, from V[0][.].
 *
 *   central:  (V[0][s-1] - V[0][s+1]) / (2 * resolution)
 *   edges:    one-sided difference towards the interior
 *
 * Thresholds: discharge = price * sqrt(rte), charge = price / sqrt(rte).
 */
class ShadowPriceCalculator {
public:
    static ShadowPrice compute(const ValueTable& values,
                               const model::SocLattice& lattice,
                               int start_index,
                               double round_trip_efficiency);
};

} // namespace optim

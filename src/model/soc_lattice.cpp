// src/model/soc_lattice.cpp
#include "model/soc_lattice.hpp"
#include "model/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace model {

SocLattice::SocLattice(double soc_min_wh, double soc_max_wh, double resolution_wh)
    : min_wh_(soc_min_wh),
      resolution_wh_(resolution_wh),
      size_(0) {
    if (!(resolution_wh > 0.0)) {
        throw ConfigurationError("SoC resolution must be > 0 Wh");
    }
    if (soc_max_wh < soc_min_wh) {
        throw ConfigurationError("SoC lattice: soc_max (" + std::to_string(soc_max_wh) +
                                 " Wh) below soc_min (" + std::to_string(soc_min_wh) + " Wh)");
    }

    // 1e-9 keeps an exact multiple (e.g. 8000 / 100) from losing its top level
    size_ = static_cast<int>(std::floor((soc_max_wh - soc_min_wh) / resolution_wh + 1e-9)) + 1;
}

int SocLattice::nearest_unclamped(double energy_wh) const {
    return static_cast<int>(std::lround((energy_wh - min_wh_) / resolution_wh_));
}

int SocLattice::snap(double energy_wh) const {
    return std::clamp(nearest_unclamped(energy_wh), 0, size_ - 1);
}

} // namespace model

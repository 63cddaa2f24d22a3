// src/model/soc_lattice.hpp
#pragma once

namespace model {

/**
 * SocLattice - discretized state-of-charge levels.
 *
 * Index i maps to soc_min + i * resolution. The top level is the last
 * multiple of the resolution that does not exceed soc_max.
 */
class SocLattice {
public:
    /**
     * @throws model::ConfigurationError if resolution <= 0 or max < min
     */
    SocLattice(double soc_min_wh, double soc_max_wh, double resolution_wh);

    int size() const { return size_; }
    double resolution_wh() const { return resolution_wh_; }
    double min_wh() const { return min_wh_; }
    double max_wh() const { return energy_at(size_ - 1); }

    double energy_at(int index) const { return min_wh_ + index * resolution_wh_; }

    bool contains(int index) const { return index >= 0 && index < size_; }

    /**
     * Nearest lattice index for an energy, not clamped (may fall outside
     * [0, size-1]).
     */
    int nearest_unclamped(double energy_wh) const;

    /**
     * Nearest lattice index for an energy, clamped into the lattice.
     */
    int snap(double energy_wh) const;

private:
    double min_wh_;
    double resolution_wh_;
    int size_;
};

} // namespace model

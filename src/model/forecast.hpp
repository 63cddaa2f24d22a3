// src/model/forecast.hpp
#pragma once

#include <string>
#include <vector>

namespace model {

enum class PvCoupling {
    AC,   // inverter output on the house bus
    DC    // panels on the battery inverter's DC side
};

const char* to_string(PvCoupling c);

struct PvArray {
    std::string name;
    PvCoupling coupling = PvCoupling::AC;
    double efficiency = 1.0;           // applied to AC arrays; DC arrays use the battery's pv_dc_efficiency
    std::vector<double> power_w;       // one value per step
};

/**
 * HorizonForecast - typed, per-step planning inputs.
 *
 * Prices are currency/kWh, powers W (averages over the step). A missing
 * feed-in value is represented as NaN (or an empty series) and is never
 * interpreted by the optimizer; callers fill it explicitly with
 * apply_feed_in_fallback().
 */
struct HorizonForecast {
    double step_hours = 0.25;
    std::vector<double> buy_price;
    std::vector<double> feed_in_price;
    std::vector<double> consumption_w;
    std::vector<PvArray> pv;

    std::size_t steps() const { return buy_price.size(); }

    double ac_pv_w(std::size_t t) const;
    double dc_pv_w(std::size_t t) const;
    double total_pv_w(std::size_t t) const { return ac_pv_w(t) + dc_pv_w(t); }

    /**
     * Fill missing feed-in cells (or a missing series) with a caller-chosen
     * constant. Returns the number of cells filled.
     */
    std::size_t apply_feed_in_fallback(double fallback_price);

    /**
     * Check completeness for a planning cycle of min_steps steps.
     * @throws model::MissingInputError on empty/short series, length
     *         mismatches, missing feed-in prices or non-finite values
     */
    void validate(std::size_t min_steps = 1) const;

    /**
     * Copy of steps [first, first + count).
     */
    HorizonForecast slice(std::size_t first, std::size_t count) const;
};

} // namespace model

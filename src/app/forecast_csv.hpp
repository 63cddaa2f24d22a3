// src/app/forecast_csv.hpp
#pragma once

#include <string>

#include "model/forecast.hpp"

namespace app {

/**
 * ForecastCsv - planning inputs from a CSV file, one row per step.
 *
 * Columns (header names, any order):
 *   buy_price        required, empty cell = gap (MissingInputError)
 *   feed_in_price    optional, empty cells/missing column filled with the
 *                    explicit fallback
 *   consumption_w    required
 *   pv_ac_w          optional, AC-coupled PV
 *   pv_dc_w          optional, DC-coupled PV
 */
class ForecastCsv {
public:
    /**
     * @throws model::MissingInputError if the file cannot be read or a
     *         required value is missing
     */
    static model::HorizonForecast load(const std::string& path,
                                       double step_hours,
                                       double fallback_feed_in_price);
};

} // namespace app

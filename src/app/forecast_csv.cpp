// src/app/forecast_csv.cpp
#include "app/forecast_csv.hpp"
#include "model/errors.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace app {

model::HorizonForecast ForecastCsv::load(const std::string& path,
                                         double step_hours,
                                         double fallback_feed_in_price) {
    utils::CsvReader csv;
    if (!csv.open(path)) {
        throw model::MissingInputError("Cannot open forecast CSV: " + path);
    }

    for (const char* required : {"buy_price", "consumption_w"}) {
        if (!csv.has_col(required)) {
            throw model::MissingInputError(std::string("Forecast CSV ") + path +
                                           " lacks column '" + required + "'");
        }
    }

    const bool has_feed_in = csv.has_col("feed_in_price");
    const bool has_ac = csv.has_col("pv_ac_w");
    const bool has_dc = csv.has_col("pv_dc_w");

    model::HorizonForecast fc;
    fc.step_hours = step_hours;

    model::PvArray ac;
    ac.name = "pv_ac";
    ac.coupling = model::PvCoupling::AC;
    model::PvArray dc;
    dc.name = "pv_dc";
    dc.coupling = model::PvCoupling::DC;

    std::vector<std::string> row;
    while (csv.read_row(row)) {
        try {
            fc.buy_price.push_back(utils::CsvReader::to_double_or_nan(csv.get(row, "buy_price")));
            fc.consumption_w.push_back(utils::CsvReader::to_double_or_nan(csv.get(row, "consumption_w")));
            if (has_feed_in) {
                fc.feed_in_price.push_back(utils::CsvReader::to_double_or_nan(csv.get(row, "feed_in_price")));
            }
            if (has_ac) {
                ac.power_w.push_back(utils::CsvReader::to_double(csv.get(row, "pv_ac_w"), 0.0));
            }
            if (has_dc) {
                dc.power_w.push_back(utils::CsvReader::to_double(csv.get(row, "pv_dc_w"), 0.0));
            }
        } catch (const std::logic_error& e) {
            // std::stod throws invalid_argument / out_of_range
            throw model::MissingInputError("Forecast CSV " + path + " line " +
                                           std::to_string(csv.line_number()) + ": bad number (" +
                                           e.what() + ")");
        }
    }

    if (has_ac) {
        fc.pv.push_back(std::move(ac));
    }
    if (has_dc) {
        fc.pv.push_back(std::move(dc));
    }

    if (!has_feed_in) {
        LOG_WARN("[ForecastCsv] No feed_in_price column, using fixed %.4f", fallback_feed_in_price);
    }
    const std::size_t filled = fc.apply_feed_in_fallback(fallback_feed_in_price);
    if (has_feed_in && filled > 0) {
        LOG_WARN("[ForecastCsv] %zu feed-in price(s) missing, using fixed %.4f",
                 filled, fallback_feed_in_price);
    }

    fc.validate();

    LOG_INFO("[ForecastCsv] Loaded %zu steps from %s (%zu PV array(s))",
             fc.steps(), path.c_str(), fc.pv.size());
    return fc;
}

} // namespace app

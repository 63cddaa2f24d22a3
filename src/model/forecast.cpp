// src/model/forecast.cpp
#include "model/forecast.hpp"
#include "model/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace model {

const char* to_string(PvCoupling c) {
    switch (c) {
    case PvCoupling::AC:
        return "ac";
    case PvCoupling::DC:
        return "dc";
    }
    return "ac";
}

double HorizonForecast::ac_pv_w(std::size_t t) const {
    double sum = 0.0;
    for (const auto& a : pv) {
        if (a.coupling == PvCoupling::AC) {
            sum += std::max(0.0, a.power_w[t]) * a.efficiency;
        }
    }
    return sum;
}

double HorizonForecast::dc_pv_w(std::size_t t) const {
    double sum = 0.0;
    for (const auto& a : pv) {
        if (a.coupling == PvCoupling::DC) {
            sum += std::max(0.0, a.power_w[t]);
        }
    }
    return sum;
}

std::size_t HorizonForecast::apply_feed_in_fallback(double fallback_price) {
    if (feed_in_price.empty()) {
        feed_in_price.assign(steps(), fallback_price);
        return steps();
    }

    std::size_t filled = 0;
    for (double& p : feed_in_price) {
        if (!std::isfinite(p)) {
            p = fallback_price;
            ++filled;
        }
    }
    return filled;
}

namespace {

void check_series(const std::vector<double>& v, std::size_t n, const char* what) {
    if (v.size() != n) {
        throw MissingInputError(std::string("Forecast series '") + what + "' has " +
                                std::to_string(v.size()) + " steps, expected " + std::to_string(n));
    }
    for (std::size_t t = 0; t < n; ++t) {
        if (!std::isfinite(v[t])) {
            throw MissingInputError(std::string("Forecast series '") + what +
                                    "' has a gap at step " + std::to_string(t));
        }
    }
}

} // namespace

void HorizonForecast::validate(std::size_t min_steps) const {
    const std::size_t n = steps();
    if (n == 0) {
        throw MissingInputError("Forecast is empty");
    }
    if (n < min_steps) {
        throw MissingInputError("Forecast covers " + std::to_string(n) +
                                " steps, horizon needs " + std::to_string(min_steps));
    }
    if (!(step_hours > 0.0)) {
        throw MissingInputError("Forecast step duration must be > 0");
    }
    if (feed_in_price.empty()) {
        throw MissingInputError("Feed-in price series missing; an explicit fallback is required");
    }

    check_series(buy_price, n, "buy_price");
    check_series(feed_in_price, n, "feed_in_price");
    check_series(consumption_w, n, "consumption_w");
    for (const auto& a : pv) {
        check_series(a.power_w, n, a.name.empty() ? "pv" : a.name.c_str());
    }
}

HorizonForecast HorizonForecast::slice(std::size_t first, std::size_t count) const {
    auto cut = [first, count](const std::vector<double>& v) {
        const std::size_t b = std::min(first, v.size());
        const std::size_t e = std::min(first + count, v.size());
        return std::vector<double>(v.begin() + b, v.begin() + e);
    };

    HorizonForecast out;
    out.step_hours = step_hours;
    out.buy_price = cut(buy_price);
    out.feed_in_price = cut(feed_in_price);
    out.consumption_w = cut(consumption_w);
    for (const auto& a : pv) {
        PvArray c = a;
        c.power_w = cut(a.power_w);
        out.pv.push_back(std::move(c));
    }
    return out;
}

} // namespace model

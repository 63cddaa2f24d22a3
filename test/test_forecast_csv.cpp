// test/test_forecast_csv.cpp
// Unit tests for forecast CSV loading

#include "app/forecast_csv.hpp"
#include "model/errors.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

static bool is_close(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

static void write_file(const char* path, const char* body) {
    std::ofstream f(path);
    f << body;
}

// ============================================================================
// Test Cases
// ============================================================================

bool test_full_file() {
    const char* path = "/tmp/test_forecast_full.csv";
    write_file(path,
               "time,buy_price,feed_in_price,consumption_w,pv_ac_w,pv_dc_w\n"
               "# comment lines are skipped\n"
               "00:00,0.12,0.07,350,0,0\n"
               "00:15,0.12,0.07,400,100,200\n"
               "\n"
               "00:30,0.30,0.05,500,1000,1500\n");

    const model::HorizonForecast fc = app::ForecastCsv::load(path, 0.25, 0.08);

    TEST_ASSERT(fc.steps() == 3, "three data rows");
    TEST_ASSERT(is_close(fc.step_hours, 0.25), "step duration from the caller");
    TEST_ASSERT(is_close(fc.buy_price[2], 0.30), "buy price");
    TEST_ASSERT(is_close(fc.feed_in_price[2], 0.05), "feed-in price from the file");
    TEST_ASSERT(fc.pv.size() == 2, "AC and DC arrays");
    TEST_ASSERT(is_close(fc.ac_pv_w(1), 100.0) && is_close(fc.dc_pv_w(1), 200.0), "PV split by coupling");

    std::remove(path);
    return true;
}

bool test_feed_in_fallback() {
    const char* path = "/tmp/test_forecast_no_fip.csv";
    write_file(path,
               "buy_price,consumption_w\n"
               "0.20,300\n"
               "0.25,300\n");

    const model::HorizonForecast fc = app::ForecastCsv::load(path, 0.25, 0.08);

    TEST_ASSERT(fc.feed_in_price.size() == 2, "feed-in series created");
    TEST_ASSERT(is_close(fc.feed_in_price[0], 0.08) && is_close(fc.feed_in_price[1], 0.08),
                "explicit fallback used");
    TEST_ASSERT(fc.pv.empty(), "no PV columns, no arrays");

    std::remove(path);
    return true;
}

bool test_feed_in_gap_filled() {
    const char* path = "/tmp/test_forecast_fip_gap.csv";
    write_file(path,
               "buy_price,feed_in_price,consumption_w\n"
               "0.20,0.06,300\n"
               "0.25,,300\n");

    const model::HorizonForecast fc = app::ForecastCsv::load(path, 0.25, 0.08);
    TEST_ASSERT(is_close(fc.feed_in_price[0], 0.06), "present value kept");
    TEST_ASSERT(is_close(fc.feed_in_price[1], 0.08), "gap filled");

    std::remove(path);
    return true;
}

bool test_buy_gap_rejected() {
    const char* path = "/tmp/test_forecast_buy_gap.csv";
    write_file(path,
               "buy_price,feed_in_price,consumption_w\n"
               "0.20,0.06,300\n"
               ",0.06,300\n");

    bool threw = false;
    try {
        app::ForecastCsv::load(path, 0.25, 0.08);
    } catch (const model::MissingInputError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "missing buy price is an error");

    std::remove(path);
    return true;
}

bool test_bad_number_rejected() {
    const char* path = "/tmp/test_forecast_bad_number.csv";
    write_file(path,
               "buy_price,consumption_w\n"
               "cheap,300\n");

    bool threw = false;
    try {
        app::ForecastCsv::load(path, 0.25, 0.08);
    } catch (const model::MissingInputError& e) {
        threw = std::string(e.what()).find("line 2") != std::string::npos;
    }
    TEST_ASSERT(threw, "unparsable cell reported with its line");

    std::remove(path);
    return true;
}

bool test_missing_column_or_file() {
    const char* path = "/tmp/test_forecast_no_load.csv";
    write_file(path, "buy_price\n0.20\n");

    bool threw = false;
    try {
        app::ForecastCsv::load(path, 0.25, 0.08);
    } catch (const model::MissingInputError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "consumption column required");
    std::remove(path);

    threw = false;
    try {
        app::ForecastCsv::load("/tmp/definitely_not_here.csv", 0.25, 0.08);
    } catch (const model::MissingInputError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "missing file reported");

    return true;
}

// ============================================================================
// Main test runner
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Forecast CSV Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_full_file);
    RUN_TEST(test_feed_in_fallback);
    RUN_TEST(test_feed_in_gap_filled);
    RUN_TEST(test_buy_gap_rejected);
    RUN_TEST(test_bad_number_rejected);
    RUN_TEST(test_missing_column_or_file);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    return (failed == 0) ? 0 : 1;
}

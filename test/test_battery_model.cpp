// test/test_battery_model.cpp
// Unit tests for BatteryModel, SocLattice and ActionSet

#include "model/action_set.hpp"
#include "model/battery_model.hpp"
#include "model/errors.hpp"
#include "model/soc_lattice.hpp"
#include <cmath>
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

static bool is_close(double a, double b, double tol = 1e-6) {
    return std::abs(a - b) <= tol;
}

// ============================================================================
// BatteryModel
// ============================================================================

bool test_efficiency_split() {
    model::BatteryModel battery(model::BatteryParams{});

    TEST_ASSERT(is_close(battery.charge_efficiency(), std::sqrt(0.9)), "eta_c should be sqrt(rte)");
    TEST_ASSERT(is_close(battery.discharge_efficiency(), std::sqrt(0.9)), "eta_d should be sqrt(rte)");
    TEST_ASSERT(is_close(battery.usable_capacity_wh(), 8000.0), "usable window 1000..9000 Wh");

    return true;
}

bool test_soc_delta() {
    model::BatteryModel battery(model::BatteryParams{});
    const double eta = std::sqrt(0.9);

    TEST_ASSERT(is_close(battery.soc_delta_wh(1000.0, 1.0), 1000.0 * eta), "charge stores P*dt*eta");
    TEST_ASSERT(is_close(battery.soc_delta_wh(-1000.0, 1.0), -1000.0 / eta), "discharge drains P*dt/eta");
    TEST_ASSERT(battery.soc_delta_wh(0.0, 1.0) == 0.0, "idle stores nothing");

    // Charge then discharge the same stored energy: grid sees rte
    const double stored = battery.soc_delta_wh(1000.0, 1.0);
    TEST_ASSERT(is_close(battery.grid_energy_wh(stored), 1000.0), "grid energy of a charge");
    TEST_ASSERT(is_close(-battery.grid_energy_wh(-stored), 900.0), "round trip returns 90 %");

    return true;
}

bool test_power_headroom() {
    model::BatteryModel battery(model::BatteryParams{});
    const double eta = std::sqrt(0.9);

    TEST_ASSERT(is_close(battery.max_charge_power(1000.0, 0.25), 5000.0), "empty battery: full charge power");
    TEST_ASSERT(is_close(battery.max_charge_power(8900.0, 0.25), 100.0 / (0.25 * eta)),
                "near full: limited by headroom");
    TEST_ASSERT(battery.max_charge_power(9000.0, 0.25) == 0.0, "full battery: no charge");

    TEST_ASSERT(battery.max_discharge_power(1000.0, 0.25) == 0.0, "empty battery: no discharge");
    TEST_ASSERT(is_close(battery.max_discharge_power(1100.0, 0.25), 100.0 * eta / 0.25),
                "near empty: limited by available energy");

    TEST_ASSERT(battery.within_power_limits(5000.0), "5 kW charge allowed");
    TEST_ASSERT(!battery.within_power_limits(5001.0), "5.001 kW charge rejected");
    TEST_ASSERT(!battery.within_power_limits(-5001.0), "5.001 kW discharge rejected");

    return true;
}

bool test_apply_on_lattice() {
    model::BatteryModel battery(model::BatteryParams{});
    model::SocLattice lattice(1000.0, 9000.0, 100.0);

    // 5 kW for 15 min stores 1185.9 Wh; 1200 would need 5060 W, so 1100
    model::Transition tr = battery.apply(lattice, 0, 5000.0, 0.25);
    TEST_ASSERT(tr.feasible, "full charge from empty is feasible");
    TEST_ASSERT(tr.next_index == 11, "snapped inward to index 11");
    TEST_ASSERT(is_close(tr.stored_delta_wh, 1100.0), "realized delta is the lattice delta");
    TEST_ASSERT(is_close(tr.power_w, 1100.0 / std::sqrt(0.9) / 0.25), "power realizing 1100 Wh");
    TEST_ASSERT(battery.within_power_limits(tr.power_w), "realized power inside the limit");

    // 1 kW stores 237.2 Wh, nearest is 200 Wh
    tr = battery.apply(lattice, 40, 1000.0, 0.25);
    TEST_ASSERT(tr.feasible && tr.next_index == 42, "snapped to the nearest point");
    TEST_ASSERT(is_close(battery.soc_delta_wh(tr.power_w, 0.25), tr.stored_delta_wh),
                "realized power reproduces the stored delta");

    // -1 kW releases 263.5 Wh, nearest is 300 Wh
    tr = battery.apply(lattice, 40, -1000.0, 0.25);
    TEST_ASSERT(tr.feasible && tr.next_index == 37, "discharge snapped to the nearest point");
    TEST_ASSERT(is_close(tr.power_w, -300.0 * std::sqrt(0.9) / 0.25), "AC power of the realized discharge");
    TEST_ASSERT(is_close(battery.grid_energy_wh(tr.stored_delta_wh), tr.power_w * 0.25),
                "grid energy matches power times duration");

    // Repeating a realized delta lands on the same offset from any start
    tr = battery.shift(lattice, 10, 300.0, 0.25);
    TEST_ASSERT(tr.feasible && tr.next_index == 13 && is_close(tr.stored_delta_wh, 300.0), "shift by 300 Wh");
    tr = battery.shift(lattice, 79, 300.0, 0.25);
    TEST_ASSERT(!tr.feasible, "shift past soc_max is infeasible");

    tr = battery.apply(lattice, 0, -500.0, 0.25);
    TEST_ASSERT(!tr.feasible, "discharge below soc_min is infeasible");

    tr = battery.apply(lattice, 80, 500.0, 0.25);
    TEST_ASSERT(!tr.feasible, "charge above soc_max is infeasible");

    tr = battery.apply(lattice, 40, 0.0, 0.25);
    TEST_ASSERT(tr.feasible && tr.next_index == 40 && tr.stored_delta_wh == 0.0, "idle stays put");

    tr = battery.apply(lattice, 40, 6000.0, 0.25);
    TEST_ASSERT(!tr.feasible, "over the power limit is infeasible");

    tr = battery.apply(lattice, 81, 0.0, 0.25);
    TEST_ASSERT(!tr.feasible, "start outside the lattice is infeasible");

    return true;
}

bool test_should_cycle() {
    model::BatteryModel battery(model::BatteryParams{});

    // buy 0.10: need sell > 0.10 / 0.9 + 0.06 = 0.1711
    TEST_ASSERT(!battery.should_cycle(0.10, 0.17), "0.17 does not cover losses and wear");
    TEST_ASSERT(battery.should_cycle(0.10, 0.18), "0.18 does");

    return true;
}

bool test_degradation_cost() {
    const double c = model::BatteryModel::degradation_cost_per_kwh(500.0, 6000.0, 0.8);
    TEST_ASSERT(is_close(c, 500.0 / 6000.0 / 1.6), "replacement / cycles / (2 * dod)");

    bool threw = false;
    try {
        model::BatteryModel::degradation_cost_per_kwh(500.0, 0.0, 0.8);
    } catch (const model::ConfigurationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "zero cycle life rejected");

    return true;
}

bool test_invalid_params() {
    model::BatteryParams p;
    p.round_trip_efficiency = 1.2;
    bool threw = false;
    try {
        model::BatteryModel battery(p);
    } catch (const model::ConfigurationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "rte > 1 rejected");

    p = model::BatteryParams{};
    p.soc_min_wh = 9000.0;
    threw = false;
    try {
        model::BatteryModel battery(p);
    } catch (const model::ConfigurationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "soc_min >= soc_max rejected");

    p = model::BatteryParams{};
    p.max_discharge_power_w = 0.0;
    threw = false;
    try {
        model::BatteryModel battery(p);
    } catch (const model::ConfigurationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "zero discharge power rejected");

    return true;
}

bool test_soc_percent() {
    model::BatteryModel battery(model::BatteryParams{});

    TEST_ASSERT(is_close(battery.soc_percent(5000.0), 50.0), "5 kWh of 10 kWh is 50 %");
    TEST_ASSERT(is_close(battery.soc_wh_from_percent(25.0), 2500.0), "25 % is 2.5 kWh");

    return true;
}

// ============================================================================
// SocLattice
// ============================================================================

bool test_lattice_bounds() {
    model::SocLattice lattice(1000.0, 9000.0, 100.0);
    TEST_ASSERT(lattice.size() == 81, "1000..9000 step 100 has 81 levels");
    TEST_ASSERT(is_close(lattice.max_wh(), 9000.0), "top level is soc_max");

    // soc_max not on the grid: last level at or below it
    model::SocLattice uneven(1000.0, 9050.0, 100.0);
    TEST_ASSERT(uneven.size() == 81, "partial top cell dropped");
    TEST_ASSERT(uneven.max_wh() <= 9050.0, "top level stays within soc_max");

    TEST_ASSERT(lattice.snap(500.0) == 0, "below range snaps to 0");
    TEST_ASSERT(lattice.snap(1e6) == 80, "above range snaps to top");
    TEST_ASSERT(lattice.snap(1040.0) == 0, "1040 Wh rounds down");
    TEST_ASSERT(lattice.snap(1060.0) == 1, "1060 Wh rounds up");
    TEST_ASSERT(lattice.nearest_unclamped(830.0) == -2, "unclamped index may be negative");
    TEST_ASSERT(!lattice.contains(-1) && !lattice.contains(81) && lattice.contains(80), "contains");

    bool threw = false;
    try {
        model::SocLattice bad(1000.0, 9000.0, 0.0);
    } catch (const model::ConfigurationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "zero resolution rejected");

    return true;
}

// ============================================================================
// ActionSet
// ============================================================================

bool test_action_ordering() {
    model::ActionSet actions(5000.0, 5000.0, 500.0);

    TEST_ASSERT(actions.size() == 21, "idle + 10 discharge + 10 charge levels");
    TEST_ASSERT(actions[model::ActionSet::kIdleIndex] == 0.0, "idle first");
    TEST_ASSERT(actions[1] == -500.0 && actions[2] == 500.0, "discharge before charge at equal magnitude");
    TEST_ASSERT(actions[actions.size() - 1] == 5000.0, "largest charge last");

    for (std::size_t i = 2; i < actions.size(); ++i) {
        TEST_ASSERT(std::abs(actions[i]) >= std::abs(actions[i - 1]), "magnitudes non-decreasing");
    }

    return true;
}

bool test_action_limits_off_grid() {
    // Limits that are not multiples of the step are still reachable
    model::ActionSet actions(1200.0, 1000.0, 500.0);

    TEST_ASSERT(actions.size() == 6, "0, -500, 500, -1000, 1000, -1200");
    TEST_ASSERT(actions[5] == -1200.0, "discharge limit included");
    TEST_ASSERT(actions[4] == 1000.0, "charge limit included once");

    return true;
}

// ============================================================================
// Main test runner
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Battery Model Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_efficiency_split);
    RUN_TEST(test_soc_delta);
    RUN_TEST(test_power_headroom);
    RUN_TEST(test_apply_on_lattice);
    RUN_TEST(test_should_cycle);
    RUN_TEST(test_degradation_cost);
    RUN_TEST(test_invalid_params);
    RUN_TEST(test_soc_percent);
    RUN_TEST(test_lattice_bounds);
    RUN_TEST(test_action_ordering);
    RUN_TEST(test_action_limits_off_grid);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    return (failed == 0) ? 0 : 1;
}

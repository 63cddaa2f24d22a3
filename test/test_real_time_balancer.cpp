// test/test_real_time_balancer.cpp
// Unit tests for RealTimeBalancer and ModeResolver

#include "control/control_mode.hpp"
#include "control/mode_resolver.hpp"
#include "control/real_time_balancer.hpp"
#include "model/errors.hpp"
#include "optim/schedule.hpp"
#include <cmath>
#include <iostream>
#include <vector>

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

static control::BalancerSettings settings_with_deadband(double deadband_w) {
    control::BalancerSettings s;
    s.deadband_w = deadband_w;
    return s;
}

static control::LiveMeasurement meas(double grid_w, double battery_w) {
    control::LiveMeasurement m;
    m.grid_w = grid_w;
    m.battery_w = battery_w;
    return m;
}

static optim::Schedule plan_of(const std::vector<optim::StepMode>& modes) {
    optim::Schedule s;
    for (auto m : modes) {
        optim::ScheduleStep step;
        step.mode = m;
        step.power_w = (m == optim::StepMode::Charging) ? 1000.0
                     : (m == optim::StepMode::Discharging) ? -1000.0 : 0.0;
        s.steps.push_back(step);
    }
    return s;
}

// ============================================================================
// RealTimeBalancer
// ============================================================================

bool test_zero_grid_deadband_sequence() {
    control::RealTimeBalancer balancer(settings_with_deadband(10.0));
    const auto zg = control::BalancerMode::ZeroGrid;

    control::ControlAction a = balancer.step(meas(300.0, 0.0), zg, 0.0);
    TEST_ASSERT(is_close(a.target_w, -300.0), "import of 300 W: discharge 300 W");
    TEST_ASSERT(a.label == control::ActionLabel::Discharging, "labelled discharging");

    a = balancer.step(meas(0.0, -300.0), zg, 0.0);
    TEST_ASSERT(is_close(a.target_w, -300.0), "balanced: target unchanged");

    a = balancer.step(meas(5.0, -300.0), zg, 0.0);
    TEST_ASSERT(is_close(a.raw_target_w, -305.0), "raw target follows the meter");
    TEST_ASSERT(is_close(a.target_w, -300.0), "5 W change held by the deadband");

    a = balancer.step(meas(50.0, -300.0), zg, 0.0);
    TEST_ASSERT(is_close(a.target_w, -350.0), "50 W change goes through");
    TEST_ASSERT(is_close(balancer.previous_target(), -350.0), "previous target updated");

    return true;
}

bool test_inert_without_grid() {
    control::RealTimeBalancer balancer(settings_with_deadband(10.0));
    balancer.step(meas(300.0, 0.0), control::BalancerMode::ZeroGrid, 0.0);

    control::LiveMeasurement m;
    m.battery_w = -300.0;
    const control::ControlAction a = balancer.step(m, control::BalancerMode::ZeroGrid, 0.0);

    TEST_ASSERT(a.inert, "no grid reading: inert");
    TEST_ASSERT(a.target_w == 0.0, "inert reports zero");
    TEST_ASSERT(is_close(balancer.previous_target(), -300.0), "previous target untouched");

    return true;
}

bool test_missing_battery_reading() {
    control::RealTimeBalancer balancer(settings_with_deadband(10.0));
    balancer.step(meas(300.0, 0.0), control::BalancerMode::ZeroGrid, 0.0);

    control::LiveMeasurement m;
    m.grid_w = 100.0;
    const control::ControlAction a = balancer.step(m, control::BalancerMode::ZeroGrid, 0.0);

    TEST_ASSERT(is_close(a.target_w, -400.0), "previous target stands in for the battery power");

    return true;
}

bool test_clamp_and_soc_limits() {
    control::RealTimeBalancer balancer(settings_with_deadband(0.0));

    control::ControlAction a = balancer.step(meas(9000.0, 0.0), control::BalancerMode::ZeroGrid, 0.0);
    TEST_ASSERT(is_close(a.target_w, -5000.0), "clamped to max discharge");

    a = balancer.step(meas(-9000.0, 0.0), control::BalancerMode::ZeroGrid, 0.0);
    TEST_ASSERT(is_close(a.target_w, 5000.0), "clamped to max charge");

    control::LiveMeasurement empty = meas(500.0, 0.0);
    empty.soc_wh = 1000.0;
    a = balancer.step(empty, control::BalancerMode::ZeroGrid, 0.0);
    TEST_ASSERT(a.target_w == 0.0, "no discharge at soc_min");

    control::LiveMeasurement full = meas(-500.0, 0.0);
    full.soc_wh = 9000.0;
    a = balancer.step(full, control::BalancerMode::FollowSchedule, 2000.0);
    TEST_ASSERT(a.target_w == 0.0, "no charge at soc_max");

    return true;
}

bool test_held_target_respects_soc() {
    control::RealTimeBalancer balancer(settings_with_deadband(400.0));
    balancer.step(meas(900.0, 0.0), control::BalancerMode::ZeroGrid, 0.0);
    control::ControlAction a = balancer.step(meas(-550.0, -900.0), control::BalancerMode::ZeroGrid, 0.0);
    TEST_ASSERT(is_close(a.target_w, -350.0), "setup: discharging 350 W");

    // Raw target is cut to 0 at soc_min, which is inside the deadband of -350 W
    control::LiveMeasurement m = meas(0.0, -350.0);
    m.soc_wh = 1000.0;
    a = balancer.step(m, control::BalancerMode::ZeroGrid, 0.0);

    TEST_ASSERT(a.raw_target_w == 0.0, "raw target limited");
    TEST_ASSERT(a.target_w == 0.0, "held discharge dropped at soc_min");

    return true;
}

bool test_follow_schedule_and_idle() {
    control::RealTimeBalancer balancer(settings_with_deadband(50.0));

    control::ControlAction a = balancer.step(meas(0.0, 0.0), control::BalancerMode::FollowSchedule, 2500.0);
    TEST_ASSERT(is_close(a.target_w, 2500.0), "scheduled power issued");
    TEST_ASSERT(a.label == control::ActionLabel::Charging, "labelled charging");

    a = balancer.step(meas(0.0, 2500.0), control::BalancerMode::FollowSchedule, 2520.0);
    TEST_ASSERT(is_close(a.target_w, 2500.0), "deadband applies to the schedule too");

    // Idle bypasses the deadband entirely
    a = balancer.step(meas(0.0, 2500.0), control::BalancerMode::Idle, 0.0);
    TEST_ASSERT(a.target_w == 0.0, "idle is exactly zero");
    TEST_ASSERT(a.label == control::ActionLabel::Idle, "labelled idle");

    a = balancer.step(meas(0.0, 0.0), control::BalancerMode::Manual, 0.0);
    TEST_ASSERT(a.target_w == 0.0 && a.mode == control::BalancerMode::Manual, "manual issues nothing");

    return true;
}

bool test_action_threshold_label() {
    control::BalancerSettings s = settings_with_deadband(0.0);
    s.action_threshold_w = 50.0;
    control::RealTimeBalancer balancer(s);

    control::ControlAction a = balancer.step(meas(30.0, 0.0), control::BalancerMode::ZeroGrid, 0.0);
    TEST_ASSERT(is_close(a.target_w, -30.0), "small target still issued");
    TEST_ASSERT(a.label == control::ActionLabel::Idle, "but labelled idle");

    return true;
}

bool test_invalid_settings() {
    bool threw = false;
    try {
        control::RealTimeBalancer balancer(settings_with_deadband(-1.0));
    } catch (const model::ConfigurationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "negative deadband rejected");

    return true;
}

// ============================================================================
// ModeResolver
// ============================================================================

bool test_fixed_modes() {
    using control::ControlMode;
    using control::EffectiveMode;
    const auto plan = plan_of({optim::StepMode::Charging});
    const control::StepPrices prices{0.20, 0.07};

    TEST_ASSERT(control::ModeResolver::resolve_effective(ControlMode::ZeroGrid, plan, prices, 0.0) ==
                EffectiveMode::ZeroGrid, "zero_grid stays zero_grid");
    TEST_ASSERT(control::ModeResolver::resolve_effective(ControlMode::Manual, plan, prices, 0.0) ==
                EffectiveMode::Manual, "manual stays manual");
    TEST_ASSERT(control::ModeResolver::resolve_effective(ControlMode::FollowSchedule, plan, prices, 0.0) ==
                EffectiveMode::Charging, "follow_schedule takes the first step");

    return true;
}

bool test_hybrid_rules() {
    using control::ControlMode;
    using control::EffectiveMode;
    using optim::StepMode;
    const auto hybrid = ControlMode::Hybrid;

    // Idle now, discharge later: hold capacity while importing
    auto plan = plan_of({StepMode::Idle, StepMode::Idle, StepMode::Discharging});
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, 0.07}, 200.0) ==
                EffectiveMode::Idle, "idle held for a later discharge");
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, 0.07}, -200.0) ==
                EffectiveMode::ZeroGrid, "exporting PV: soak it up");

    plan = plan_of({StepMode::Idle, StepMode::Charging});
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, 0.07}, 200.0) ==
                EffectiveMode::ZeroGrid, "idle with nothing to save for: self-consumption");

    plan = plan_of({StepMode::Discharging});
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, 0.25}, 0.0) ==
                EffectiveMode::Discharging, "feed-in above buy: export");
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, 0.07}, 0.0) ==
                EffectiveMode::ZeroGrid, "otherwise cover the load only");

    plan = plan_of({StepMode::Charging});
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, 0.07}, 300.0) ==
                EffectiveMode::Charging, "importing: charge at the planned rate");
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, 0.07}, -300.0) ==
                EffectiveMode::ZeroGrid, "exporting: absorb the surplus");
    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, plan, {0.20, -0.02}, -300.0) ==
                EffectiveMode::Charging, "negative feed-in: keep charging");

    TEST_ASSERT(control::ModeResolver::resolve_effective(hybrid, optim::Schedule{}, {0.20, 0.07}, 0.0) ==
                EffectiveMode::ZeroGrid, "no plan: self-consumption");

    return true;
}

bool test_without_plan_and_balancer_mode() {
    using control::BalancerMode;
    using control::EffectiveMode;

    TEST_ASSERT(control::ModeResolver::without_plan(control::ControlMode::Hybrid) == EffectiveMode::ZeroGrid,
                "hybrid falls back to zero-grid");
    TEST_ASSERT(control::ModeResolver::without_plan(control::ControlMode::FollowSchedule) == EffectiveMode::Idle,
                "follow_schedule falls back to idle");

    TEST_ASSERT(control::ModeResolver::balancer_mode(EffectiveMode::Idle, -100.0, true) == BalancerMode::ZeroGrid,
                "idle while exporting absorbs PV");
    TEST_ASSERT(control::ModeResolver::balancer_mode(EffectiveMode::Idle, -100.0, false) == BalancerMode::Idle,
                "idle without telemetry stays idle");
    TEST_ASSERT(control::ModeResolver::balancer_mode(EffectiveMode::Discharging, 0.0, true) ==
                BalancerMode::FollowSchedule, "planned discharge follows the schedule");
    TEST_ASSERT(control::ModeResolver::balancer_mode(EffectiveMode::Manual, 0.0, true) == BalancerMode::Manual,
                "manual");

    return true;
}

bool test_parse_control_mode() {
    TEST_ASSERT(control::parse_control_mode("Zero_Grid") == control::ControlMode::ZeroGrid, "case-insensitive");
    TEST_ASSERT(control::parse_control_mode("hybrid") == control::ControlMode::Hybrid, "hybrid");

    bool threw = false;
    try {
        control::parse_control_mode("autopilot");
    } catch (const model::ConfigurationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "unknown mode rejected");

    return true;
}

// ============================================================================
// Main test runner
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Real-Time Balancer Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_zero_grid_deadband_sequence);
    RUN_TEST(test_inert_without_grid);
    RUN_TEST(test_missing_battery_reading);
    RUN_TEST(test_clamp_and_soc_limits);
    RUN_TEST(test_held_target_respects_soc);
    RUN_TEST(test_follow_schedule_and_idle);
    RUN_TEST(test_action_threshold_label);
    RUN_TEST(test_invalid_settings);
    RUN_TEST(test_fixed_modes);
    RUN_TEST(test_hybrid_rules);
    RUN_TEST(test_without_plan_and_balancer_mode);
    RUN_TEST(test_parse_control_mode);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    return (failed == 0) ? 0 : 1;
}

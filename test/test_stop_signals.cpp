// test/test_stop_signals.cpp
// Unit tests for the SIGINT/SIGTERM binding used by the controller executable

#include "app/stop_signals.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <signal.h>
#include <stdexcept>

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

struct StoppableLoop {
    std::atomic<int> stops{0};
    void request_stop() { ++stops; }
};

static bool handler_is_default(int sig) {
    struct sigaction current {};
    if (sigaction(sig, nullptr, &current) != 0) {
        return false;
    }
    return current.sa_handler == SIG_DFL;
}

// ============================================================================
// Test Cases
// ============================================================================

bool test_signals_reach_target() {
    StoppableLoop loop;
    {
        app::StopSignals<StoppableLoop> signals(loop);
        TEST_ASSERT(app::StopSignals<StoppableLoop>::bound(), "bound while in scope");
        TEST_ASSERT(!handler_is_default(SIGINT) && !handler_is_default(SIGTERM), "handlers installed");

        std::raise(SIGINT);
        std::raise(SIGTERM);
        TEST_ASSERT(loop.stops.load() == 2, "both signals request a stop");
    }

    TEST_ASSERT(!app::StopSignals<StoppableLoop>::bound(), "unbound after scope");
    TEST_ASSERT(handler_is_default(SIGINT) && handler_is_default(SIGTERM), "default handlers restored");

    return true;
}

bool test_unwinding_restores_handlers() {
    bool caught = false;
    try {
        StoppableLoop loop;
        app::StopSignals<StoppableLoop> signals(loop);
        throw std::runtime_error("run loop failed");
    } catch (const std::runtime_error&) {
        caught = true;
    }

    TEST_ASSERT(caught, "exception reached the caller");
    TEST_ASSERT(!app::StopSignals<StoppableLoop>::bound(), "no handler left pointing at the dead target");
    TEST_ASSERT(handler_is_default(SIGINT) && handler_is_default(SIGTERM), "default handlers restored");

    return true;
}

// ============================================================================
// Main test runner
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Stop Signal Binding Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_signals_reach_target);
    RUN_TEST(test_unwinding_restores_handlers);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    return (failed == 0) ? 0 : 1;
}

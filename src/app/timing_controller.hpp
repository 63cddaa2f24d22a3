// src/app/timing_controller.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace app {

/**
 * TimingController - fixed-cadence pacing for the tactical loop
 *
 * Features:
 * - Absolute deadlines (no drift accumulation)
 * - Deadline miss detection and statistics
 * - Sleeps in short slices so a stop flag is honoured promptly
 */
class TimingController {
public:
    struct Stats {
        size_t total_steps = 0;
        size_t deadline_misses = 0;
        double max_lateness_ms = 0.0;
        double avg_lateness_ms = 0.0;
        double max_loop_time_ms = 0.0;
    };

    explicit TimingController(double dt_s)
        : dt_ns_(static_cast<int64_t>(dt_s * 1e9)),
          slice_ns_(100000000)  // wake at least every 100 ms to check the stop flag
    {
        reset();
    }

    void reset() {
        step_count_ = 0;
        total_lateness_ms_ = 0.0;
        stats_ = Stats{};
        epoch_ = std::chrono::steady_clock::now();
        last_loop_start_ = epoch_;
    }

    /**
     * Wait until next tick deadline or until stop becomes true
     *
     * Returns false if deadline was missed (loop too slow)
     */
    bool wait_for_next_step(const std::atomic<bool>& stop) {
        using namespace std::chrono;

        auto now = steady_clock::now();
        step_count_++;

        auto deadline = epoch_ + nanoseconds(static_cast<int64_t>(step_count_) * dt_ns_);
        int64_t remaining_ns = duration_cast<nanoseconds>(deadline - now).count();

        bool missed_deadline = false;
        if (remaining_ns < 0) {
            missed_deadline = true;
            stats_.deadline_misses++;

            double lateness_ms = -remaining_ns / 1e6;
            stats_.max_lateness_ms = std::max(stats_.max_lateness_ms, lateness_ms);
            total_lateness_ms_ += lateness_ms;
            stats_.avg_lateness_ms = total_lateness_ms_ / stats_.deadline_misses;
        }

        while (!stop.load() && steady_clock::now() < deadline) {
            auto next = std::min(deadline, steady_clock::now() + nanoseconds(slice_ns_));
            std::this_thread::sleep_until(next);
        }

        return !missed_deadline;
    }

    /**
     * Scheduled time of the current tick (in seconds since reset)
     */
    double get_tick_time() const {
        return step_count_ * (dt_ns_ / 1e9);
    }

    double get_wall_time() const {
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_);
        return elapsed.count();
    }

    /**
     * Mark start of computation (for loop time measurement)
     */
    void mark_loop_start() {
        last_loop_start_ = std::chrono::steady_clock::now();
    }

    void update_loop_stats() {
        auto loop = std::chrono::steady_clock::now() - last_loop_start_;
        double loop_ms = std::chrono::duration<double, std::milli>(loop).count();
        stats_.max_loop_time_ms = std::max(stats_.max_loop_time_ms, loop_ms);
        stats_.total_steps++;
    }

    const Stats& get_stats() const { return stats_; }

private:
    int64_t dt_ns_;
    int64_t slice_ns_;

    size_t step_count_ = 0;
    double total_lateness_ms_ = 0.0;

    std::chrono::steady_clock::time_point epoch_;
    std::chrono::steady_clock::time_point last_loop_start_;

    Stats stats_;
};

} // namespace app

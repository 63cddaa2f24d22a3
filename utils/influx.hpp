// utils/influx.hpp
#pragma once

#include "control/control_mode.hpp"
#include "control/real_time_balancer.hpp"
#include "optim/schedule.hpp"
#include "optim/shadow_price.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

struct InfluxConfig {
    std::string url = "http://localhost:8086";  // InfluxDB server URL
    std::string token = "";                      // Authentication token (optional for local)
    std::string org = "home";                    // Organization name
    std::string bucket = "battery";              // Bucket name
    double write_interval_s = 5.0;               // tactical setpoints, one per tick
    bool enabled = false;                        // Only enabled with --influx flag or influx.enabled
};

/**
 * InfluxDB client for battery plan and setpoint monitoring
 *
 * Measurement schema:
 *   - battery_plan:    one point per planned step, timestamped at the step
 *                      start (future points), tag mode
 *   - battery_control: one point per tactical tick (rate limited),
 *                      tags mode/action
 */
class InfluxClient {
public:
    using Config = InfluxConfig;

    /**
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxClient(const Config& config);

    ~InfluxClient();

    /**
     * Write a freshly published plan. Not rate limited (one call per cycle).
     *
     * @param start_ns Wall clock timestamp of the first step
     * @return true if data was written
     */
    bool write_plan(const optim::Schedule& schedule,
                    const optim::ShadowPrice& shadow,
                    const optim::Diagnostics& diag,
                    control::EffectiveMode effective,
                    int64_t start_ns);

    /**
     * Write one tactical setpoint.
     *
     * Only writes if enabled and at least write_interval_s has passed since
     * the last control write (now_s on any monotonic clock).
     *
     * @return true if data was written, false if skipped (rate limiting)
     */
    bool write_control(const control::ControlAction& action,
                       const control::LiveMeasurement& live,
                       double soc_percent,
                       double now_s);

    void flush();

    bool is_enabled() const { return config_.enabled; }

    const Config& get_config() const { return config_; }

    // ------------------------------------------------------------------
    // Line protocol builders
    // ------------------------------------------------------------------

    static std::string build_plan_lines(const optim::Schedule& schedule,
                                        const optim::ShadowPrice& shadow,
                                        const optim::Diagnostics& diag,
                                        control::EffectiveMode effective,
                                        int64_t start_ns);

    static std::string build_control_line(const control::ControlAction& action,
                                          const control::LiveMeasurement& live,
                                          double soc_percent,
                                          int64_t timestamp_ns);

    static int64_t wall_clock_time_ns();

private:
    Config config_;
    double last_write_time_;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool send_to_influx(const std::string& line_protocol);
};

} // namespace utils

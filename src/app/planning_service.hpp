// src/app/planning_service.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "app/plan_publisher.hpp"
#include "app/state_store.hpp"
#include "config/controller_config.hpp"
#include "model/battery_model.hpp"
#include "model/forecast.hpp"
#include "optim/oscillation_filter.hpp"
#include "optim/schedule_optimizer.hpp"

namespace app {

enum class CycleOutcome {
    Published,
    Dropped,      // another cycle was already running
    Superseded,   // cancelled or reconfigured while running; result discarded
    Failed        // missing input / sensor / invariant; previous plan kept
};

const char* to_string(CycleOutcome o);

struct PlanningRequest {
    model::HorizonForecast forecast;      // feed-in fallback already applied by the caller
    std::optional<double> current_soc_wh;
    std::optional<double> grid_w;
    double now_s = 0.0;
};

struct CycleReport {
    CycleOutcome outcome = CycleOutcome::Failed;
    std::string message;
    std::shared_ptr<const PublishedPlan> plan;
};

/**
 * Everything one configuration needs to plan. Rebuilt on reconfigure().
 */
struct PlanningEngine {
    explicit PlanningEngine(const config::ControllerConfig& c);

    PlanningEngine(const PlanningEngine&) = delete;
    PlanningEngine& operator=(const PlanningEngine&) = delete;

    config::ControllerConfig cfg;
    model::BatteryModel battery;
    optim::ScheduleOptimizer optimizer;
    optim::OscillationFilter filter;
};

/**
 * PlanningService - runs planning cycles and publishes their results.
 *
 * One cycle:
 *   starting SoC -> optimize -> oscillation filter -> shadow price
 *   -> effective mode -> publish + persist
 *
 * At most one cycle runs at a time; try_run() returns Dropped instead of
 * waiting. cancel() and reconfigure() advance a generation counter, and a
 * cycle that finishes under a different generation is discarded whole.
 * The generation check and the publication happen under one lock, so a
 * cancel() that has returned can never be followed by that cycle's plan.
 * State is persisted only after the plan is published.
 * ConfigurationError propagates to the caller.
 */
class PlanningService {
public:
    PlanningService(const config::ControllerConfig& cfg, PlanPublisher& publisher, StateStore& store);

    CycleReport try_run(const PlanningRequest& request);

    void cancel();

    /**
     * @throws model::ConfigurationError if the new configuration is invalid
     */
    void reconfigure(const config::ControllerConfig& cfg);

    bool busy() const { return busy_.load(); }
    std::uint64_t generation() const { return generation_.load(); }

    std::shared_ptr<const PlanningEngine> engine() const;

    // Called after the computation, before publication (instrumentation and tests)
    void set_pre_publish_hook(std::function<void()> hook) { pre_publish_hook_ = std::move(hook); }

private:
    CycleReport run_cycle(const PlanningEngine& engine, const PlanningRequest& request,
                          std::uint64_t generation);

    PlanPublisher& publisher_;
    StateStore& store_;

    mutable std::mutex engine_mu_;
    std::shared_ptr<const PlanningEngine> engine_;

    std::function<void()> pre_publish_hook_;

    // Orders generation bumps against the check-and-publish step
    std::mutex publish_mu_;

    std::atomic<bool> busy_{false};
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace app

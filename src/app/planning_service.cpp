// src/app/planning_service.cpp
#include "app/planning_service.hpp"
#include "control/mode_resolver.hpp"
#include "model/errors.hpp"
#include "optim/shadow_price.hpp"
#include "utils/logging.hpp"

namespace app {

const char* to_string(CycleOutcome o) {
    switch (o) {
    case CycleOutcome::Published:
        return "published";
    case CycleOutcome::Dropped:
        return "dropped";
    case CycleOutcome::Superseded:
        return "superseded";
    case CycleOutcome::Failed:
        return "failed";
    }
    return "failed";
}

PlanningEngine::PlanningEngine(const config::ControllerConfig& c)
    : cfg(c),
      battery(c.battery),
      optimizer(battery, c.optimizer),
      filter(optimizer, c.oscillation) {}

namespace {

// Clears the in-flight flag on every exit path
class BusyGuard {
public:
    explicit BusyGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~BusyGuard() { flag_.store(false); }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

PlanningService::PlanningService(const config::ControllerConfig& cfg, PlanPublisher& publisher,
                                 StateStore& store)
    : publisher_(publisher),
      store_(store) {
    cfg.validate();
    engine_ = std::make_shared<const PlanningEngine>(cfg);
}

std::shared_ptr<const PlanningEngine> PlanningService::engine() const {
    std::lock_guard<std::mutex> lock(engine_mu_);
    return engine_;
}

void PlanningService::cancel() {
    std::uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(publish_mu_);
        gen = ++generation_;
    }
    LOG_INFO("[Planner] Cancel requested (generation %llu)", static_cast<unsigned long long>(gen));
}

void PlanningService::reconfigure(const config::ControllerConfig& cfg) {
    cfg.validate();
    auto fresh = std::make_shared<const PlanningEngine>(cfg);
    {
        std::lock_guard<std::mutex> lock(engine_mu_);
        engine_ = std::move(fresh);
    }
    std::uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(publish_mu_);
        gen = ++generation_;
    }
    LOG_INFO("[Planner] Reconfigured (generation %llu)", static_cast<unsigned long long>(gen));
}

CycleReport PlanningService::try_run(const PlanningRequest& request) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        LOG_WARN("[Planner] Cycle already in flight, request dropped");
        CycleReport r;
        r.outcome = CycleOutcome::Dropped;
        r.message = "planning cycle already running";
        r.plan = publisher_.snapshot();
        return r;
    }
    BusyGuard guard(busy_);

    const std::uint64_t gen = generation_.load();
    const auto eng = engine();
    return run_cycle(*eng, request, gen);
}

CycleReport PlanningService::run_cycle(const PlanningEngine& eng, const PlanningRequest& request,
                                       std::uint64_t gen) {
    CycleReport report;
    report.plan = publisher_.snapshot();

    try {
        const model::HorizonForecast& fc = request.forecast;
        fc.validate(eng.cfg.min_horizon_steps());

        const optim::OptimizationResult result =
            eng.optimizer.optimize(fc, request.current_soc_wh, store_.last_soc());

        int removed = 0;
        optim::Schedule filtered = eng.filter.apply(result.schedule, fc, &removed);

        auto plan = std::make_shared<PublishedPlan>();
        plan->created_at_s = request.now_s;
        plan->shadow = optim::ShadowPriceCalculator::compute(
            result.values, eng.optimizer.lattice(), result.schedule.start_index,
            eng.battery.round_trip_efficiency());
        plan->diagnostics = optim::compute_diagnostics(filtered, fc.feed_in_price.back());
        plan->effective = control::ModeResolver::resolve_effective(
            eng.cfg.control.mode, filtered,
            control::StepPrices{fc.buy_price.front(), fc.feed_in_price.front()},
            request.grid_w.value_or(0.0));
        plan->oscillations_removed = removed;
        plan->schedule = std::move(filtered);

        if (pre_publish_hook_) {
            pre_publish_hook_();
        }

        {
            std::lock_guard<std::mutex> lock(publish_mu_);
            if (generation_.load() != gen) {
                LOG_INFO("[Planner] Cycle superseded, result discarded");
                report.outcome = CycleOutcome::Superseded;
                report.message = "superseded by cancel/reconfigure";
                return report;
            }
            publisher_.publish(plan);
        }

        const auto& d = plan->diagnostics;
        LOG_INFO("[Planner] Plan: %s, first step %.0f W, shadow %.4f/kWh (chg<%.4f dis>%.4f), "
                 "cost %.3f vs %.3f baseline, savings %.3f",
                 control::to_string(plan->effective), plan->schedule.steps.front().power_w,
                 plan->shadow.price, plan->shadow.charge_threshold, plan->shadow.discharge_threshold,
                 d.total_cost, d.baseline_cost, d.savings);

        store_.record_plan(plan->schedule);
        if (request.current_soc_wh) {
            store_.record_soc(*request.current_soc_wh);
        }
        if (!store_.flush()) {
            LOG_WARN("[Planner] State not persisted to %s", store_.path().c_str());
        }

        report.outcome = CycleOutcome::Published;
        report.plan = std::move(plan);
        return report;

    } catch (const model::MissingInputError& e) {
        LOG_WARN("[Planner] Cycle failed, keeping previous plan: %s", e.what());
        report.message = e.what();
    } catch (const model::SensorUnavailable& e) {
        LOG_WARN("[Planner] Cannot plan without a starting SoC: %s", e.what());
        report.message = e.what();
    } catch (const model::InvariantViolation& e) {
        LOG_ERROR("[Planner] Invariant violation: %s (soc=%s, steps=%zu)", e.what(),
                  request.current_soc_wh ? std::to_string(*request.current_soc_wh).c_str() : "n/a",
                  request.forecast.steps());
        publisher_.mark_degraded(e.what());
        report.message = e.what();
    }

    report.outcome = CycleOutcome::Failed;
    return report;
}

} // namespace app

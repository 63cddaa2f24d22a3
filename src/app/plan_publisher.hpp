// src/app/plan_publisher.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "control/control_mode.hpp"
#include "optim/schedule.hpp"
#include "optim/shadow_price.hpp"

namespace app {

enum class PlanStatus {
    Ok,
    Degraded   // last cycle hit an invariant violation; previous plan still served
};

const char* to_string(PlanStatus s);

/**
 * Immutable result of one planning cycle.
 */
struct PublishedPlan {
    std::uint64_t sequence = 0;
    double created_at_s = 0.0;          // controller clock at publication
    optim::Schedule schedule;
    optim::ShadowPrice shadow;
    optim::Diagnostics diagnostics;
    control::EffectiveMode effective = control::EffectiveMode::Idle;
    int oscillations_removed = 0;

    /**
     * Index of the step covering now_s, or -1 past the end of the plan.
     */
    int step_index_at(double now_s) const;

    /**
     * Planned power at now_s; 0 outside the plan.
     */
    double scheduled_power_at(double now_s) const;
};

/**
 * PlanPublisher - single-slot mailbox between the planning loop and the
 * tactical loop. publish() swaps the pointer, snapshot() copies it; a plan
 * is never observed half-written.
 */
class PlanPublisher {
public:
    void publish(std::shared_ptr<PublishedPlan> plan);

    void mark_degraded(const std::string& reason);

    std::shared_ptr<const PublishedPlan> snapshot() const;

    PlanStatus status() const;
    std::string last_error() const;
    std::uint64_t published_count() const;

private:
    mutable std::mutex mu_;
    std::shared_ptr<const PublishedPlan> current_;
    PlanStatus status_ = PlanStatus::Ok;
    std::string last_error_;
    std::uint64_t published_ = 0;
};

} // namespace app

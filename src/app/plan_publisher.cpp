// src/app/plan_publisher.cpp
#include "app/plan_publisher.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <utility>

namespace app {

const char* to_string(PlanStatus s) {
    switch (s) {
    case PlanStatus::Ok:
        return "ok";
    case PlanStatus::Degraded:
        return "degraded";
    }
    return "degraded";
}

int PublishedPlan::step_index_at(double now_s) const {
    if (schedule.empty()) {
        return -1;
    }
    if (now_s < created_at_s) {
        return 0;
    }
    const double step_s = schedule.step_hours * 3600.0;
    const auto idx = static_cast<std::size_t>(std::floor((now_s - created_at_s) / step_s));
    if (idx >= schedule.size()) {
        return -1;
    }
    return static_cast<int>(idx);
}

double PublishedPlan::scheduled_power_at(double now_s) const {
    const int idx = step_index_at(now_s);
    if (idx < 0) {
        return 0.0;
    }
    return schedule.steps[static_cast<std::size_t>(idx)].power_w;
}

void PlanPublisher::publish(std::shared_ptr<PublishedPlan> plan) {
    std::lock_guard<std::mutex> lock(mu_);
    plan->sequence = ++published_;
    current_ = std::move(plan);
    status_ = PlanStatus::Ok;
    last_error_.clear();
}

void PlanPublisher::mark_degraded(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mu_);
    status_ = PlanStatus::Degraded;
    last_error_ = reason;
    LOG_WARN("[Publisher] Status degraded: %s (serving plan #%llu)", reason.c_str(),
             static_cast<unsigned long long>(current_ ? current_->sequence : 0));
}

std::shared_ptr<const PublishedPlan> PlanPublisher::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_;
}

PlanStatus PlanPublisher::status() const {
    std::lock_guard<std::mutex> lock(mu_);
    return status_;
}

std::string PlanPublisher::last_error() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_error_;
}

std::uint64_t PlanPublisher::published_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return published_;
}

} // namespace app

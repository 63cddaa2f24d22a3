// src/control/mode_resolver.hpp
#pragma once

#include "control/control_mode.hpp"
#include "optim/schedule.hpp"

namespace control {

/**
 * Current-step prices used by the hybrid policy.
 */
struct StepPrices {
    double buy = 0.0;
    double feed_in = 0.0;
};

/**
 * ModeResolver - turns the user's control mode plus the first planned step
 * into the effective mode, and the effective mode into balancer behaviour.
 *
 * Hybrid keeps the schedule for arbitrage and uses zero-grid for
 * self-consumption:
 *   idle         -> Idle if a later discharge is planned and the grid is
 *                   importing, else ZeroGrid
 *   discharging  -> Discharging if buy > 0 and feed-in >= buy, else ZeroGrid
 *   charging     -> while exporting: Charging if feed-in < 0, else ZeroGrid
 */
class ModeResolver {
public:
    static EffectiveMode resolve_effective(ControlMode mode,
                                           const optim::Schedule& schedule,
                                           const StepPrices& prices,
                                           double current_grid_w);

    /**
     * Effective mode before any plan exists, or after the last one ran out.
     * Hybrid falls back to self-consumption, FollowSchedule to idle.
     */
    static EffectiveMode without_plan(ControlMode mode);

    static BalancerMode balancer_mode(EffectiveMode effective,
                                      double current_grid_w,
                                      bool has_grid_telemetry);

private:
    static EffectiveMode from_step(optim::StepMode m);
};

} // namespace control

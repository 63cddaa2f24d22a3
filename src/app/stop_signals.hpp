// src/app/stop_signals.hpp
#pragma once

#include <csignal>

namespace app {

/**
 * StopSignals - routes SIGINT/SIGTERM to target.request_stop() for the
 * lifetime of the object. The destructor restores the default handlers
 * before dropping the target, on normal return and during unwinding alike.
 *
 * One binding per target type at a time.
 */
template <typename Target>
class StopSignals {
public:
    explicit StopSignals(Target& target) {
        target_ = &target;
        std::signal(SIGINT, &StopSignals::handle);
        std::signal(SIGTERM, &StopSignals::handle);
    }

    ~StopSignals() {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        target_ = nullptr;
    }

    StopSignals(const StopSignals&) = delete;
    StopSignals& operator=(const StopSignals&) = delete;

    static bool bound() { return target_ != nullptr; }

private:
    static void handle(int) {
        if (target_) {
            target_->request_stop();
        }
    }

    static inline Target* target_ = nullptr;
};

} // namespace app

#include "core/timeline.hpp"

#include <cmath>
#include <stdexcept>

namespace core {

Timeline::Timeline(double speed_multiplier, const util::SteadyClock& clock)
    : speed_(speed_multiplier), clock_(clock) {
    if (!std::isfinite(speed_multiplier) || speed_multiplier <= 0.0) {
        throw std::invalid_argument("Timeline speed_multiplier must be > 0");
    }
}

void Timeline::start_cycle(LogTime event_ts) noexcept {
    state_.cycle_pending = false;
    if (state_.cycles_started == 0) {
        state_.log_origin = event_ts;
    } else {
        if (!state_.log_duration) {
            // First wrap: the previous pass ran from log_origin to last_event.
            state_.log_duration = *state_.last_event - *state_.log_origin;
        }
        *state_.log_origin -= *state_.log_duration;
    }
    ++state_.cycles_started;
}

std::chrono::duration<double> Timeline::next_sleep(LogTime event_ts) noexcept {
    const auto now = clock_.now();
    if (!state_.replay_start) {
        state_.replay_start = now;
    }
    if (state_.cycle_pending) {
        start_cycle(event_ts);
    }
    state_.last_event = event_ts;

    const double log_time_elapsed = util::to_seconds(event_ts - *state_.log_origin);
    const double real_time_elapsed = util::to_seconds(now - *state_.replay_start) * speed_;
    const double scaled_time_remaining = log_time_elapsed - real_time_elapsed;
    return std::chrono::duration<double>(scaled_time_remaining / speed_);
}

} // namespace core

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "core/request_event.hpp"
#include "util/clock.hpp"

namespace core {

// Mutable pacing state. Kept as a plain struct so the wraparound handling can
// be inspected directly.
struct TimelineState {
    // Log instant that maps to replay_start. Moves backwards by log_duration
    // at every cycle boundary after the first.
    std::optional<LogTime> log_origin{};
    std::optional<util::SteadyClock::time_point> replay_start{};
    // Length of one pass through the capture; known once the second cycle starts.
    std::optional<LogTime::duration> log_duration{};
    std::optional<LogTime> last_event{};
    std::uint64_t cycles_started{0};
    bool cycle_pending{true};
};

// Maps log-relative timestamps onto real sleep intervals under a speed
// multiplier, keeping log time continuous when the source wraps around.
// Timestamps must be non-decreasing within a cycle; this is not checked.
class Timeline {
public:
    // Throws std::invalid_argument unless speed_multiplier is finite and > 0.
    explicit Timeline(double speed_multiplier,
                      const util::SteadyClock& clock = util::default_steady_clock());

    // Marks the source as rewound; the next event starts a new cycle.
    void begin_cycle() noexcept { state_.cycle_pending = true; }

    // Seconds to wait before the event is due. Negative when the replay is
    // behind schedule; callers clamp before sleeping.
    [[nodiscard]] std::chrono::duration<double> next_sleep(LogTime event_ts) noexcept;

    [[nodiscard]] const TimelineState& state() const noexcept { return state_; }
    [[nodiscard]] double speed_multiplier() const noexcept { return speed_; }

private:
    void start_cycle(LogTime event_ts) noexcept;

    double speed_;
    const util::SteadyClock& clock_;
    TimelineState state_{};
};

} // namespace core

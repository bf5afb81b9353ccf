#pragma once

#include <chrono>

namespace util {

// Thin clock abstraction so replay pacing can be driven deterministically in tests.
class SteadyClock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~SteadyClock() = default;
    virtual time_point now() const noexcept { return std::chrono::steady_clock::now(); }
};

// Process-wide real clock; callers that do not inject one use this.
inline const SteadyClock& default_steady_clock() noexcept {
    static const SteadyClock clock;
    return clock;
}

// Converts any chrono duration to fractional seconds.
template <typename Rep, typename Period>
[[nodiscard]] constexpr double to_seconds(std::chrono::duration<Rep, Period> d) noexcept {
    return std::chrono::duration_cast<std::chrono::duration<double>>(d).count();
}

// from + seconds, saturating at time_point::max() where the integer
// duration would overflow. Negative seconds yield from.
[[nodiscard]] inline std::chrono::steady_clock::time_point deadline_after(std::chrono::steady_clock::time_point from,
                                                                          double seconds) noexcept {
    using time_point = std::chrono::steady_clock::time_point;
    if (!(seconds > 0.0)) {
        return from;
    }
    // One second of slack absorbs the rounding of the double conversion.
    const double headroom_s = to_seconds(time_point::max() - from) - 1.0;
    if (seconds >= headroom_s) {
        return time_point::max();
    }
    return from + std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace util

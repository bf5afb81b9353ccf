#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace core {

struct RunStats {
    std::chrono::duration<double> elapsed{0.0};
    std::uint64_t sent_count{0};
    double average_requests_per_second{0.0};
    // Units still in flight when the budget expired; each was cancelled.
    std::size_t outstanding_count{0};
    double seconds_behind{0.0};
    // Not clamped to [0, 1]: values above 1 flag a badly overloaded target.
    double percentage_behind{0.0};
    std::uint64_t cycles{0};
};

// Folds the raw counters of a finished run into RunStats.
// last_sleep_seconds is the last (unclamped) pacing sleep the Timeline produced.
[[nodiscard]] RunStats assemble_run_stats(std::chrono::duration<double> elapsed,
                                          std::uint64_t sent_count,
                                          std::size_t outstanding_count,
                                          double last_sleep_seconds,
                                          std::uint64_t cycles) noexcept;

// Report layout printed under "run_information".
[[nodiscard]] nlohmann::json to_json(const RunStats& stats);

} // namespace core

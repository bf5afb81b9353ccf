#include "core/run_stats.hpp"

#include <algorithm>

namespace core {

RunStats assemble_run_stats(std::chrono::duration<double> elapsed,
                            std::uint64_t sent_count,
                            std::size_t outstanding_count,
                            double last_sleep_seconds,
                            std::uint64_t cycles) noexcept {
    RunStats stats{};
    stats.elapsed = elapsed;
    stats.sent_count = sent_count;
    stats.outstanding_count = outstanding_count;
    stats.cycles = cycles;
    stats.seconds_behind = std::max(-last_sleep_seconds, 0.0);

    const double elapsed_s = elapsed.count();
    if (elapsed_s > 0.0) {
        stats.average_requests_per_second = static_cast<double>(sent_count) / elapsed_s;
        stats.percentage_behind = stats.seconds_behind / elapsed_s;
    }
    return stats;
}

nlohmann::json to_json(const RunStats& stats) {
    return nlohmann::json{
        {"run_time_minutes", stats.elapsed.count() / 60.0},
        {"num_sent_requests", stats.sent_count},
        {"average_requests_per_second", stats.average_requests_per_second},
        {"num_outstanding_requests", stats.outstanding_count},
        {"seconds_behind", stats.seconds_behind},
        {"percentage_behind", stats.percentage_behind},
        {"num_cycles", stats.cycles},
    };
}

} // namespace core

#pragma once

#include <cstdint>
#include <map>
#include <optional>

#include "sink/response_sink.hpp"

namespace sink {

// Status histogram plus the mean server-side "took" of successful searches.
class SearchResponseAccumulator final : public ResponseSink {
public:
    static constexpr int success_status = 200;

    void process(const core::Response& response) override;

    // {"completion_status_counts": {"<status>": n, ...},
    //  "average_time_per_successful_request": <mean took> | null}
    nlohmann::json summary() const override;

    // nullopt when no successful response reported a latency.
    [[nodiscard]] std::optional<double> average_success_latency() const noexcept;

    const std::map<int, std::uint64_t>& status_histogram() const noexcept { return status_histogram_; }
    double total_latency() const noexcept { return total_latency_; }
    std::uint64_t latency_samples() const noexcept { return latency_samples_; }
    std::uint64_t missing_latency() const noexcept { return missing_latency_; }

private:
    std::map<int, std::uint64_t> status_histogram_;
    double total_latency_{0.0};
    std::uint64_t latency_samples_{0};
    std::uint64_t missing_latency_{0};
};

} // namespace sink

#include "sink/search_response_accumulator.hpp"

#include <string>

#include "util/log.hpp"

namespace sink {

void SearchResponseAccumulator::process(const core::Response& response) {
    ++status_histogram_[response.status];
    if (response.status != success_status) {
        return;
    }
    if (response.body.is_object()) {
        const auto it = response.body.find("took");
        if (it != response.body.end() && it->is_number()) {
            total_latency_ += it->get<double>();
            ++latency_samples_;
            return;
        }
    }
    ++missing_latency_;
    LOG_SLOW_DEBUG("successful response without numeric 'took'; excluded from latency average");
}

std::optional<double> SearchResponseAccumulator::average_success_latency() const noexcept {
    if (latency_samples_ == 0) {
        return std::nullopt;
    }
    return total_latency_ / static_cast<double>(latency_samples_);
}

nlohmann::json SearchResponseAccumulator::summary() const {
    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [status, count] : status_histogram_) {
        counts[std::to_string(status)] = count;
    }
    nlohmann::json out{{"completion_status_counts", std::move(counts)}};
    if (const auto avg = average_success_latency()) {
        out["average_time_per_successful_request"] = *avg;
    } else {
        out["average_time_per_successful_request"] = nullptr;
    }
    return out;
}

} // namespace sink
